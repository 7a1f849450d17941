#include "cryptophage/gpg_key.hpp"

#include <array>         // for array
#include <charconv>      // for from_chars
#include <system_error>  // for errc
#include <utility>       // for pair

using namespace std::string_view_literals;

namespace {

using cryptophage::gpg::GpgKeyCapabilities;
using cryptophage::gpg::GpgRecordType;

constexpr std::array<std::pair<std::string_view, GpgRecordType>, 16> RECORD_TYPES{{
    {"pub"sv, GpgRecordType::PublicKey},
    {"crt"sv, GpgRecordType::X509Certificate},
    {"crs"sv, GpgRecordType::X509CertificatePrivateKey},
    {"sub"sv, GpgRecordType::PublicSubKey},
    {"sec"sv, GpgRecordType::SecretKey},
    {"ssb"sv, GpgRecordType::SecretSubKey},
    {"uid"sv, GpgRecordType::UserId},
    {"uat"sv, GpgRecordType::UserAttribute},
    {"sig"sv, GpgRecordType::Signature},
    {"rev"sv, GpgRecordType::RevocationCertificate},
    {"fpr"sv, GpgRecordType::Fingerprint},
    {"pkd"sv, GpgRecordType::PublicKeyData},
    {"grp"sv, GpgRecordType::KeyGrip},
    {"rvk"sv, GpgRecordType::RevocationKey},
    {"tru"sv, GpgRecordType::TrustRecord},
    {"spk"sv, GpgRecordType::SignatureSubpacket},
}};

constexpr std::array<std::pair<char, GpgKeyCapabilities>, 5> CAPABILITY_LETTERS{{
    {'e', GpgKeyCapabilities::Encryption},
    {'s', GpgKeyCapabilities::Signing},
    {'c', GpgKeyCapabilities::Certification},
    {'a', GpgKeyCapabilities::Authentication},
    {'D', GpgKeyCapabilities::Disabled},
}};

}  // namespace

namespace cryptophage::gpg {

auto record_type_from_string(std::string_view record_type) noexcept -> GpgRecordType {
    for (auto&& [name, type] : RECORD_TYPES) {
        if (name == record_type) {
            return type;
        }
    }
    return GpgRecordType::Unknown;
}

auto validity_from_string(std::string_view validity) noexcept -> GpgValidity {
    if (validity == "o"sv) {
        return GpgValidity::New;
    } else if (validity == "i"sv) {
        return GpgValidity::Invalid;
    } else if (validity == "d"sv) {
        return GpgValidity::Disabled;
    } else if (validity == "r"sv) {
        return GpgValidity::Revoked;
    } else if (validity == "e"sv) {
        return GpgValidity::Expired;
    } else if (validity == "n"sv) {
        return GpgValidity::Valid;
    } else if (validity == "m"sv) {
        return GpgValidity::MarginallyValid;
    } else if (validity == "f"sv) {
        return GpgValidity::FullyValid;
    } else if (validity == "u"sv) {
        return GpgValidity::UltimatelyValid;
    }
    return GpgValidity::Unknown;
}

auto algorithm_from_string(std::string_view algorithm) noexcept -> GpgAlgorithm {
    std::int32_t value{};
    if (auto [ptr, ec] = std::from_chars(algorithm.data(), algorithm.data() + algorithm.size(), value); ec != std::errc{}) {
        return GpgAlgorithm::Unknown;
    }

    switch (value) {
    case 1:
        return GpgAlgorithm::Rsa;
    case 16:
        return GpgAlgorithm::ElGamal;
    case 17:
        return GpgAlgorithm::Dsa;
    case 20:
        return GpgAlgorithm::ElgamalSignAndEncrypt;
    default:
        return GpgAlgorithm::Unknown;
    }
}

auto capabilities_from_string(std::string_view capabilities) noexcept -> GpgKeyCapabilities {
    auto value = GpgKeyCapabilities::None;
    for (auto&& [letter, flag] : CAPABILITY_LETTERS) {
        if (capabilities.contains(letter)) {
            value |= flag;
        }
    }
    return value;
}

}  // namespace cryptophage::gpg
