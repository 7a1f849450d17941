#ifndef GPG_KEY_HPP
#define GPG_KEY_HPP

#include <chrono>       // for sys_seconds
#include <cstdint>      // for uint8_t, int32_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace cryptophage::gpg {

/// Type of a record in a key listing, field 1.
enum class GpgRecordType : std::uint8_t {
    Unknown,
    PublicKey,                  ///< pub
    X509Certificate,            ///< crt
    X509CertificatePrivateKey,  ///< crs
    PublicSubKey,               ///< sub
    SecretKey,                  ///< sec
    SecretSubKey,               ///< ssb
    UserId,                     ///< uid
    UserAttribute,              ///< uat
    Signature,                  ///< sig
    RevocationCertificate,      ///< rev
    Fingerprint,                ///< fpr
    PublicKeyData,              ///< pkd
    KeyGrip,                    ///< grp
    RevocationKey,              ///< rvk
    TrustRecord,                ///< tru
    SignatureSubpacket,         ///< spk
};

/// Calculated validity of a key, field 2.
enum class GpgValidity : std::uint8_t {
    Unknown,
    Invalid,          ///< i
    Disabled,         ///< d
    Revoked,          ///< r
    Expired,          ///< e
    Valid,            ///< n
    MarginallyValid,  ///< m
    FullyValid,       ///< f
    UltimatelyValid,  ///< u
    New,              ///< o
};

/// Public key algorithm, field 4.
enum class GpgAlgorithm : std::uint8_t {
    Unknown,
    Rsa,                    ///< 1
    ElGamal,                ///< 16, encryption only
    Dsa,                    ///< 17
    ElgamalSignAndEncrypt,  ///< 20
};

/// Key capabilities, field 12. Bit flags.
enum class GpgKeyCapabilities : std::uint8_t {
    None           = 0,
    Encryption     = 0x01,  ///< e
    Signing        = 0x02,  ///< s
    Certification  = 0x04,  ///< c
    Authentication = 0x08,  ///< a
    Disabled       = 0x10,  ///< D
};

constexpr auto operator|(GpgKeyCapabilities lhs, GpgKeyCapabilities rhs) noexcept -> GpgKeyCapabilities {
    return static_cast<GpgKeyCapabilities>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

constexpr auto operator&(GpgKeyCapabilities lhs, GpgKeyCapabilities rhs) noexcept -> GpgKeyCapabilities {
    return static_cast<GpgKeyCapabilities>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
}

constexpr auto operator|=(GpgKeyCapabilities& lhs, GpgKeyCapabilities rhs) noexcept -> GpgKeyCapabilities& {
    lhs = lhs | rhs;
    return lhs;
}

/// @brief Check whether all flags of @p flag are set in @p capabilities.
constexpr auto has_capability(GpgKeyCapabilities capabilities, GpgKeyCapabilities flag) noexcept -> bool {
    return (capabilities & flag) == flag;
}

// One record of a `gpg --with-colons` key listing
struct GpgKey final {
    GpgRecordType record_type{GpgRecordType::Unknown};
    GpgValidity validity{GpgValidity::Unknown};
    /// Key length in bits, if applicable.
    std::int32_t key_length{};
    GpgAlgorithm algorithm{GpgAlgorithm::Unknown};
    std::string key_id{};
    std::chrono::sys_seconds creation_date{};
    std::chrono::sys_seconds expiration_date{};
    /// Serial number for crt records, a hash of the user id for uid/uat records.
    std::string hash{};
    std::string owner_trust{};
    std::string user_id{};
    /// Two hex digits followed by 'x' (exportable) or 'l' (local-only).
    std::string signature_class{};
    GpgKeyCapabilities key_capabilities{GpgKeyCapabilities::None};
    /// Fingerprint of the issuer certificate in fpr records of S/MIME keys.
    std::string fingerprint{};
    std::string flag{};
    /// Token serial number, or '#' for a stub key.
    std::string serial_number{};

    auto operator==(const GpgKey&) const -> bool = default;
};

[[nodiscard]] auto record_type_from_string(std::string_view record_type) noexcept -> GpgRecordType;
[[nodiscard]] auto validity_from_string(std::string_view validity) noexcept -> GpgValidity;
[[nodiscard]] auto algorithm_from_string(std::string_view algorithm) noexcept -> GpgAlgorithm;
[[nodiscard]] auto capabilities_from_string(std::string_view capabilities) noexcept -> GpgKeyCapabilities;

}  // namespace cryptophage::gpg

#endif  // GPG_KEY_HPP
