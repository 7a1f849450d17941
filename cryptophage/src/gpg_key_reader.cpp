#include "cryptophage/gpg_key_reader.hpp"

#include <algorithm>     // for all_of
#include <array>         // for array
#include <cctype>        // for isspace
#include <charconv>      // for from_chars
#include <cstdint>       // for int32_t, int64_t
#include <string>        // for string
#include <system_error>  // for errc
#include <utility>       // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 4096;

auto is_blank(std::string_view line) noexcept -> bool {
    return std::ranges::all_of(line, [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; });
}

template <typename T>
auto parse_number(std::string_view value) noexcept -> T {
    T result{};
    if (auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result); ec != std::errc{}) {
        return T{};
    }
    return result;
}

// parses exactly `count` digits starting at `offset`
auto parse_digits(std::string_view value, std::size_t offset, std::size_t count, int& result) noexcept -> bool {
    if (offset + count > value.size()) {
        return false;
    }
    const auto* first = value.data() + offset;
    auto [ptr, ec]    = std::from_chars(first, first + count, result);
    return ec == std::errc{} && ptr == first + count;
}

auto parse_iso_date(std::string_view value) noexcept -> std::chrono::sys_seconds {
    // YYYYMMDDTHHMMSS
    int year{}, month{}, day{}, hours{}, minutes{}, seconds{};
    if (value.size() < 15 || value[8] != 'T'
        || !parse_digits(value, 0, 4, year) || !parse_digits(value, 4, 2, month) || !parse_digits(value, 6, 2, day)
        || !parse_digits(value, 9, 2, hours) || !parse_digits(value, 11, 2, minutes) || !parse_digits(value, 13, 2, seconds)) {
        return std::chrono::sys_seconds{};
    }

    const auto date = std::chrono::year_month_day{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)}, std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok() || hours > 23 || minutes > 59 || seconds > 59) {
        return std::chrono::sys_seconds{};
    }
    return std::chrono::sys_days{date} + std::chrono::hours{hours} + std::chrono::minutes{minutes} + std::chrono::seconds{seconds};
}

}  // namespace

namespace cryptophage::gpg {

auto parse_key_date(std::string_view value) noexcept -> std::chrono::sys_seconds {
    if (value.contains('T')) {
        return parse_iso_date(value);
    }
    return std::chrono::sys_seconds{std::chrono::seconds{parse_number<std::int64_t>(value)}};
}

GpgKeyReader::GpgKeyReader(io::Stream& stream) noexcept
  : m_stream(&stream) { }

auto GpgKeyReader::read_all_keys() noexcept -> std::expected<std::vector<GpgKey>, Error> {
    std::string listing{};
    std::array<char, READ_CHUNK_SIZE> buffer{};
    while (true) {
        auto bytes_read = m_stream->read(buffer);
        if (!bytes_read) {
            spdlog::error("[key_reader] failed to read key listing: {}", bytes_read.error().message);
            return std::unexpected(std::move(bytes_read.error()));
        }
        if (*bytes_read == 0) {
            break;
        }
        listing.append(buffer.data(), *bytes_read);
    }
    return parse_keys(listing);
}

auto GpgKeyReader::parse_keys(std::string_view listing) noexcept -> std::vector<GpgKey> {
    std::vector<GpgKey> keys{};
    for (auto&& rng : listing | ranges::views::split('\n')) {
        auto line = rng | ranges::to<std::string>();
        if (line.ends_with('\r')) {
            line.pop_back();
        }
        if (is_blank(line)) {
            continue;
        }
        keys.emplace_back(parse_key(line));
    }
    return keys;
}

auto GpgKeyReader::parse_key(std::string_view line) noexcept -> GpgKey {
    const auto& fields = line | ranges::views::split(':')
        | ranges::views::transform([](auto&& rng) { return rng | ranges::to<std::string>(); })
        | ranges::to<std::vector<std::string>>();

    const auto field = [&fields](std::size_t index) -> std::string_view {
        return index < fields.size() ? std::string_view{fields[index]} : std::string_view{};
    };

    return GpgKey{
        .record_type      = record_type_from_string(field(0)),
        .validity         = validity_from_string(field(1)),
        .key_length       = parse_number<std::int32_t>(field(2)),
        .algorithm        = algorithm_from_string(field(3)),
        .key_id           = std::string{field(4)},
        .creation_date    = parse_key_date(field(5)),
        .expiration_date  = parse_key_date(field(6)),
        .hash             = std::string{field(7)},
        .owner_trust      = std::string{field(8)},
        .user_id          = std::string{field(9)},
        .signature_class  = std::string{field(10)},
        .key_capabilities = capabilities_from_string(field(11)),
        .fingerprint      = std::string{field(12)},
        .flag             = std::string{field(13)},
        .serial_number    = std::string{field(14)},
    };
}

}  // namespace cryptophage::gpg
