#ifndef GPG_KEY_READER_HPP
#define GPG_KEY_READER_HPP

#include "cryptophage/error.hpp"
#include "cryptophage/gpg_key.hpp"
#include "cryptophage/stream.hpp"

#include <chrono>       // for sys_seconds
#include <expected>     // for expected
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cryptophage::gpg {

// Parses keys from the output of a `--with-colons` key listing.
class GpgKeyReader final {
 public:
    explicit GpgKeyReader(io::Stream& stream) noexcept;

    /// @brief Parse all keys from the current position of the stream to its end.
    /// @return The keys, or the read error of the stream.
    auto read_all_keys() noexcept -> std::expected<std::vector<GpgKey>, Error>;

    /// @brief Parse every non-blank line of a key listing.
    [[nodiscard]] static auto parse_keys(std::string_view listing) noexcept -> std::vector<GpgKey>;

    /// @brief Parse a single colon separated record. Missing fields keep their defaults.
    [[nodiscard]] static auto parse_key(std::string_view line) noexcept -> GpgKey;

 private:
    io::Stream* m_stream{};
};

/// @brief Parse a listing timestamp.
/// @param value Seconds since epoch, or ISO 8601 basic format (YYYYMMDDTHHMMSS).
/// @return The point in time, the epoch if @p value cannot be parsed.
[[nodiscard]] auto parse_key_date(std::string_view value) noexcept -> std::chrono::sys_seconds;

}  // namespace cryptophage::gpg

#endif  // GPG_KEY_READER_HPP
