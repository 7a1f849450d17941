#ifndef STREAM_PUMP_HPP
#define STREAM_PUMP_HPP

#include "cryptophage/error.hpp"
#include "cryptophage/stream.hpp"

#include <cstddef>   // for size_t
#include <expected>  // for expected

namespace cryptophage::io {

inline constexpr std::size_t PUMP_INITIAL_BUFFER_SIZE = 256;
inline constexpr std::size_t PUMP_MAX_BUFFER_SIZE     = 65536;

/// @brief Copy all remaining bytes from source into destination.
///
/// The buffer starts at PUMP_INITIAL_BUFFER_SIZE bytes and grows four times over
/// whenever a read fills it, until it reaches PUMP_MAX_BUFFER_SIZE.
/// Nothing is copied when either stream is null.
/// @param source The stream to drain.
/// @param destination The stream receiving the bytes.
/// @return UnsupportedStream error if source cannot read or destination cannot write,
/// the first read/write error otherwise.
auto copy_dynamic(Stream* source, Stream* destination) noexcept -> std::expected<void, Error>;

/// @brief Fails with UnsupportedStream unless stream is null or readable.
auto ensure_readable(const Stream* stream) noexcept -> std::expected<void, Error>;

/// @brief Fails with UnsupportedStream unless stream is null or writable.
auto ensure_writable(const Stream* stream) noexcept -> std::expected<void, Error>;

}  // namespace cryptophage::io

#endif  // STREAM_PUMP_HPP
