#ifndef ERROR_HPP
#define ERROR_HPP

#include <chrono>       // for milliseconds
#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cryptophage {

enum class ErrorKind : std::uint8_t {
    UnsupportedStream,
    SubprocessFailure,
    Timeout,
    Aggregate,
    DoubleCompletion,
    MismatchedHandle,
    Io,
    Spawn,
    ExecutableNotFound,
    InvalidConfig,
};

/// Converts ErrorKind to string.
[[nodiscard]] auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view;

struct Error final {
    ErrorKind kind{ErrorKind::Io};
    std::string message{};

    /// Underlying failures of an Aggregate error.
    std::vector<Error> inner_errors{};

    /// Set for Timeout errors.
    std::chrono::milliseconds timeout{};
    std::string executable{};

    auto operator==(const Error&) const -> bool = default;

    /// @brief Render the error including inner errors.
    [[nodiscard]] auto to_string() const noexcept -> std::string;
};

[[nodiscard]] auto make_error(ErrorKind kind, std::string message) noexcept -> Error;

/// @brief Error for a non-zero exit status paired with error text.
/// @param error_text Captured standard error of the process, kept verbatim.
[[nodiscard]] auto make_subprocess_failure(std::string error_text) noexcept -> Error;

[[nodiscard]] auto make_timeout_error(std::chrono::milliseconds timeout, std::string_view executable) noexcept -> Error;

/// @brief Error built from an errno value.
/// @param context What was being attempted, e.g. "pipe".
/// @param errnum The errno value.
/// @param kind Kind of the resulting error.
[[nodiscard]] auto make_errno_error(std::string_view context, int errnum, ErrorKind kind = ErrorKind::Io) noexcept -> Error;

/// @brief Combine concurrently raised failures into a single outcome.
///
/// Aggregates found among @p errors are flattened into their inner errors.
/// @return std::nullopt when @p errors is empty, the error itself when exactly one
/// failure remains after flattening, an Aggregate error otherwise.
[[nodiscard]] auto aggregate_errors(std::vector<Error> errors) noexcept -> std::optional<Error>;

}  // namespace cryptophage

#endif  // ERROR_HPP
