#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include "cryptophage/error.hpp"
#include "cryptophage/stream.hpp"

#include <chrono>    // for milliseconds
#include <expected>  // for expected
#include <string>    // for string

namespace cryptophage {

/// Timeout value meaning "wait until the process exits".
inline constexpr auto WAIT_FOREVER = std::chrono::milliseconds::max();

/// One request to run an executable.
struct Invocation {
    std::string executable;
    std::string arguments;
    /// Fed into the process's standard input; null keeps the host's stdin.
    io::Stream* input{};
    /// Receives the process's standard output; null keeps the host's stdout.
    io::Stream* output{};
    std::chrono::milliseconds timeout{WAIT_FOREVER};
    /// Also receives the process's standard error, which is captured either way.
    io::Stream* error_output{};
};

// Non-interactive command-line process.
class SubProcess final {
 public:
    SubProcess(std::string executable, std::string arguments) noexcept;

    /// @brief Spawn the process and wait for it to finish.
    ///
    /// Standard input is fed from @p input and standard output drained into @p output
    /// while standard error is captured, all concurrently with a timeout watcher.
    /// The call returns only once all of them have finished.
    /// @param input Stream to feed into standard input, or null.
    /// @param output Stream receiving standard output, or null.
    /// @param timeout How long to wait before the process group is killed. Timeouts beyond
    /// the range of the steady clock wait forever.
    /// @return The single failure, an Aggregate error for several concurrent failures,
    /// a SubprocessFailure when the exit status is non-zero and standard error is not blank.
    auto run(io::Stream* input = nullptr, io::Stream* output = nullptr, std::chrono::milliseconds timeout = WAIT_FOREVER) const noexcept -> std::expected<void, Error>;

    /// @brief Same as run(), copying standard error into @p error_output as well.
    ///
    /// A failure of @p error_output is a failure of the error capture.
    auto run(io::Stream* input, io::Stream* output, io::Stream* error_output, std::chrono::milliseconds timeout) const noexcept -> std::expected<void, Error>;

    [[nodiscard]] auto executable() const noexcept -> const std::string& { return m_executable; }
    [[nodiscard]] auto arguments() const noexcept -> const std::string& { return m_arguments; }

 private:
    std::string m_executable;
    std::string m_arguments;
};

/// @brief Run the invocation, see SubProcess::run.
auto run_process(const Invocation& invocation) noexcept -> std::expected<void, Error>;

/// @brief Decide the outcome of a process which exited without concurrent failures.
///
/// Only a non-zero exit status together with non-blank error text is a failure.
/// ASCII and Unicode whitespace in UTF-8 both count as blank.
/// A non-zero exit status with blank error text counts as success.
auto evaluate_exit_status(int exit_status, std::string error_text) noexcept -> std::expected<void, Error>;

}  // namespace cryptophage

#endif  // SUBPROCESS_HPP
