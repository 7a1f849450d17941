#include "cryptophage/subprocess.hpp"
#include "cryptophage/argument_line.hpp"
#include "cryptophage/io_utils.hpp"
#include "cryptophage/stream_pump.hpp"

#include <fcntl.h>     // for O_CLOEXEC
#include <spawn.h>     // for posix_spawnp, posix_spawn_file_actions_t
#include <sys/wait.h>  // for waitpid, WIFEXITED, WIFSIGNALED
#include <unistd.h>    // for pipe2, STDIN_FILENO

#include <cerrno>   // for errno, EINTR
#include <csignal>  // for kill, SIGKILL
#include <cstring>  // for strerror

#include <array>        // for array
#include <filesystem>   // for path
#include <optional>     // for optional
#include <span>         // for span
#include <thread>       // for jthread, sleep_for
#include <utility>      // for move
#include <vector>       // for vector

using namespace std::string_view_literals;

#include <fmt/compile.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace {

using cryptophage::Error;
using cryptophage::ErrorKind;
using cryptophage::io::FileDescriptorStream;

struct Pipe {
    FileDescriptorStream read_end;
    FileDescriptorStream write_end;
};

auto make_pipe() noexcept -> std::expected<Pipe, Error> {
    int fds[2]{-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(cryptophage::make_errno_error("pipe", errno));
    }
    return Pipe{
        .read_end  = FileDescriptorStream{fds[0], FileDescriptorStream::Mode::Read},
        .write_end = FileDescriptorStream{fds[1], FileDescriptorStream::Mode::Write},
    };
}

// Owns posix_spawn file actions and attributes.
class SpawnConfig final {
 public:
    SpawnConfig() noexcept {
        m_actions_valid = posix_spawn_file_actions_init(&m_actions) == 0;
        m_attr_valid    = posix_spawnattr_init(&m_attr) == 0;
    }
    ~SpawnConfig() {
        if (m_actions_valid) {
            posix_spawn_file_actions_destroy(&m_actions);
        }
        if (m_attr_valid) {
            posix_spawnattr_destroy(&m_attr);
        }
    }

    SpawnConfig(const SpawnConfig&)     = delete;
    auto operator=(const SpawnConfig&) = delete;

    auto init() noexcept -> std::expected<void, Error> {
        if (!m_actions_valid || !m_attr_valid) {
            return std::unexpected(cryptophage::make_error(ErrorKind::Spawn, "failed to initialize spawn attributes"));
        }

        // Own process group, so the whole tree can be killed on timeout.
        // The child starts with default SIGPIPE and nothing blocked.
        sigset_t empty_mask{};
        sigemptyset(&empty_mask);
        sigset_t default_signals{};
        sigemptyset(&default_signals);
        sigaddset(&default_signals, SIGPIPE);

        const short flags = POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF;
        if (int err = posix_spawnattr_setflags(&m_attr, flags); err != 0) {
            return std::unexpected(cryptophage::make_errno_error("posix_spawnattr_setflags", err, ErrorKind::Spawn));
        }
        if (posix_spawnattr_setpgroup(&m_attr, 0) != 0
            || posix_spawnattr_setsigmask(&m_attr, &empty_mask) != 0
            || posix_spawnattr_setsigdefault(&m_attr, &default_signals) != 0) {
            return std::unexpected(cryptophage::make_error(ErrorKind::Spawn, "failed to set spawn attributes"));
        }
        return {};
    }

    auto redirect(const FileDescriptorStream& child_end, int target_fd) noexcept -> std::expected<void, Error> {
        if (int err = posix_spawn_file_actions_adddup2(&m_actions, child_end.fd(), target_fd); err != 0) {
            return std::unexpected(cryptophage::make_errno_error("posix_spawn_file_actions_adddup2", err, ErrorKind::Spawn));
        }
        return {};
    }

    auto spawn(const std::string& executable, const std::vector<std::string>& args) noexcept -> std::expected<pid_t, Error> {
        std::vector<char*> argv{};
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        pid_t pid{};
        if (int err = posix_spawnp(&pid, executable.c_str(), &m_actions, &m_attr, argv.data(), environ); err != 0) {
            return std::unexpected(cryptophage::make_errno_error(fmt::format(FMT_COMPILE("failed to spawn '{}'"), executable), err, ErrorKind::Spawn));
        }
        return pid;
    }

 private:
    posix_spawn_file_actions_t m_actions{};
    posix_spawnattr_t m_attr{};
    bool m_actions_valid{false};
    bool m_attr_valid{false};
};

auto decode_wait_status(int status) noexcept -> int {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

auto wait_blocking(pid_t pid) noexcept -> std::expected<int, Error> {
    int status{};
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return std::unexpected(cryptophage::make_errno_error("waitpid", errno));
        }
    }
    return decode_wait_status(status);
}

// Returns std::nullopt while the process is still running.
auto wait_non_blocking(pid_t pid) noexcept -> std::expected<std::optional<int>, Error> {
    int status{};
    pid_t res{};
    do {
        res = ::waitpid(pid, &status, WNOHANG);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        return std::unexpected(cryptophage::make_errno_error("waitpid", errno));
    }
    if (res == 0) {
        return std::nullopt;
    }
    return std::make_optional<int>(decode_wait_status(status));
}

// Waits for the process to exit, killing its process group once the timeout elapses.
// On timeout the process is still reaped before the Timeout error is returned,
// so that the pipes are closed and the pumps can finish.
auto wait_for_exit(pid_t pid, std::chrono::milliseconds timeout, std::string_view executable, int& exit_status) noexcept -> std::expected<void, Error> {
    using namespace std::chrono_literals;

    // a deadline beyond the range of the clock is never reached
    const auto now = std::chrono::steady_clock::now();
    if (timeout == cryptophage::WAIT_FOREVER
        || timeout >= std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::time_point::max() - now)) {
        auto res = wait_blocking(pid);
        if (!res) {
            return std::unexpected(std::move(res.error()));
        }
        exit_status = *res;
        return {};
    }

    const auto deadline = now + timeout;
    while (true) {
        auto res = wait_non_blocking(pid);
        if (!res) {
            return std::unexpected(std::move(res.error()));
        }
        if (res->has_value()) {
            exit_status = **res;
            return {};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(10ms);
    }

    spdlog::warn("[subprocess] '{}' did not exit within {}ms, killing it", executable, timeout.count());
    if (::kill(-pid, SIGKILL) != 0 && ::kill(pid, SIGKILL) != 0) {
        spdlog::error("[subprocess] failed to kill '{}': {}", executable, std::strerror(errno));
    }
    if (auto res = wait_blocking(pid); res) {
        exit_status = *res;
    } else {
        spdlog::error("[subprocess] failed to reap killed process: {}", res.error().message);
    }
    return std::unexpected(cryptophage::make_timeout_error(timeout, executable));
}

// UTF-8 encodings of U+0085, the space separators, U+2028 and U+2029
constexpr std::array UNICODE_WHITESPACE{
    "\xC2\x85"sv,
    "\xC2\xA0"sv,
    "\xE1\x9A\x80"sv,
    "\xE2\x80\x80"sv,
    "\xE2\x80\x81"sv,
    "\xE2\x80\x82"sv,
    "\xE2\x80\x83"sv,
    "\xE2\x80\x84"sv,
    "\xE2\x80\x85"sv,
    "\xE2\x80\x86"sv,
    "\xE2\x80\x87"sv,
    "\xE2\x80\x88"sv,
    "\xE2\x80\x89"sv,
    "\xE2\x80\x8A"sv,
    "\xE2\x80\xA8"sv,
    "\xE2\x80\xA9"sv,
    "\xE2\x80\xAF"sv,
    "\xE2\x81\x9F"sv,
    "\xE3\x80\x80"sv,
};

// Length of the whitespace character at the start of text, 0 if there is none.
auto whitespace_length(std::string_view text) noexcept -> std::size_t {
    switch (text.front()) {
    case ' ':
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
        return 1;
    default:
        break;
    }
    for (auto&& encoded : UNICODE_WHITESPACE) {
        if (text.starts_with(encoded)) {
            return encoded.size();
        }
    }
    return 0;
}

auto is_blank(std::string_view text) noexcept -> bool {
    while (!text.empty()) {
        const auto length = whitespace_length(text);
        if (length == 0) {
            return false;
        }
        text.remove_prefix(length);
    }
    return true;
}

// Keeps the error text for the exit status evaluation and forwards it
// to the caller's stream, if there is one.
class ErrorTextCapture final : public cryptophage::io::Stream {
 public:
    explicit ErrorTextCapture(cryptophage::io::Stream* forward_to) noexcept
      : m_forward_to(forward_to) { }

    [[nodiscard]] auto can_read() const noexcept -> bool override { return false; }
    [[nodiscard]] auto can_write() const noexcept -> bool override { return true; }

    auto read(std::span<char> /*buffer*/) noexcept -> std::expected<std::size_t, Error> override {
        return std::unexpected(cryptophage::make_error(ErrorKind::UnsupportedStream, "The stream does not support reading."));
    }
    auto write(std::span<const char> data) noexcept -> std::expected<void, Error> override {
        m_text.append(data.data(), data.size());
        if (m_forward_to != nullptr) {
            return m_forward_to->write(data);
        }
        return {};
    }

    [[nodiscard]] auto take_text() noexcept -> std::string { return std::move(m_text); }

 private:
    cryptophage::io::Stream* m_forward_to{};
    std::string m_text{};
};

template <typename T>
void store_failure(std::optional<Error>& slot, std::expected<T, Error>&& res) noexcept {
    if (!res) {
        slot = std::move(res.error());
    }
}

}  // namespace

namespace cryptophage {

SubProcess::SubProcess(std::string executable, std::string arguments) noexcept
  : m_executable(std::move(executable)), m_arguments(std::move(arguments)) { }

auto SubProcess::run(io::Stream* input, io::Stream* output, std::chrono::milliseconds timeout) const noexcept -> std::expected<void, Error> {
    return run(input, output, nullptr, timeout);
}

auto SubProcess::run(io::Stream* input, io::Stream* output, io::Stream* error_output, std::chrono::milliseconds timeout) const noexcept -> std::expected<void, Error> {
    if (auto res = io::ensure_readable(input); !res) {
        return res;
    }
    if (auto res = io::ensure_writable(output); !res) {
        return res;
    }
    if (auto res = io::ensure_writable(error_output); !res) {
        return res;
    }

    if (utils::env_flag_enabled("LOG_EXEC_CMDS") && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[subprocess] cmd := '{} {}'", m_executable, m_arguments);
    }

    // stdin/stdout pipes exist only when redirected, stderr is always captured.
    std::optional<Pipe> stdin_pipe{};
    std::optional<Pipe> stdout_pipe{};
    auto stderr_pipe = make_pipe();
    if (!stderr_pipe) {
        return std::unexpected(std::move(stderr_pipe.error()));
    }
    if (input != nullptr) {
        auto res = make_pipe();
        if (!res) {
            return std::unexpected(std::move(res.error()));
        }
        stdin_pipe = std::move(*res);
    }
    if (output != nullptr) {
        auto res = make_pipe();
        if (!res) {
            return std::unexpected(std::move(res.error()));
        }
        stdout_pipe = std::move(*res);
    }

    SpawnConfig spawn_config{};
    if (auto res = spawn_config.init(); !res) {
        return res;
    }
    if (stdin_pipe) {
        if (auto res = spawn_config.redirect(stdin_pipe->read_end, STDIN_FILENO); !res) {
            return res;
        }
    }
    if (stdout_pipe) {
        if (auto res = spawn_config.redirect(stdout_pipe->write_end, STDOUT_FILENO); !res) {
            return res;
        }
    }
    if (auto res = spawn_config.redirect(stderr_pipe->write_end, STDERR_FILENO); !res) {
        return res;
    }

    auto pid = spawn_config.spawn(m_executable, utils::split_argument_line(m_arguments));
    if (!pid) {
        spdlog::error("[subprocess] {}", pid.error().message);
        return std::unexpected(std::move(pid.error()));
    }

    // the child owns its ends now
    if (stdin_pipe) {
        stdin_pipe->read_end.close();
    }
    if (stdout_pipe) {
        stdout_pipe->write_end.close();
    }
    stderr_pipe->write_end.close();

    const auto executable_name = std::filesystem::path{m_executable}.filename().string();

    std::optional<Error> input_error{};
    std::optional<Error> output_error{};
    std::optional<Error> error_capture_error{};
    std::optional<Error> watcher_error{};
    ErrorTextCapture error_capture{error_output};
    int exit_status{};
    {
        std::jthread input_pump([&] {
            if (!stdin_pipe) {
                return;
            }
            store_failure(input_error, io::copy_dynamic(input, &stdin_pipe->write_end));
            stdin_pipe->write_end.close();
        });
        std::jthread output_pump([&] {
            if (!stdout_pipe) {
                return;
            }
            store_failure(output_error, io::copy_dynamic(&stdout_pipe->read_end, output));
            stdout_pipe->read_end.close();
        });
        std::jthread error_reader([&] {
            store_failure(error_capture_error, io::copy_dynamic(&stderr_pipe->read_end, &error_capture));
            stderr_pipe->read_end.close();
        });
        std::jthread timeout_watcher([&] {
            store_failure(watcher_error, wait_for_exit(*pid, timeout, executable_name, exit_status));
        });
    }

    std::vector<Error> failures{};
    for (auto* slot : {&input_error, &output_error, &error_capture_error, &watcher_error}) {
        if (*slot) {
            failures.push_back(std::move(**slot));
        }
    }
    if (auto failure = aggregate_errors(std::move(failures)); failure) {
        spdlog::error("[subprocess] '{}' failed: {}", executable_name, failure->to_string());
        return std::unexpected(std::move(*failure));
    }

    return evaluate_exit_status(exit_status, error_capture.take_text());
}

auto run_process(const Invocation& invocation) noexcept -> std::expected<void, Error> {
    const SubProcess process{invocation.executable, invocation.arguments};
    return process.run(invocation.input, invocation.output, invocation.error_output, invocation.timeout);
}

auto evaluate_exit_status(int exit_status, std::string error_text) noexcept -> std::expected<void, Error> {
    if (exit_status != 0 && !is_blank(error_text)) {
        spdlog::error("[subprocess] process exited with status {}", exit_status);
        return std::unexpected(make_subprocess_failure(std::move(error_text)));
    }
    if (exit_status != 0) {
        spdlog::debug("[subprocess] process exited with status {} and no error output", exit_status);
    }
    return {};
}

}  // namespace cryptophage
