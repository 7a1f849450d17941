#include "cryptophage/stream.hpp"

#include <pthread.h>  // for pthread_sigmask
#include <unistd.h>   // for read, write, close

#include <cerrno>   // for errno, EINTR, EPIPE
#include <csignal>  // for sigset_t, sigtimedwait
#include <ctime>    // for timespec

#include <istream>  // for istream
#include <ostream>  // for ostream
#include <utility>  // for exchange

namespace {

// Blocks SIGPIPE on the calling thread for the lifetime of the guard. A SIGPIPE raised
// by a write in that window is consumed, so the write reports EPIPE instead of
// terminating the host process.
class SigpipeGuard final {
 public:
    SigpipeGuard() noexcept {
        sigemptyset(&m_sigpipe_mask);
        sigaddset(&m_sigpipe_mask, SIGPIPE);

        sigset_t pending{};
        sigemptyset(&pending);
        if (sigpending(&pending) == 0) {
            m_was_pending = sigismember(&pending, SIGPIPE) == 1;
        }
        pthread_sigmask(SIG_BLOCK, &m_sigpipe_mask, &m_old_mask);
    }

    ~SigpipeGuard() {
        if (m_got_epipe && !m_was_pending) {
            const timespec zero{};
            while (sigtimedwait(&m_sigpipe_mask, nullptr, &zero) == -1 && errno == EINTR) { }
        }
        pthread_sigmask(SIG_SETMASK, &m_old_mask, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&)    = delete;
    auto operator=(const SigpipeGuard&) = delete;

    void got_epipe() noexcept { m_got_epipe = true; }

 private:
    sigset_t m_sigpipe_mask{};
    sigset_t m_old_mask{};
    bool m_was_pending{false};
    bool m_got_epipe{false};
};

}  // namespace

namespace cryptophage::io {

FileDescriptorStream::FileDescriptorStream(int fd, Mode mode) noexcept
  : m_fd(fd), m_mode(mode) { }

FileDescriptorStream::~FileDescriptorStream() {
    close();
}

FileDescriptorStream::FileDescriptorStream(FileDescriptorStream&& other) noexcept
  : m_fd(std::exchange(other.m_fd, -1)), m_mode(other.m_mode) { }

auto FileDescriptorStream::operator=(FileDescriptorStream&& other) noexcept -> FileDescriptorStream& {
    if (this != &other) {
        close();
        m_fd   = std::exchange(other.m_fd, -1);
        m_mode = other.m_mode;
    }
    return *this;
}

auto FileDescriptorStream::can_read() const noexcept -> bool {
    return m_fd != -1 && m_mode == Mode::Read;
}

auto FileDescriptorStream::can_write() const noexcept -> bool {
    return m_fd != -1 && m_mode == Mode::Write;
}

auto FileDescriptorStream::read(std::span<char> buffer) noexcept -> std::expected<std::size_t, Error> {
    if (!can_read()) {
        return std::unexpected(make_error(ErrorKind::UnsupportedStream, "The stream does not support reading."));
    }

    ssize_t bytes_read{};
    do {
        bytes_read = ::read(m_fd, buffer.data(), buffer.size());
    } while (bytes_read == -1 && errno == EINTR);

    if (bytes_read < 0) {
        return std::unexpected(make_errno_error("read", errno));
    }
    return static_cast<std::size_t>(bytes_read);
}

auto FileDescriptorStream::write(std::span<const char> data) noexcept -> std::expected<void, Error> {
    if (!can_write()) {
        return std::unexpected(make_error(ErrorKind::UnsupportedStream, "The stream does not support writing."));
    }

    SigpipeGuard sigpipe_guard{};
    while (!data.empty()) {
        const auto bytes_written = ::write(m_fd, data.data(), data.size());
        if (bytes_written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int errnum = errno;
            if (errnum == EPIPE) {
                sigpipe_guard.got_epipe();
            }
            return std::unexpected(make_errno_error("write", errnum));
        }
        data = data.subspan(static_cast<std::size_t>(bytes_written));
    }
    return {};
}

void FileDescriptorStream::close() noexcept {
    if (m_fd != -1) {
        ::close(std::exchange(m_fd, -1));
    }
}

InputStreamAdapter::InputStreamAdapter(std::istream& stream) noexcept
  : m_stream(&stream) { }

auto InputStreamAdapter::can_read() const noexcept -> bool {
    return !m_stream->bad();
}

auto InputStreamAdapter::read(std::span<char> buffer) noexcept -> std::expected<std::size_t, Error> {
    if (m_stream->bad()) {
        return std::unexpected(make_error(ErrorKind::Io, "read: input stream is in a bad state"));
    }
    if (m_stream->eof()) {
        return 0;
    }

    m_stream->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (m_stream->bad()) {
        return std::unexpected(make_error(ErrorKind::Io, "read: input stream is in a bad state"));
    }
    return static_cast<std::size_t>(m_stream->gcount());
}

auto InputStreamAdapter::write(std::span<const char> /*data*/) noexcept -> std::expected<void, Error> {
    return std::unexpected(make_error(ErrorKind::UnsupportedStream, "The stream does not support writing."));
}

OutputStreamAdapter::OutputStreamAdapter(std::ostream& stream) noexcept
  : m_stream(&stream) { }

auto OutputStreamAdapter::can_write() const noexcept -> bool {
    return m_stream->good();
}

auto OutputStreamAdapter::read(std::span<char> /*buffer*/) noexcept -> std::expected<std::size_t, Error> {
    return std::unexpected(make_error(ErrorKind::UnsupportedStream, "The stream does not support reading."));
}

auto OutputStreamAdapter::write(std::span<const char> data) noexcept -> std::expected<void, Error> {
    m_stream->write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!m_stream->good()) {
        return std::unexpected(make_error(ErrorKind::Io, "write: output stream is in a failed state"));
    }
    return {};
}

}  // namespace cryptophage::io
