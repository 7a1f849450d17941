#ifndef STREAM_HPP
#define STREAM_HPP

#include "cryptophage/error.hpp"

#include <cstddef>   // for size_t
#include <cstdint>   // for uint8_t
#include <expected>  // for expected
#include <iosfwd>    // for istream, ostream
#include <span>      // for span

namespace cryptophage::io {

// Byte stream used on both sides of a stream pump.
class Stream {
 public:
    virtual ~Stream() = default;

    [[nodiscard]] virtual auto can_read() const noexcept -> bool  = 0;
    [[nodiscard]] virtual auto can_write() const noexcept -> bool = 0;

    /// @brief Read up to buffer.size() bytes.
    /// @return Number of bytes read, 0 at end of stream.
    virtual auto read(std::span<char> buffer) noexcept -> std::expected<std::size_t, Error> = 0;

    /// @brief Write all of data.
    virtual auto write(std::span<const char> data) noexcept -> std::expected<void, Error> = 0;

    /// @brief Release the underlying resource. Further reads/writes fail.
    virtual void close() noexcept { }
};

// Stream over a POSIX file descriptor. Takes ownership of the descriptor.
class FileDescriptorStream final : public Stream {
 public:
    enum class Mode : std::uint8_t {
        Read,
        Write
    };

    FileDescriptorStream(int fd, Mode mode) noexcept;
    ~FileDescriptorStream() override;

    // explicitly deleted (move-only)
    FileDescriptorStream(const FileDescriptorStream&) = delete;
    auto operator=(const FileDescriptorStream&)       = delete;

    FileDescriptorStream(FileDescriptorStream&& other) noexcept;
    auto operator=(FileDescriptorStream&& other) noexcept -> FileDescriptorStream&;

    [[nodiscard]] auto can_read() const noexcept -> bool override;
    [[nodiscard]] auto can_write() const noexcept -> bool override;

    auto read(std::span<char> buffer) noexcept -> std::expected<std::size_t, Error> override;
    auto write(std::span<const char> data) noexcept -> std::expected<void, Error> override;
    void close() noexcept override;

    [[nodiscard]] auto fd() const noexcept -> int { return m_fd; }

 private:
    int m_fd{-1};
    Mode m_mode{Mode::Read};
};

// Readable adapter over a std::istream, e.g. std::ifstream or std::istringstream.
class InputStreamAdapter final : public Stream {
 public:
    explicit InputStreamAdapter(std::istream& stream) noexcept;

    [[nodiscard]] auto can_read() const noexcept -> bool override;
    [[nodiscard]] auto can_write() const noexcept -> bool override { return false; }

    auto read(std::span<char> buffer) noexcept -> std::expected<std::size_t, Error> override;
    auto write(std::span<const char> data) noexcept -> std::expected<void, Error> override;

 private:
    std::istream* m_stream{};
};

// Writable adapter over a std::ostream, e.g. std::ofstream or std::ostringstream.
class OutputStreamAdapter final : public Stream {
 public:
    explicit OutputStreamAdapter(std::ostream& stream) noexcept;

    [[nodiscard]] auto can_read() const noexcept -> bool override { return false; }
    [[nodiscard]] auto can_write() const noexcept -> bool override;

    auto read(std::span<char> buffer) noexcept -> std::expected<std::size_t, Error> override;
    auto write(std::span<const char> data) noexcept -> std::expected<void, Error> override;

 private:
    std::ostream* m_stream{};
};

}  // namespace cryptophage::io

#endif  // STREAM_HPP
