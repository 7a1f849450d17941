#include "cryptophage/stream_pump.hpp"

#include <utility>  // for move
#include <vector>   // for vector

namespace cryptophage::io {

auto ensure_readable(const Stream* stream) noexcept -> std::expected<void, Error> {
    if (stream != nullptr && !stream->can_read()) {
        return std::unexpected(make_error(ErrorKind::UnsupportedStream, "The source stream does not support reading."));
    }
    return {};
}

auto ensure_writable(const Stream* stream) noexcept -> std::expected<void, Error> {
    if (stream != nullptr && !stream->can_write()) {
        return std::unexpected(make_error(ErrorKind::UnsupportedStream, "The destination stream does not support writing."));
    }
    return {};
}

auto copy_dynamic(Stream* source, Stream* destination) noexcept -> std::expected<void, Error> {
    if (source == nullptr || destination == nullptr) {
        return {};
    }
    if (auto res = ensure_readable(source); !res) {
        return res;
    }
    if (auto res = ensure_writable(destination); !res) {
        return res;
    }

    std::size_t buffer_size = PUMP_INITIAL_BUFFER_SIZE;
    std::vector<char> buffer(buffer_size);

    while (true) {
        std::size_t bytes_read{};
        do {
            auto read_res = source->read({buffer.data(), buffer_size});
            if (!read_res) {
                return std::unexpected(std::move(read_res.error()));
            }
            bytes_read = *read_res;
            if (bytes_read == 0) {
                return {};
            }

            if (auto write_res = destination->write({buffer.data(), bytes_read}); !write_res) {
                return write_res;
            }
        } while (buffer_size >= PUMP_MAX_BUFFER_SIZE || bytes_read != buffer_size);

        // the read saturated the buffer, so grow it
        buffer_size *= 4;
        buffer.resize(buffer_size);
    }
}

}  // namespace cryptophage::io
