/**
 * @file byte_stream.cpp
 * @brief Byte source and sink implementations
 */

#include "kcenon/streamup/io/byte_stream.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace kcenon::streamup {

auto read_full(byte_source& source, std::span<std::byte> buffer) -> result<std::size_t> {
    std::size_t total = 0;
    while (total < buffer.size()) {
        auto n = source.read(buffer.subspan(total));
        if (!n) {
            return unexpected{n.error()};
        }
        if (n.value() == 0) {
            break;
        }
        total += n.value();
    }
    return total;
}

// ============================================================================
// memory_source / memory_sink
// ============================================================================

memory_source::memory_source(const std::string& text) : data_(text.size()) {
    if (!text.empty()) {
        std::memcpy(data_.data(), text.data(), text.size());
    }
}

auto memory_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    auto n = std::min(buffer.size(), remaining());
    if (n > 0) {
        std::memcpy(buffer.data(), data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

auto memory_sink::write(std::span<const std::byte> data) -> result<void> {
    data_.insert(data_.end(), data.begin(), data.end());
    return {};
}

auto memory_sink::str() const -> std::string {
    return std::string(reinterpret_cast<const char*>(data_.data()), data_.size());
}

// ============================================================================
// istream_source / ostream_sink
// ============================================================================

auto istream_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (buffer.empty() || in_.eof()) {
        return std::size_t{0};
    }
    in_.read(reinterpret_cast<char*>(buffer.data()),
             static_cast<std::streamsize>(buffer.size()));
    if (in_.bad()) {
        return unexpected{error{error_code::stream_read_error, "input stream read failed"}};
    }
    return static_cast<std::size_t>(in_.gcount());
}

auto ostream_sink::write(std::span<const std::byte> data) -> result<void> {
    out_.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!out_) {
        return unexpected{error{error_code::stream_write_error, "output stream write failed"}};
    }
    return {};
}

auto ostream_sink::flush() -> result<void> {
    out_.flush();
    if (!out_) {
        return unexpected{error{error_code::stream_write_error, "output stream flush failed"}};
    }
    return {};
}

// ============================================================================
// file_source / file_sink
// ============================================================================

auto file_source::open(const std::filesystem::path& path)
    -> result<std::unique_ptr<file_source>> {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected{error{error_code::file_open_error,
            "cannot stat " + path.string() + ": " + ec.message()}};
    }

    std::FILE* file = std::fopen(path.string().c_str(), "rb");
    if (!file) {
        return unexpected{error{error_code::file_open_error,
            "cannot open " + path.string() + ": " + std::strerror(errno)}};
    }
    return std::unique_ptr<file_source>(new file_source(file, size));
}

file_source::~file_source() {
    if (file_) {
        std::fclose(file_);
    }
}

auto file_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (buffer.empty()) {
        return std::size_t{0};
    }
    auto n = std::fread(buffer.data(), 1, buffer.size(), file_);
    if (n < buffer.size() && std::ferror(file_)) {
        return unexpected{error{error_code::stream_read_error, "file read failed"}};
    }
    return n;
}

auto file_sink::open(const std::filesystem::path& path) -> result<std::unique_ptr<file_sink>> {
    std::FILE* file = std::fopen(path.string().c_str(), "wb");
    if (!file) {
        return unexpected{error{error_code::file_open_error,
            "cannot create " + path.string() + ": " + std::strerror(errno)}};
    }
    return std::unique_ptr<file_sink>(new file_sink(file));
}

file_sink::~file_sink() {
    if (file_) {
        std::fclose(file_);
    }
}

auto file_sink::write(std::span<const std::byte> data) -> result<void> {
    if (data.empty()) {
        return {};
    }
    if (std::fwrite(data.data(), 1, data.size(), file_) != data.size()) {
        return unexpected{error{error_code::stream_write_error, "file write failed"}};
    }
    return {};
}

auto file_sink::flush() -> result<void> {
    if (std::fflush(file_) != 0) {
        return unexpected{error{error_code::stream_write_error, "file flush failed"}};
    }
    return {};
}

}  // namespace kcenon::streamup
