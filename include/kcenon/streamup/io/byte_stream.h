/**
 * @file byte_stream.h
 * @brief Byte source and sink abstractions for streaming transfers
 */

#ifndef KCENON_STREAMUP_IO_BYTE_STREAM_H
#define KCENON_STREAMUP_IO_BYTE_STREAM_H

#include "kcenon/streamup/core/types.h"

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace kcenon::streamup {

/**
 * @brief Readable stream of bytes
 *
 * read() may return fewer bytes than requested; 0 means end of stream.
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;
};

/**
 * @brief Writable stream of bytes
 */
class byte_sink {
public:
    virtual ~byte_sink() = default;

    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<void> = 0;

    [[nodiscard]] virtual auto flush() -> result<void> { return {}; }
};

/**
 * @brief Read until the buffer is full or the source ends
 *
 * Short reads are retried locally; this is stream-contract handling, not a
 * network retry.
 *
 * @return Bytes read (less than buffer.size() only at end of stream)
 */
[[nodiscard]] auto read_full(byte_source& source, std::span<std::byte> buffer)
    -> result<std::size_t>;

/**
 * @brief In-memory source over an owned buffer
 */
class memory_source : public byte_source {
public:
    explicit memory_source(byte_buffer data) : data_(std::move(data)) {}
    explicit memory_source(const std::string& text);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

    [[nodiscard]] auto remaining() const noexcept -> std::size_t {
        return data_.size() - offset_;
    }

private:
    byte_buffer data_;
    std::size_t offset_{0};
};

/**
 * @brief In-memory sink collecting written bytes
 */
class memory_sink : public byte_sink {
public:
    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void> override;

    [[nodiscard]] auto data() const noexcept -> const byte_buffer& { return data_; }
    [[nodiscard]] auto str() const -> std::string;

private:
    byte_buffer data_;
};

/**
 * @brief Source adapting a std::istream (std::cin, std::ifstream, ...)
 */
class istream_source : public byte_source {
public:
    explicit istream_source(std::istream& in) : in_(in) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

private:
    std::istream& in_;
};

/**
 * @brief Sink adapting a std::ostream (std::cout, std::ofstream, ...)
 */
class ostream_sink : public byte_sink {
public:
    explicit ostream_sink(std::ostream& out) : out_(out) {}

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void> override;
    [[nodiscard]] auto flush() -> result<void> override;

private:
    std::ostream& out_;
};

/**
 * @brief Source reading a local file
 */
class file_source : public byte_source {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::unique_ptr<file_source>>;

    ~file_source() override;

    file_source(const file_source&) = delete;
    auto operator=(const file_source&) -> file_source& = delete;

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

    /**
     * @brief Size of the file at open time
     */
    [[nodiscard]] auto size() const noexcept -> uint64_t { return size_; }

private:
    file_source(std::FILE* file, uint64_t size) : file_(file), size_(size) {}

    std::FILE* file_;
    uint64_t size_;
};

/**
 * @brief Sink writing a local file (truncates on open)
 */
class file_sink : public byte_sink {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::unique_ptr<file_sink>>;

    ~file_sink() override;

    file_sink(const file_sink&) = delete;
    auto operator=(const file_sink&) -> file_sink& = delete;

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void> override;
    [[nodiscard]] auto flush() -> result<void> override;

private:
    explicit file_sink(std::FILE* file) : file_(file) {}

    std::FILE* file_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_IO_BYTE_STREAM_H
