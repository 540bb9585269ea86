/**
 * @file checksum.h
 * @brief Running content digest fed in source order
 */

#ifndef KCENON_STREAMUP_CORE_CHECKSUM_H
#define KCENON_STREAMUP_CORE_CHECKSUM_H

#include <kcenon/streamup/core/types.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::streamup {

/**
 * @brief Digest algorithms supported by the accumulator
 */
enum class checksum_algorithm {
    md5,
    sha1,
    sha256,
    sha512,
};

[[nodiscard]] constexpr auto to_string(checksum_algorithm algo) -> const char* {
    switch (algo) {
        case checksum_algorithm::md5:
            return "md5";
        case checksum_algorithm::sha1:
            return "sha1";
        case checksum_algorithm::sha256:
            return "sha256";
        case checksum_algorithm::sha512:
            return "sha512";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse an algorithm name ("md5", "sha256", ...)
 */
[[nodiscard]] auto parse_checksum_algorithm(std::string_view name)
    -> std::optional<checksum_algorithm>;

/**
 * @brief Sequential hasher shared between the producer and the finalizer
 *
 * The upload producer feeds bytes strictly in source order before a part is
 * handed to the workers; finalize() is called later from the session
 * controller. A mutex serializes the two. Once finalized, further updates
 * are rejected and hex_digest() returns the cached value.
 */
class checksum_accumulator {
public:
    explicit checksum_accumulator(checksum_algorithm algo);
    ~checksum_accumulator();

    checksum_accumulator(const checksum_accumulator&) = delete;
    auto operator=(const checksum_accumulator&) -> checksum_accumulator& = delete;
    checksum_accumulator(checksum_accumulator&&) noexcept;
    auto operator=(checksum_accumulator&&) noexcept -> checksum_accumulator&;

    /**
     * @brief Feed bytes into the running digest
     */
    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finish the digest
     * @return Lowercase hex digest
     */
    [[nodiscard]] auto finalize() -> result<std::string>;

    /**
     * @brief Digest after finalize(), empty before
     */
    [[nodiscard]] auto hex_digest() const -> std::string;

    [[nodiscard]] auto is_finalized() const -> bool;

    [[nodiscard]] auto algorithm() const noexcept -> checksum_algorithm { return algo_; }

    /**
     * @brief Bytes fed so far
     */
    [[nodiscard]] auto bytes_processed() const -> uint64_t;

    /**
     * @brief One-shot digest of a buffer
     */
    [[nodiscard]] static auto digest(checksum_algorithm algo,
                                     std::span<const std::byte> data) -> std::string;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
    checksum_algorithm algo_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_CORE_CHECKSUM_H
