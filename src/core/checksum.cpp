/**
 * @file checksum.cpp
 * @brief Checksum accumulator backed by OpenSSL EVP digests
 */

#include "kcenon/streamup/core/checksum.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>

namespace kcenon::streamup {

namespace {

auto evp_for(checksum_algorithm algo) -> const EVP_MD* {
    switch (algo) {
        case checksum_algorithm::md5:
            return EVP_md5();
        case checksum_algorithm::sha1:
            return EVP_sha1();
        case checksum_algorithm::sha256:
            return EVP_sha256();
        case checksum_algorithm::sha512:
            return EVP_sha512();
    }
    return EVP_sha256();
}

auto to_hex(const unsigned char* data, unsigned int len) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += digits[(data[i] >> 4) & 0x0F];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

auto parse_checksum_algorithm(std::string_view name) -> std::optional<checksum_algorithm> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "md5") return checksum_algorithm::md5;
    if (lower == "sha1") return checksum_algorithm::sha1;
    if (lower == "sha256") return checksum_algorithm::sha256;
    if (lower == "sha512") return checksum_algorithm::sha512;
    return std::nullopt;
}

struct checksum_accumulator::impl {
    mutable std::mutex mutex;
    std::unique_ptr<EVP_MD_CTX, md_ctx_deleter> ctx;
    bool init_ok = false;
    bool finalized = false;
    uint64_t bytes = 0;
    std::string digest;

    explicit impl(checksum_algorithm algo) : ctx(EVP_MD_CTX_new()) {
        if (ctx) {
            init_ok = EVP_DigestInit_ex(ctx.get(), evp_for(algo), nullptr) == 1;
        }
    }
};

checksum_accumulator::checksum_accumulator(checksum_algorithm algo)
    : impl_(std::make_unique<impl>(algo)), algo_(algo) {}

checksum_accumulator::~checksum_accumulator() = default;

checksum_accumulator::checksum_accumulator(checksum_accumulator&&) noexcept = default;
auto checksum_accumulator::operator=(checksum_accumulator&&) noexcept
    -> checksum_accumulator& = default;

auto checksum_accumulator::update(std::span<const std::byte> data) -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    if (!impl_->init_ok) {
        return unexpected{error{error_code::internal_error, "digest context unavailable"}};
    }
    if (impl_->finalized) {
        return unexpected{error{error_code::invalid_state, "checksum already finalized"}};
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        return unexpected{error{error_code::internal_error, "digest update failed"}};
    }
    impl_->bytes += data.size();
    return {};
}

auto checksum_accumulator::finalize() -> result<std::string> {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    if (impl_->finalized) {
        return impl_->digest;
    }
    if (!impl_->init_ok) {
        return unexpected{error{error_code::internal_error, "digest context unavailable"}};
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), md, &len) != 1) {
        return unexpected{error{error_code::internal_error, "digest finalization failed"}};
    }

    impl_->digest = to_hex(md, len);
    impl_->finalized = true;
    return impl_->digest;
}

auto checksum_accumulator::hex_digest() const -> std::string {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->digest;
}

auto checksum_accumulator::is_finalized() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->finalized;
}

auto checksum_accumulator::bytes_processed() const -> uint64_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->bytes;
}

auto checksum_accumulator::digest(checksum_algorithm algo,
                                  std::span<const std::byte> data) -> std::string {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    std::unique_ptr<EVP_MD_CTX, md_ctx_deleter> ctx(EVP_MD_CTX_new());
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), evp_for(algo), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) {
        return {};
    }
    return to_hex(md, len);
}

}  // namespace kcenon::streamup
