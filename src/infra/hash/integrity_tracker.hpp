#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <expected>
#include "../error_handler/error.hpp"
#include <openssl/evp.h>
#include <xxhash.h>

namespace rfetch::infra {

struct Digest {
    std::uint64_t bytes = 0;
    std::string md5_base64;   // в формате заголовка Content-MD5
    XXH64_hash_t xxh64 = 0;
};

// Накопительный хеш по всем байтам, отданным потребителю.
// update() вызывается ровно один раз на каждый отданный чанк, в порядке выдачи.
class IntegrityTracker {
public:
    [[nodiscard]] static auto create() -> Result<IntegrityTracker>;

    IntegrityTracker(IntegrityTracker&&) noexcept = default;
    IntegrityTracker& operator=(IntegrityTracker&&) noexcept = default;
    IntegrityTracker(const IntegrityTracker&) = delete;
    IntegrityTracker& operator=(const IntegrityTracker&) = delete;

    void update(std::span<const std::uint8_t> chunk);

    // Один раз, когда поток считается завершённым
    [[nodiscard]] auto finalize() -> Result<Digest>;

    [[nodiscard]] auto bytes() const -> std::uint64_t { return bytes_; }
    [[nodiscard]] auto is_finalized() const -> bool { return finalized_; }

    // Content-MD5 произвольного буфера (используется тестовым сервером)
    [[nodiscard]] static auto md5_base64(std::span<const std::uint8_t> data) -> Result<std::string>;

private:
    using Md5Context = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
    using XxhState = std::unique_ptr<XXH64_state_t, decltype(&XXH64_freeState)>;

    IntegrityTracker(Md5Context md5, XxhState xxh);

    Md5Context md5_;
    XxhState xxh_;
    std::uint64_t bytes_ = 0;
    bool failed_ = false;
    bool finalized_ = false;
};

} // namespace rfetch::infra
