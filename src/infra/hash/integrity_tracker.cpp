#include "integrity_tracker.hpp"
#include <array>
#include <spdlog/spdlog.h>

namespace rfetch::infra {

namespace {

auto encode_base64(const unsigned char* data, std::size_t len) -> std::string {
    // EVP_EncodeBlock пишет 4 символа на каждые 3 байта плюс завершающий ноль
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        data, static_cast<int>(len));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

} // namespace

IntegrityTracker::IntegrityTracker(Md5Context md5, XxhState xxh)
    : md5_(std::move(md5))
    , xxh_(std::move(xxh))
{}

auto IntegrityTracker::create() -> Result<IntegrityTracker> {
    Md5Context md5{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (!md5 || EVP_DigestInit_ex(md5.get(), EVP_md5(), nullptr) != 1) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to initialize MD5 context"));
    }

    XxhState xxh{XXH64_createState(), &XXH64_freeState};
    if (!xxh) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state"));
    }
    XXH64_reset(xxh.get(), 0); // seed = 0

    return IntegrityTracker{std::move(md5), std::move(xxh)};
}

void IntegrityTracker::update(std::span<const std::uint8_t> chunk) {
    if (finalized_) {
        spdlog::error("IntegrityTracker::update() after finalize() ({} bytes dropped)", chunk.size());
        failed_ = true;
        return;
    }

    if (EVP_DigestUpdate(md5_.get(), chunk.data(), chunk.size()) != 1) {
        failed_ = true;
    }
    XXH64_update(xxh_.get(), chunk.data(), chunk.size());
    bytes_ += chunk.size();
}

auto IntegrityTracker::finalize() -> Result<Digest> {
    if (finalized_) {
        return std::unexpected(make_error(ErrorCode::Unknown, "digest already finalized"));
    }
    finalized_ = true;

    if (failed_) {
        return std::unexpected(make_error(ErrorCode::Unknown, "digest state is corrupted"));
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(md5_.get(), md.data(), &md_len) != 1) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to finalize MD5 digest"));
    }

    return Digest{
        .bytes = bytes_,
        .md5_base64 = encode_base64(md.data(), md_len),
        .xxh64 = XXH64_digest(xxh_.get())
    };
}

auto IntegrityTracker::md5_base64(std::span<const std::uint8_t> data) -> Result<std::string> {
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md.data(), &md_len, EVP_md5(), nullptr) != 1) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to compute MD5 digest"));
    }
    return encode_base64(md.data(), md_len);
}

} // namespace rfetch::infra
