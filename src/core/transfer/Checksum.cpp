#include "Checksum.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ferry {

// -------- Md5 --------

void Md5::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    Reset();
}

Md5::~Md5() = default;
Md5::Md5(Md5&&) noexcept = default;
Md5& Md5::operator=(Md5&&) noexcept = default;

void Md5::Reset() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(md5) failed");
    }
}

void Md5::Update(std::span<const std::uint8_t> data) {
    if (data.empty()) return;
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Md5::Digest Md5::Finalize() {
    Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != out.size()) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    Reset();
    return out;
}

Md5::Digest Md5::Of(std::span<const std::uint8_t> data) {
    Md5 md5;
    md5.Update(data);
    return md5.Finalize();
}

std::string ToHex(std::span<const std::uint8_t> bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

// -------- ChunkedChecksum --------

ChunkedChecksum::ChunkedChecksum(std::size_t chunk_size) : chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
}

void ChunkedChecksum::Update(std::span<const std::uint8_t> data) {
    while (!data.empty()) {
        const auto take = std::min(data.size(), chunk_size_ - filled_);
        current_.Update(data.first(take));
        filled_ += take;
        data = data.subspan(take);
        if (filled_ == chunk_size_) {
            digests_.push_back(current_.Finalize());
            filled_ = 0;
        }
    }
}

std::string ChunkedChecksum::Finalize() {
    if (filled_ > 0) {
        digests_.push_back(current_.Finalize());
        filled_ = 0;
    }
    auto result = Combine(digests_);
    digests_.clear();
    return result;
}

std::string ChunkedChecksum::Combine(const std::vector<Md5::Digest>& digests) {
    if (digests.empty()) {
        return ToHex(Md5::Of({}));
    }
    if (digests.size() == 1) {
        return ToHex(digests.front());
    }
    Md5 outer;
    for (const auto& d : digests) {
        outer.Update(d);
    }
    return ToHex(outer.Finalize()) + "-" + std::to_string(digests.size());
}

std::optional<std::string> UsableEtag(std::string_view etag, std::uint64_t size,
                                      std::size_t chunk_size) {
    // Multipart ETags depend on the uploader's part size, which is unknown.
    if (size > chunk_size) {
        return std::nullopt;
    }
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        etag = etag.substr(1, etag.size() - 2);
    }
    if (etag.size() != 32 ||
        !std::all_of(etag.begin(), etag.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        return std::nullopt;
    }
    std::string normalized(etag);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

}  // namespace ferry
