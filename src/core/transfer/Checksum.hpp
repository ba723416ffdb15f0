#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct evp_md_ctx_st;

namespace ferry {

/**
 * @brief Incremental MD5 over OpenSSL's EVP interface.
 */
class Md5 {
   public:
    using Digest = std::array<std::uint8_t, 16>;

    Md5();
    ~Md5();
    Md5(Md5&&) noexcept;
    Md5& operator=(Md5&&) noexcept;
    Md5(const Md5&) = delete;
    Md5& operator=(const Md5&) = delete;

    void Update(std::span<const std::uint8_t> data);

    // Returns the digest and resets the context for reuse.
    Digest Finalize();

    static Digest Of(std::span<const std::uint8_t> data);

   private:
    void Reset();

    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

std::string ToHex(std::span<const std::uint8_t> bytes);

/**
 * @brief Object checksum with chunk-aligned digests.
 *
 * @details
 * The byte stream is cut at every `chunk_size` boundary and each piece gets
 * its own MD5. The object checksum is the hex digest of the only piece when
 * there is at most one, otherwise hex MD5 over the concatenated binary
 * digests followed by "-<count>" (the S3 multipart ETag layout). Streaming
 * the bytes or combining per-chunk digests computed in any order yields the
 * same value.
 */
class ChunkedChecksum {
   public:
    explicit ChunkedChecksum(std::size_t chunk_size);

    void Update(std::span<const std::uint8_t> data);
    std::string Finalize();

    static std::string Combine(const std::vector<Md5::Digest>& digests);

   private:
    std::size_t chunk_size_;
    std::size_t filled_ = 0;
    Md5 current_;
    std::vector<Md5::Digest> digests_;
};

/**
 * @brief Normalizes a source ETag that can stand in for a computed checksum.
 *
 * Only a plain 32-hex ETag on an object of at most one chunk qualifies.
 * Multipart ETags are never usable: the part size of the upload is unknown.
 * A usable ETag is still only a hint; encrypted objects carry ETags that
 * look like MD5s but are not, so a mismatch must be confirmed by re-reading.
 */
std::optional<std::string> UsableEtag(std::string_view etag, std::uint64_t size,
                                      std::size_t chunk_size);

}  // namespace ferry
