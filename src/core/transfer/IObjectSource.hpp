#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include "Transfer.hpp"

namespace ferry {

struct ObjectMetadata {
    std::uint64_t size = 0;
    std::string etag;  // as reported by the store, may be empty
};

/**
 * @brief Sequential reader over one byte range of an object.
 */
class IObjectReader {
   public:
    virtual ~IObjectReader() = default;

    // Fills up to `out.size()` bytes. Returns 0 once the range is exhausted.
    virtual std::size_t Read(std::span<std::uint8_t> out) = 0;
};

/**
 * @brief Read side of a transfer: the object store, seen through one set of
 * ephemeral credentials.
 *
 * **Errors:** FerryError(SourceNotFound) for a missing object,
 * FerryError(SourceUnreadable) for transport failures (retryable).
 * **Thread Safety:** None. Each engine worker opens its own source.
 */
class IObjectSource {
   public:
    virtual ~IObjectSource() = default;

    virtual ObjectMetadata Stat(const SourceLocation& location) = 0;

    virtual std::unique_ptr<IObjectReader> OpenRange(const SourceLocation& location,
                                                     std::uint64_t offset,
                                                     std::uint64_t length) = 0;
};

class IObjectSourceFactory {
   public:
    virtual ~IObjectSourceFactory() = default;

    virtual std::unique_ptr<IObjectSource> Open(const Credentials& credentials) = 0;
};

/**
 * @brief Reads until `out` is full or the reader is exhausted.
 * @return Number of bytes read.
 */
inline std::size_t ReadFull(IObjectReader& reader, std::span<std::uint8_t> out) {
    std::size_t total = 0;
    while (total < out.size()) {
        const auto n = reader.Read(out.subspan(total));
        if (n == 0) break;
        total += n;
    }
    return total;
}

}  // namespace ferry
