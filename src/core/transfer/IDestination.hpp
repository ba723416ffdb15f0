#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "Transfer.hpp"

namespace ferry {

enum class WriteMode {
    Truncate,  // replace the remote file
    Append,    // continue at the current end of the remote file
    AtOffset,  // write at an absolute offset, leaving other ranges intact
};

struct DestinationCapabilities {
    bool append = false;
    bool offset_writes = false;
};

// Pull-style producer: fills the span, returns the byte count, 0 at end of data.
// May throw; the destination aborts the upload and rethrows unchanged.
using ByteProducer = std::function<std::size_t(std::span<std::uint8_t>)>;

/**
 * @brief Write side of a transfer: one connection to the remote endpoint.
 *
 * **Errors:** FerryError(DestinationUnreachable) for connection and I/O
 * failures (retryable), FerryError(AuthenticationRejected) when the endpoint
 * refuses the credentials.
 * **Thread Safety:** None. Each engine worker opens its own destination.
 */
class IDestination {
   public:
    virtual ~IDestination() = default;

    virtual void Connect() = 0;
    virtual DestinationCapabilities Capabilities() const = 0;

    // Current size of the remote file, nullopt if absent or unknown.
    virtual std::optional<std::uint64_t> RemoteSize() = 0;

    /**
     * @brief Streams the producer's bytes to the remote path.
     * @return Bytes written.
     */
    virtual std::uint64_t Write(WriteMode mode, std::uint64_t offset,
                                const ByteProducer& produce) = 0;

    virtual void Close() noexcept = 0;
};

class IDestinationFactory {
   public:
    virtual ~IDestinationFactory() = default;

    virtual std::unique_ptr<IDestination> Open(const DestinationEndpoint& endpoint,
                                               const std::string& remote_path) = 0;
};

}  // namespace ferry
