#pragma once

#include <curl/curl.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>

#include "IDestination.hpp"
#include "Transfer.hpp"

namespace ferry {

/**
 * @brief Process-wide libcurl initialisation. Create one in main() before any
 * worker thread starts.
 */
class CurlGlobal {
   public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/**
 * @brief URL of `remote_path` on the endpoint. ftps uses the ftp scheme
 * (explicit TLS is negotiated on the control connection). Absolute FTP paths
 * are rooted with %2F so the server does not resolve them against the login
 * directory.
 */
std::string BuildDestinationUrl(const DestinationEndpoint& endpoint, const std::string& remote_path);

/**
 * @brief ftp, ftps and sftp destinations over one libcurl easy handle.
 *
 * @details
 * The handle keeps the control connection alive between operations, so
 * consecutive chunk appends reuse the same login. Uploads pull their bytes
 * from the ByteProducer inside libcurl's read callback; an exception thrown
 * by the producer aborts the upload and is rethrown unchanged.
 * Capabilities: append on every protocol, no offset writes.
 *
 * **Errors:** login and TLS verification failures -> AuthenticationRejected,
 * everything else -> DestinationUnreachable.
 */
class CurlDestination final : public IDestination {
   public:
    CurlDestination(DestinationEndpoint endpoint, std::string remote_path,
                    std::chrono::seconds timeout);
    ~CurlDestination() override;

    CurlDestination(const CurlDestination&) = delete;
    CurlDestination& operator=(const CurlDestination&) = delete;

    void Connect() override;
    DestinationCapabilities Capabilities() const override;
    std::optional<std::uint64_t> RemoteSize() override;
    std::uint64_t Write(WriteMode mode, std::uint64_t offset, const ByteProducer& produce) override;
    void Close() noexcept override;

   private:
    struct UploadState {
        const ByteProducer* produce = nullptr;
        std::uint64_t sent = 0;
        std::exception_ptr error;
    };

    static std::size_t OnRead(char* buffer, std::size_t size, std::size_t nitems, void* userdata);

    void Prepare(const std::string& url);
    void Perform(const char* what);

    DestinationEndpoint endpoint_;
    std::string remote_path_;
    std::string file_url_;
    std::string root_url_;
    std::chrono::seconds timeout_;
    CURL* curl_ = nullptr;
    char error_buffer_[256] = {};
};

class CurlDestinationFactory final : public IDestinationFactory {
   public:
    explicit CurlDestinationFactory(std::chrono::seconds timeout) : timeout_(timeout) {}

    std::unique_ptr<IDestination> Open(const DestinationEndpoint& endpoint,
                                       const std::string& remote_path) override;

   private:
    std::chrono::seconds timeout_;
};

}  // namespace ferry
