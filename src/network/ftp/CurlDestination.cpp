#include "CurlDestination.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/url/url.hpp>
#include <cstring>
#include <stdexcept>

#include "Errors.hpp"

namespace ferry {

namespace {

ErrorCode Classify(CURLcode rc) {
    switch (rc) {
        case CURLE_LOGIN_DENIED:
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_USE_SSL_FAILED:
        case CURLE_AUTH_ERROR:
            return ErrorCode::AuthenticationRejected;
        default:
            return ErrorCode::DestinationUnreachable;
    }
}

const char* Scheme(Protocol protocol) {
    return protocol == Protocol::Sftp ? "sftp" : "ftp";
}

}  // namespace

// ============================================================================
// CurlGlobal
// ============================================================================

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
    spdlog::debug("libcurl {}", curl_version());
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

// ============================================================================
// URL
// ============================================================================

std::string BuildDestinationUrl(const DestinationEndpoint& endpoint, const std::string& remote_path) {
    boost::urls::url url;
    url.set_scheme(Scheme(endpoint.protocol));
    url.set_host(endpoint.host);
    url.set_port_number(endpoint.port);

    const bool absolute = !remote_path.empty() && remote_path.front() == '/';
    if (endpoint.protocol == Protocol::Sftp) {
        url.set_path(absolute ? remote_path : "/~/" + remote_path);
    } else if (absolute) {
        boost::urls::url encoded;
        encoded.set_path(remote_path);
        url.set_encoded_path("/%2F" + std::string(encoded.encoded_path()).substr(1));
    } else {
        url.set_path("/" + remote_path);
    }
    return std::string(url.buffer());
}

// ============================================================================
// CurlDestination
// ============================================================================

CurlDestination::CurlDestination(DestinationEndpoint endpoint, std::string remote_path,
                                 std::chrono::seconds timeout)
    : endpoint_(std::move(endpoint)),
      remote_path_(std::move(remote_path)),
      file_url_(BuildDestinationUrl(endpoint_, remote_path_)),
      root_url_(BuildDestinationUrl(endpoint_, endpoint_.protocol == Protocol::Sftp ? "" : "/")),
      timeout_(timeout) {}

CurlDestination::~CurlDestination() { Close(); }

DestinationCapabilities CurlDestination::Capabilities() const {
    return DestinationCapabilities{.append = true, .offset_writes = false};
}

void CurlDestination::Prepare(const std::string& url) {
    if (!curl_) {
        curl_ = curl_easy_init();
        if (!curl_) {
            throw FerryError(ErrorCode::DestinationUnreachable, "curl_easy_init failed");
        }
    } else {
        // Keeps live connections, resets per-request options.
        curl_easy_reset(curl_);
    }
    error_buffer_[0] = '\0';

    const long timeout = static_cast<long>(timeout_.count());
    const auto& creds = endpoint_.credentials;

    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_buffer_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, timeout);
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME, timeout);
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl_, CURLOPT_USERNAME, creds.username.c_str());
    if (!creds.password.empty()) {
        curl_easy_setopt(curl_, CURLOPT_PASSWORD, creds.password.c_str());
    }

    switch (endpoint_.protocol) {
        case Protocol::Ftps:
            curl_easy_setopt(curl_, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
            curl_easy_setopt(curl_, CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_TLS));
            [[fallthrough]];
        case Protocol::Ftp:
            curl_easy_setopt(curl_, CURLOPT_FTP_RESPONSE_TIMEOUT, timeout);
            curl_easy_setopt(curl_, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));
            break;
        case Protocol::Sftp:
            if (!creds.private_key_path.empty()) {
                curl_easy_setopt(curl_, CURLOPT_SSH_AUTH_TYPES, static_cast<long>(CURLSSH_AUTH_PUBLICKEY));
                curl_easy_setopt(curl_, CURLOPT_SSH_PRIVATE_KEYFILE, creds.private_key_path.c_str());
                if (!creds.password.empty()) {
                    curl_easy_setopt(curl_, CURLOPT_KEYPASSWD, creds.password.c_str());
                }
            } else {
                curl_easy_setopt(curl_, CURLOPT_SSH_AUTH_TYPES, static_cast<long>(CURLSSH_AUTH_PASSWORD));
            }
            break;
    }
}

void CurlDestination::Perform(const char* what) {
    const CURLcode rc = curl_easy_perform(curl_);
    if (rc == CURLE_OK) {
        return;
    }
    const std::string detail = error_buffer_[0] != '\0' ? error_buffer_ : curl_easy_strerror(rc);
    throw FerryError(Classify(rc), fmt::format("{} {}://{}:{}{}: {} (curl {})", what,
                                               ToString(endpoint_.protocol), endpoint_.host,
                                               endpoint_.port, remote_path_, detail,
                                               static_cast<int>(rc)));
}

void CurlDestination::Connect() {
    Prepare(root_url_);
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    Perform("connect to");
    spdlog::debug("[Dest] Connected to {}://{}:{}", ToString(endpoint_.protocol), endpoint_.host,
                  endpoint_.port);
}

std::optional<std::uint64_t> CurlDestination::RemoteSize() {
    Prepare(file_url_);
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);

    const CURLcode rc = curl_easy_perform(curl_);
    if (rc == CURLE_REMOTE_FILE_NOT_FOUND) {
        return std::nullopt;
    }
    if (rc != CURLE_OK) {
        spdlog::warn("[Dest] Size query for {} failed: {}", remote_path_, curl_easy_strerror(rc));
        return std::nullopt;
    }
    curl_off_t size = -1;
    if (curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &size) != CURLE_OK || size < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

std::size_t CurlDestination::OnRead(char* buffer, std::size_t size, std::size_t nitems,
                                    void* userdata) {
    auto* state = static_cast<UploadState*>(userdata);
    try {
        const auto n = (*state->produce)(
            std::span<std::uint8_t>(reinterpret_cast<std::uint8_t*>(buffer), size * nitems));
        state->sent += n;
        return n;
    } catch (...) {
        state->error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

std::uint64_t CurlDestination::Write(WriteMode mode, std::uint64_t offset,
                                     const ByteProducer& produce) {
    if (mode == WriteMode::AtOffset) {
        throw std::logic_error("CurlDestination does not support offset writes");
    }

    Prepare(file_url_);
    UploadState state{&produce};
    curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl_, CURLOPT_READFUNCTION, &CurlDestination::OnRead);
    curl_easy_setopt(curl_, CURLOPT_READDATA, &state);
    curl_easy_setopt(curl_, CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR));
    if (mode == WriteMode::Append) {
        curl_easy_setopt(curl_, CURLOPT_APPEND, 1L);
    }

    spdlog::debug("[Dest] {} {} at {}", mode == WriteMode::Append ? "Appending to" : "Writing",
                  remote_path_, offset);

    const CURLcode rc = curl_easy_perform(curl_);
    if (state.error) {
        std::rethrow_exception(state.error);
    }
    if (rc != CURLE_OK) {
        const std::string detail = error_buffer_[0] != '\0' ? error_buffer_ : curl_easy_strerror(rc);
        throw FerryError(Classify(rc), fmt::format("upload to {}://{}:{}{} failed after {} bytes: {}",
                                                   ToString(endpoint_.protocol), endpoint_.host,
                                                   endpoint_.port, remote_path_, state.sent, detail));
    }
    return state.sent;
}

void CurlDestination::Close() noexcept {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<IDestination> CurlDestinationFactory::Open(const DestinationEndpoint& endpoint,
                                                           const std::string& remote_path) {
    return std::make_unique<CurlDestination>(endpoint, remote_path, timeout_);
}

}  // namespace ferry
