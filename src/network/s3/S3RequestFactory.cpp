#include "S3RequestFactory.hpp"

#include <fmt/format.h>

#include "S3Signer.hpp"

namespace ferry::S3RequestFactory {

namespace {

bool IsAws(const S3Config& cfg) {
    return cfg.host.find("amazonaws.com") != std::string::npos;
}

}  // namespace

std::string HostFor(const S3Config& cfg, const SourceLocation& location) {
    if (IsAws(cfg)) {
        return location.container + ".s3." + cfg.region + ".amazonaws.com";
    }
    if (!cfg.port.empty() && cfg.port != "80" && cfg.port != "443") {
        return cfg.host + ":" + cfg.port;
    }
    return cfg.host;
}

http::request<http::empty_body> CreateSignedRequest(const S3Config& cfg,
                                                    const Credentials& credentials,
                                                    http::verb method,
                                                    const SourceLocation& location,
                                                    std::optional<ByteRange> range,
                                                    std::time_t now) {
    const auto host = HostFor(cfg, location);
    const auto key = S3Signer::UriEncode(location.object_key, true);
    const auto canonical_uri = IsAws(cfg) ? "/" + key : "/" + location.container + "/" + key;

    S3Signer::HeaderMap headers;
    headers["host"] = host;
    if (!credentials.session_token.empty()) {
        headers["x-amz-security-token"] = credentials.session_token;
    }

    const auto region = credentials.region.empty() ? cfg.region : credentials.region;
    S3Signer signer(region, cfg.service);
    signer.Sign(std::string(http::to_string(method)), canonical_uri, "", headers, credentials.access_key_id,
                credentials.secret_access_key, now);

    http::request<http::empty_body> req{method, canonical_uri, 11};
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    if (range) {
        req.set(http::field::range,
                fmt::format("bytes={}-{}", range->offset, range->offset + range->length - 1));
    }
    req.set(http::field::connection, "close");
    return req;
}

}  // namespace ferry::S3RequestFactory
