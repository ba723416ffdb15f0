#pragma once

#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/verb.hpp>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

#include "Transfer.hpp"
#include "config.hpp"
#include "types.hpp"

namespace ferry::S3RequestFactory {

struct ByteRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

// "host[:port]" as it appears in the Host header and the signature.
std::string HostFor(const S3Config& cfg, const SourceLocation& location);

/**
 * @brief Builds a SigV4-signed HEAD or GET for one object.
 *
 * AWS endpoints use virtual-hosted-style addressing
 * (bucket.s3.region.amazonaws.com/key); anything else (MinIO, local) uses
 * path-style (host:port/bucket/key). Session tokens of ephemeral credentials
 * go into x-amz-security-token and are signed.
 */
http::request<http::empty_body> CreateSignedRequest(const S3Config& cfg,
                                                    const Credentials& credentials,
                                                    http::verb method,
                                                    const SourceLocation& location,
                                                    std::optional<ByteRange> range,
                                                    std::time_t now);

}  // namespace ferry::S3RequestFactory
