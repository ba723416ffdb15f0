#pragma once

#include <ctime>
#include <map>
#include <string>
#include <string_view>

namespace ferry {

/**
 * @brief AWS Signature Version 4 for unsigned-payload-free S3 requests
 * (GET / HEAD, empty body).
 *
 * @details
 * Headers passed to Sign are all signed; keys must already be lower-case.
 * The signer adds `x-amz-date` and `x-amz-content-sha256` itself and
 * returns them with the `authorization` value.
 */
class S3Signer {
   public:
    using HeaderMap = std::map<std::string, std::string>;

    S3Signer(std::string region, std::string service);

    /**
     * @param headers In: headers to sign (at least "host"). Out: adds
     *        x-amz-date, x-amz-content-sha256 and authorization.
     */
    void Sign(std::string_view method, std::string_view canonical_uri,
              std::string_view canonical_query, HeaderMap& headers,
              const std::string& access_key, const std::string& secret_key,
              std::time_t now) const;

    static std::string Sha256Hex(std::string_view data);
    static std::string HmacSha256(std::string_view key, std::string_view data);

    // RFC 3986 encoding as S3 expects; '/' is kept when `keep_slash` is set.
    static std::string UriEncode(std::string_view in, bool keep_slash);

    static constexpr std::string_view EMPTY_PAYLOAD_SHA256 =
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

   private:
    std::string region_;
    std::string service_;
};

}  // namespace ferry
