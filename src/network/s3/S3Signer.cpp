#include "S3Signer.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <stdexcept>

#include "Checksum.hpp"

namespace ferry {

namespace {

std::tm SafeGmtime(std::time_t timer) {
    std::tm tm_snapshot{};
    gmtime_r(&timer, &tm_snapshot);
    return tm_snapshot;
}

std::string Format(const std::tm& tm, const char* fmt) {
    char buf[32];
    const auto n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

}  // namespace

S3Signer::S3Signer(std::string region, std::string service)
    : region_(std::move(region)), service_(std::move(service)) {}

std::string S3Signer::Sha256Hex(std::string_view data) {
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    return ToHex(std::span<const std::uint8_t>(out.data(), len));
}

std::string S3Signer::HmacSha256(std::string_view key, std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data(),
             &len) == nullptr) {
        throw std::runtime_error("HMAC(sha256) failed");
    }
    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

std::string S3Signer::UriEncode(std::string_view in, bool keep_slash) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size() * 3);
    for (unsigned char c : in) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                                c == '~';
        if (unreserved || (keep_slash && c == '/')) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

void S3Signer::Sign(std::string_view method, std::string_view canonical_uri,
                    std::string_view canonical_query, HeaderMap& headers,
                    const std::string& access_key, const std::string& secret_key,
                    std::time_t now) const {
    const auto tm = SafeGmtime(now);
    const auto amz_date = Format(tm, "%Y%m%dT%H%M%SZ");
    const auto date_stamp = Format(tm, "%Y%m%d");

    headers["x-amz-date"] = amz_date;
    headers["x-amz-content-sha256"] = std::string(EMPTY_PAYLOAD_SHA256);

    // 1. Canonical request (std::map keeps the headers sorted)
    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : headers) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    std::string canonical_request;
    canonical_request.append(method).append("\n");
    canonical_request.append(canonical_uri).append("\n");
    canonical_request.append(canonical_query).append("\n");
    canonical_request.append(canonical_headers).append("\n");
    canonical_request.append(signed_headers).append("\n");
    canonical_request.append(EMPTY_PAYLOAD_SHA256);

    // 2. String to sign
    const auto scope = date_stamp + "/" + region_ + "/" + service_ + "/aws4_request";
    const auto string_to_sign = "AWS4-HMAC-SHA256\n" + amz_date + "\n" + scope + "\n" +
                                Sha256Hex(canonical_request);

    // 3. Signature
    const auto k_date = HmacSha256("AWS4" + secret_key, date_stamp);
    const auto k_region = HmacSha256(k_date, region_);
    const auto k_service = HmacSha256(k_region, service_);
    const auto k_signing = HmacSha256(k_service, "aws4_request");
    const auto raw = HmacSha256(k_signing, string_to_sign);
    const auto signature =
        ToHex(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(raw.data()), raw.size()));

    headers["authorization"] = "AWS4-HMAC-SHA256 Credential=" + access_key + "/" + scope +
                               ", SignedHeaders=" + signed_headers + ", Signature=" + signature;
}

}  // namespace ferry
