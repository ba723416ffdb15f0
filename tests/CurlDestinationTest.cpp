#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "CurlDestination.hpp"
#include "Errors.hpp"

using namespace ferry;
using namespace std::chrono_literals;

namespace {

DestinationEndpoint Endpoint(Protocol protocol, std::uint16_t port) {
    DestinationEndpoint endpoint;
    endpoint.protocol = protocol;
    endpoint.host = "files.partner.example";
    endpoint.port = port;
    endpoint.credentials = {"drop", "hunter2", ""};
    return endpoint;
}

}  // namespace

TEST(CurlDestinationTest, SftpUrls) {
    const auto sftp = Endpoint(Protocol::Sftp, 22);
    EXPECT_EQ(BuildDestinationUrl(sftp, "/srv/in/data.bin"), "sftp://files.partner.example:22/srv/in/data.bin");
    EXPECT_EQ(BuildDestinationUrl(sftp, "in/data.bin"), "sftp://files.partner.example:22/~/in/data.bin");
    EXPECT_EQ(BuildDestinationUrl(sftp, ""), "sftp://files.partner.example:22/~/");
}

TEST(CurlDestinationTest, FtpUrlsAreRootedExplicitly) {
    const auto ftp = Endpoint(Protocol::Ftp, 21);
    EXPECT_EQ(BuildDestinationUrl(ftp, "/in/data.bin"), "ftp://files.partner.example:21/%2Fin/data.bin");
    EXPECT_EQ(BuildDestinationUrl(ftp, "/"), "ftp://files.partner.example:21/%2F");
    EXPECT_EQ(BuildDestinationUrl(ftp, "in/data.bin"), "ftp://files.partner.example:21/in/data.bin");
}

TEST(CurlDestinationTest, FtpsUsesFtpScheme) {
    EXPECT_EQ(BuildDestinationUrl(Endpoint(Protocol::Ftps, 2121), "/in/data.bin"),
              "ftp://files.partner.example:2121/%2Fin/data.bin");
}

TEST(CurlDestinationTest, PathsArePercentEncoded) {
    EXPECT_EQ(BuildDestinationUrl(Endpoint(Protocol::Ftp, 21), "/in/q1 report.csv"),
              "ftp://files.partner.example:21/%2Fin/q1%20report.csv");
    EXPECT_EQ(BuildDestinationUrl(Endpoint(Protocol::Sftp, 22), "/in/q1 report.csv"),
              "sftp://files.partner.example:22/in/q1%20report.csv");
}

TEST(CurlDestinationTest, AppendsButNeverWritesAtOffsets) {
    CurlDestinationFactory factory(5s);
    for (const auto protocol : {Protocol::Ftp, Protocol::Ftps, Protocol::Sftp}) {
        const auto dest = factory.Open(Endpoint(protocol, 21), "/in/data.bin");
        const auto caps = dest->Capabilities();
        EXPECT_TRUE(caps.append);
        EXPECT_FALSE(caps.offset_writes);
    }
}

TEST(CurlDestinationTest, RefusedConnectionIsRetryable) {
    CurlGlobal curl;
    auto endpoint = Endpoint(Protocol::Ftp, 1);
    endpoint.host = "127.0.0.1";
    CurlDestination dest(endpoint, "/in/data.bin", 2s);

    try {
        dest.Connect();
        FAIL() << "connect to a closed port succeeded";
    } catch (const FerryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DestinationUnreachable);
        EXPECT_TRUE(e.retryable());
    }
}
