#include "S3ObjectSource.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/http.hpp>
#include <charconv>
#include <cstring>
#include <optional>

#include "Errors.hpp"
#include "S3RequestFactory.hpp"

namespace ferry {

namespace {

// Runs the io_context until the operation behind `fut` completes and returns its result.
template <typename Future>
auto Complete(asio::io_context& ioc, Future fut) {
    ioc.restart();
    ioc.run();
    return fut.get();
}

/**
 * @brief One signed request on one connection, up to the response headers.
 */
class S3Exchange {
   public:
    S3Exchange(const S3Config& cfg, std::chrono::seconds timeout)
        : cfg_(cfg), timeout_(timeout), resolver_(ioc_), stream_(ioc_) {}

    ~S3Exchange() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    S3Exchange(const S3Exchange&) = delete;
    S3Exchange& operator=(const S3Exchange&) = delete;

    // Sends the request and parses the headers. Body bytes that arrived with the
    // headers stay in buffer_.
    const http::response_parser<http::empty_body>::value_type& Send(
        http::request<http::empty_body>& req, bool head) {
        stream_.expires_after(timeout_);
        auto results = Complete(ioc_, resolver_.async_resolve(cfg_.host, cfg_.port, asio::use_future));
        stream_.expires_after(timeout_);
        Complete(ioc_, stream_.async_connect(results, asio::use_future));

        stream_.expires_after(timeout_);
        Complete(ioc_, http::async_write(stream_, req, asio::use_future));

        parser_.emplace();
        parser_->body_limit(boost::none);
        parser_->skip(head);
        stream_.expires_after(timeout_);
        Complete(ioc_, http::async_read_header(stream_, buffer_, *parser_, asio::use_future));
        return parser_->get();
    }

    // Drains the error document of a non-2xx response.
    std::string ReadErrorBody() {
        http::response_parser<http::string_body> error_parser(std::move(*parser_));
        parser_.reset();
        try {
            stream_.expires_after(timeout_);
            Complete(ioc_, http::async_read(stream_, buffer_, error_parser, asio::use_future));
        } catch (const boost::system::system_error& e) {
            return fmt::format("<unreadable error body: {}>", e.what());
        }
        return error_parser.get().body();
    }

    std::size_t ReadSome(std::span<std::uint8_t> out) {
        if (buffer_.size() > 0) {
            const auto n = asio::buffer_copy(asio::buffer(out.data(), out.size()), buffer_.data());
            buffer_.consume(n);
            return n;
        }
        stream_.expires_after(timeout_);
        try {
            return Complete(ioc_, stream_.async_read_some(asio::buffer(out.data(), out.size()),
                                                          asio::use_future));
        } catch (const boost::system::system_error& e) {
            if (e.code() == asio::error::eof) return 0;
            throw;
        }
    }

   private:
    const S3Config& cfg_;
    std::chrono::seconds timeout_;
    asio::io_context ioc_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::response_parser<http::empty_body>> parser_;
};

[[noreturn]] void ThrowForStatus(unsigned status, const SourceLocation& location,
                                 const std::string& detail) {
    const auto what = fmt::format("{}/{}: HTTP {} {}", location.container, location.object_key,
                                  status, detail);
    if (status == 404) {
        throw FerryError(ErrorCode::SourceNotFound, "source object not found: " + what);
    }
    if (status == 401 || status == 403) {
        throw FerryError(ErrorCode::AuthenticationRejected, "object store denied access: " + what);
    }
    throw FerryError(ErrorCode::SourceUnreadable, "object store request failed: " + what);
}

/**
 * @brief Streams the body of one ranged GET. Reads stop at the range end so
 * trailing bytes on the socket are never handed out.
 */
class S3RangeReader final : public IObjectReader {
   public:
    S3RangeReader(std::unique_ptr<S3Exchange> exchange, std::uint64_t expected)
        : exchange_(std::move(exchange)), remaining_(expected), expected_(expected) {}

    std::size_t Read(std::span<std::uint8_t> out) override {
        if (remaining_ == 0 || out.empty()) return 0;
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(out.size(), remaining_));
        std::size_t n = 0;
        try {
            n = exchange_->ReadSome(out.first(want));
        } catch (const boost::system::system_error& e) {
            throw FerryError(ErrorCode::SourceUnreadable,
                             fmt::format("object read failed after {} of {} bytes: {}",
                                         expected_ - remaining_, expected_, e.what()));
        }
        if (n == 0) {
            throw FerryError(ErrorCode::SourceUnreadable,
                             fmt::format("object store closed the connection after {} of {} bytes",
                                         expected_ - remaining_, expected_));
        }
        remaining_ -= n;
        return n;
    }

   private:
    std::unique_ptr<S3Exchange> exchange_;
    std::uint64_t remaining_;
    std::uint64_t expected_;
};

class EmptyReader final : public IObjectReader {
   public:
    std::size_t Read(std::span<std::uint8_t>) override { return 0; }
};

}  // namespace

ObjectMetadata ParseObjectMetadata(const http::fields& headers) {
    ObjectMetadata meta;
    auto length = headers.find(http::field::content_length);
    if (length == headers.end()) {
        throw FerryError(ErrorCode::SourceUnreadable, "HEAD response without Content-Length");
    }
    const auto value = length->value();
    const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), meta.size);
    if (value.empty() || ec != std::errc{} || end != value.data() + value.size()) {
        throw FerryError(ErrorCode::SourceUnreadable,
                         fmt::format("malformed Content-Length '{}'", std::string_view(value)));
    }
    if (auto etag = headers.find(http::field::etag); etag != headers.end()) {
        meta.etag = std::string(etag->value());
    }
    return meta;
}

// -------- S3ObjectSource --------

S3ObjectSource::S3ObjectSource(S3Config cfg, Credentials credentials, std::shared_ptr<Clock> clock,
                               std::chrono::seconds io_timeout)
    : cfg_(std::move(cfg)),
      credentials_(std::move(credentials)),
      clock_(std::move(clock)),
      io_timeout_(io_timeout) {}

ObjectMetadata S3ObjectSource::Stat(const SourceLocation& location) {
    const auto now = std::chrono::system_clock::to_time_t(clock_->Now());
    auto req = S3RequestFactory::CreateSignedRequest(cfg_, credentials_, http::verb::head,
                                                     location, std::nullopt, now);
    S3Exchange exchange(cfg_, io_timeout_);
    try {
        const auto& res = exchange.Send(req, true);
        if (res.result() != http::status::ok) {
            ThrowForStatus(res.result_int(), location, "");
        }

        auto meta = ParseObjectMetadata(res);
        spdlog::debug("[S3] {}/{}: {} bytes, etag {}", location.container, location.object_key,
                      meta.size, meta.etag);
        return meta;
    } catch (const boost::system::system_error& e) {
        throw FerryError(ErrorCode::SourceUnreadable,
                         fmt::format("HEAD {}/{} failed: {}", location.container,
                                     location.object_key, e.what()));
    }
}

std::unique_ptr<IObjectReader> S3ObjectSource::OpenRange(const SourceLocation& location,
                                                         std::uint64_t offset,
                                                         std::uint64_t length) {
    if (length == 0) {
        return std::make_unique<EmptyReader>();
    }

    const auto now = std::chrono::system_clock::to_time_t(clock_->Now());
    auto req = S3RequestFactory::CreateSignedRequest(
        cfg_, credentials_, http::verb::get, location,
        S3RequestFactory::ByteRange{offset, length}, now);

    auto exchange = std::make_unique<S3Exchange>(cfg_, io_timeout_);
    try {
        const auto& res = exchange->Send(req, false);
        const auto status = res.result();
        if (status != http::status::partial_content && status != http::status::ok) {
            const auto code = res.result_int();
            ThrowForStatus(code, location, exchange->ReadErrorBody());
        }
        if (status == http::status::ok && offset != 0) {
            throw FerryError(ErrorCode::SourceUnreadable, "object store ignored the Range header");
        }
    } catch (const boost::system::system_error& e) {
        throw FerryError(ErrorCode::SourceUnreadable,
                         fmt::format("GET {}/{} [{}+{}] failed: {}", location.container,
                                     location.object_key, offset, length, e.what()));
    }
    return std::make_unique<S3RangeReader>(std::move(exchange), length);
}

// -------- S3SourceFactory --------

S3SourceFactory::S3SourceFactory(S3Config cfg, std::shared_ptr<Clock> clock,
                                 std::chrono::seconds io_timeout)
    : cfg_(std::move(cfg)), clock_(std::move(clock)), io_timeout_(io_timeout) {}

std::unique_ptr<IObjectSource> S3SourceFactory::Open(const Credentials& credentials) {
    return std::make_unique<S3ObjectSource>(cfg_, credentials, clock_, io_timeout_);
}

}  // namespace ferry
