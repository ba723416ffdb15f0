#include "HttpSession.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <memory>

#include "config.hpp"

namespace {

constexpr auto REQUEST_TIMEOUT = std::chrono::seconds(15);
constexpr auto DRAIN_TIMEOUT = std::chrono::seconds(1);
constexpr std::size_t MAX_PLAN_BYTES = 64 * ferry::KIB;
constexpr std::size_t DRAIN_BUFFER_SIZE = 1024;

bool is_disconnect(beast::error_code ec) {
    return ec == http::error::end_of_stream || ec == beast::errc::not_connected ||
           ec == asio::error::eof || ec == asio::error::connection_reset ||
           ec == beast::error::timeout;
}

}  // namespace

namespace ferry {

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<Router> router)
    : stream_(std::move(socket)), router_(std::move(router)) {
    beast::error_code ec;
    const auto remote = stream_.socket().remote_endpoint(ec);
    peer_ = ec ? "unknown" : remote.address().to_string() + ":" + std::to_string(remote.port());
}

void HttpSession::run() {
    asio::co_spawn(
        stream_.get_executor(), [self = shared_from_this()]() { return self->serve(); },
        asio::detached);
}

asio::awaitable<void> HttpSession::serve() {
    try {
        for (;;) {
            parser_.emplace();
            parser_->body_limit(MAX_PLAN_BYTES);
            stream_.expires_after(REQUEST_TIMEOUT);

            auto [ec, _] = co_await http::async_read(stream_, buffer_, *parser_,
                                                     asio::as_tuple(asio::use_awaitable));
            if (ec == http::error::body_limit) {
                spdlog::warn("[Http {}] Request body over {} bytes rejected", peer_, MAX_PLAN_BYTES);
                res_t res;
                ResponseBuilder::build_error_response(res, "ValidationError", "Request body too large",
                                                      11, false, http::status::payload_too_large);
                co_await write(std::move(res));
                co_await close_gracefully();
                co_return;
            }
            if (ec) {
                if (!is_disconnect(ec)) {
                    spdlog::warn("[Http {}] Read failed: {}", peer_, ec.message());
                }
                co_await close_gracefully();
                co_return;
            }

            const auto& req = parser_->get();
            const bool keep_alive = req.keep_alive();
            if (!co_await write(dispatch(req)) || !keep_alive) {
                co_await close_gracefully();
                co_return;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[Http {}] Connection aborted: {}", peer_, e.what());
        close();
    }
}

res_t HttpSession::dispatch(const req_t& req) {
    res_t res;
    if (req.method() == http::verb::options) {
        ResponseBuilder::build_options_response(res, req.version(), req.keep_alive());
    } else {
        res.version(req.version());
        res.keep_alive(req.keep_alive());
        router_->RouteQuery(req, res);
    }
    spdlog::debug("[Http {}] {} {} -> {}", peer_, std::string(req.method_string()),
                  std::string(req.target()), res.result_int());
    return res;
}

asio::awaitable<bool> HttpSession::write(res_t res) {
    res.prepare_payload();

    beast::error_code ec;
    stream_.socket().set_option(tcp::no_delay(true), ec);

    auto [ec_write, _] = co_await http::async_write(stream_, res, asio::as_tuple(asio::use_awaitable));
    if (ec_write) {
        if (!is_disconnect(ec_write)) {
            spdlog::warn("[Http {}] Write failed: {}", peer_, ec_write.message());
        }
        co_return false;
    }
    co_return true;
}

asio::awaitable<void> HttpSession::close_gracefully() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);

    // Give the client a moment to read the last response before the close.
    beast::flat_buffer drain;
    stream_.expires_after(DRAIN_TIMEOUT);
    co_await stream_.async_read_some(drain.prepare(DRAIN_BUFFER_SIZE),
                                     asio::as_tuple(asio::use_awaitable));
    close();
}

void HttpSession::close() {
    beast::error_code ec;
    stream_.socket().close(ec);
}

}  // namespace ferry
