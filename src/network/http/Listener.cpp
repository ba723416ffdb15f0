#include "Listener.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>

#include "HttpSession.hpp"

namespace ferry {

Listener::Listener(asio::io_context& main_ioc, IoContextPool& pool, const tcp::endpoint& endpoint,
                   std::shared_ptr<Router> router)
    : acceptor_(main_ioc, endpoint.protocol()), pool_(pool), router_(std::move(router)) {
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);

    const auto local = acceptor_.local_endpoint();
    spdlog::info("Accepting transfer requests on {}:{}", local.address().to_string(), local.port());
}

void Listener::run() {
    asio::co_spawn(
        acceptor_.get_executor(), [self = shared_from_this()]() { return self->accept_loop(); },
        asio::detached);
}

void Listener::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
}

asio::awaitable<void> Listener::accept_loop() {
    while (acceptor_.is_open()) {
        auto [ec, socket] =
            co_await acceptor_.async_accept(pool_.next(), asio::as_tuple(asio::use_awaitable));
        if (ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor) {
            break;
        }
        if (ec) {
            spdlog::warn("[Listener] Accept failed: {}", ec.message());
            continue;
        }
        ++accepted_;
        std::make_shared<HttpSession>(std::move(socket), router_)->run();
    }
    spdlog::info("[Listener] Stopped after {} connection(s)", accepted_);
}

}  // namespace ferry
