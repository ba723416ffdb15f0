#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <memory>

#include "IoContextPool.hpp"
#include "Router.hpp"
#include "types.hpp"

namespace ferry {

/**
 * @brief Accepts intake connections on the main io_context and hands each
 * socket to an I/O pool thread.
 */
class Listener : public std::enable_shared_from_this<Listener> {
   public:
    /**
     * @throws boost::system::system_error if the endpoint cannot be bound.
     */
    Listener(asio::io_context& ioc, IoContextPool& pool, const tcp::endpoint& endpoint,
             std::shared_ptr<Router> router);

    void run();

    // Stops accepting. Call on the main io_context thread.
    void stop();

    std::uint64_t accepted() const noexcept { return accepted_; }

   private:
    asio::awaitable<void> accept_loop();

    tcp::acceptor acceptor_;
    IoContextPool& pool_;
    std::shared_ptr<Router> router_;
    std::uint64_t accepted_ = 0;
};

}  // namespace ferry
