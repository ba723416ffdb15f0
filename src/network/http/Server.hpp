#pragma once

#include <boost/asio/io_context.hpp>
#include <memory>

#include "ActiveTransfers.hpp"
#include "config.hpp"

namespace ferry {

/**
 * @brief The `ferryd` intake endpoint: listener, router and I/O threads
 * in front of the transfer registry.
 */
class Server {
   public:
    Server(asio::io_context& io, const ServerConfig& cfg, std::shared_ptr<ActiveTransfers> transfers);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Blocks on the main io_context until Stop().
    void Start();

    // Stops accepting and serving; running transfers are left to ActiveTransfers.
    void Stop();

   private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace ferry
