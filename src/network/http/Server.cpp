#include "Server.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/ip/address.hpp>

#include "IoContextPool.hpp"
#include "Listener.hpp"
#include "Router.hpp"
#include "types.hpp"

namespace ferry {

struct Server::Impl {
    asio::io_context& main_io_;
    IoContextPool io_pool_;
    std::shared_ptr<ActiveTransfers> transfers_;
    std::shared_ptr<Listener> listener_;

    Impl(asio::io_context& io, const ServerConfig& cfg, std::shared_ptr<ActiveTransfers> transfers)
        : main_io_(io), io_pool_(cfg.threads), transfers_(std::move(transfers)) {
        const tcp::endpoint endpoint{asio::ip::make_address(cfg.address), cfg.port};
        listener_ = std::make_shared<Listener>(main_io_, io_pool_, endpoint,
                                               std::make_shared<Router>(transfers_));
        spdlog::info("Intake server ready ({} I/O thread(s), {} transfer thread(s))",
                     io_pool_.size(), cfg.transfer_threads);
    }

    void Start() {
        io_pool_.run();
        listener_->run();
        main_io_.run();
    }

    void Stop() {
        spdlog::info("Stopping intake server ({} running transfer(s))", transfers_->size());
        listener_->stop();
        io_pool_.stop();
        main_io_.stop();
    }
};

Server::Server(asio::io_context& io, const ServerConfig& cfg,
               std::shared_ptr<ActiveTransfers> transfers)
    : pImpl_(std::make_unique<Impl>(io, cfg, std::move(transfers))) {}

Server::~Server() = default;

void Server::Start() { pImpl_->Start(); }
void Server::Stop() { pImpl_->Stop(); }

}  // namespace ferry
