#pragma once

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <optional>
#include <string>

#include "Router.hpp"
#include "types.hpp"

namespace ferry {

/**
 * @brief Serves intake requests on one keep-alive connection.
 *
 * @details
 * Each request is read whole (plans are small), routed synchronously and
 * answered before the next one is read. An oversized body is answered with
 * 413 and the connection is closed.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
   public:
    HttpSession(tcp::socket&& socket, std::shared_ptr<Router> router);

    void run();

   private:
    asio::awaitable<void> serve();
    asio::awaitable<bool> write(res_t res);
    asio::awaitable<void> close_gracefully();

    res_t dispatch(const req_t& req);
    void close();

    beast::tcp_stream stream_;
    std::shared_ptr<Router> router_;
    beast::flat_buffer buffer_;
    std::string peer_;

    // Re-emplaced per request
    std::optional<http::request_parser<http::string_body>> parser_;
};

}  // namespace ferry
