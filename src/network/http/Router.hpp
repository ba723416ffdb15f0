#pragma once

#include <memory>
#include <string>

#include <boost/beast/http.hpp>
#include <boost/url/url_view.hpp>

#include "ActiveTransfers.hpp"
#include "ResponseBuilder.hpp"
#include "types.hpp"

namespace ferry {

using req_t = http::request<http::string_body>;

/**
 * @brief Maps intake requests onto the transfer registry.
 *
 * - POST /transfers        -> 202 {transfer_id, state} | 400
 * - GET  /transfers?requested_by=&limit=  -> 200 {transfers, count} | 400
 * - GET  /transfers/{id}   -> 200 record | 404
 */
class Router {
   public:
    explicit Router(std::shared_ptr<ActiveTransfers> transfers);

    void RouteQuery(const req_t& req, res_t& res);

   private:
    void handle_submit(const req_t& req, res_t& res);
    void handle_history(const boost::urls::url_view& url, const req_t& req, res_t& res);
    void handle_status(const std::string& id, const req_t& req, res_t& res);

    std::shared_ptr<ActiveTransfers> transfers_;
};

}  // namespace ferry
