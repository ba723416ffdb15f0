#include "Router.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/json.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>
#include <charconv>
#include <string>
#include <string_view>

#include "Errors.hpp"
#include "TransferJson.hpp"

namespace ferry {

namespace {

constexpr std::string_view TRANSFERS_PREFIX = "/transfers";
constexpr std::size_t DEFAULT_HISTORY_LIMIT = 50;
constexpr std::size_t MAX_HISTORY_LIMIT = 500;

}  // namespace

Router::Router(std::shared_ptr<ActiveTransfers> transfers) : transfers_(std::move(transfers)) {}

void Router::RouteQuery(const req_t& req, res_t& res) {
    try {
        auto parsed = boost::urls::parse_origin_form(req.target());
        if (!parsed) {
            ResponseBuilder::build_error_response(res, "ValidationError", "Malformed request target",
                                                  req.version(), req.keep_alive());
            return;
        }
        std::string path = parsed->path();
        while (path.size() > 1 && path.back() == '/') path.pop_back();

        if (req.method() == http::verb::post && path == TRANSFERS_PREFIX) {
            handle_submit(req, res);
        } else if (req.method() == http::verb::get && path == TRANSFERS_PREFIX) {
            handle_history(*parsed, req, res);
        } else if (req.method() == http::verb::get &&
                   path.starts_with(std::string(TRANSFERS_PREFIX) + "/")) {
            handle_status(path.substr(TRANSFERS_PREFIX.size() + 1), req, res);
        } else {
            ResponseBuilder::build_error_response(res, "NotFound", "Route not found", req.version(),
                                                  req.keep_alive(), http::status::not_found);
        }
    } catch (const FerryError& e) {
        spdlog::warn("Rejected request: {}", e.what());
        const auto status = e.kind() == ErrorKind::Validation ? http::status::bad_request
                                                              : http::status::service_unavailable;
        ResponseBuilder::build_error_response(res, ToString(e.kind()), e.what(), req.version(),
                                              req.keep_alive(), status);
    } catch (const std::exception& e) {
        spdlog::error("Routing Error: {}", e.what());
        ResponseBuilder::build_error_response(res, "InternalError", e.what(), req.version(),
                                              req.keep_alive(),
                                              http::status::internal_server_error);
    }
}

void Router::handle_submit(const req_t& req, res_t& res) {
    spdlog::debug("Handling POST /transfers");

    boost::system::error_code jec;
    json::value jv = json::parse(req.body(), jec);
    if (jec) {
        throw FerryError(ErrorCode::InvalidPlan, "Invalid JSON: " + jec.message());
    }
    if (!jv.is_object()) {
        throw FerryError(ErrorCode::InvalidPlan, "JSON root must be an object");
    }

    const auto request = ParseTransferRequest(jv.as_object());
    const auto record = transfers_->Submit(request);

    if (record.error) {
        ResponseBuilder::build_error_response(res, ToString(record.error->kind),
                                              record.error->message, req.version(),
                                              req.keep_alive());
        return;
    }
    ResponseBuilder::build_accepted_response(res, record.id, ToString(record.state), req.version(),
                                             req.keep_alive());
}

void Router::handle_status(const std::string& id, const req_t& req, res_t& res) {
    auto record = transfers_->Get(id);
    if (!record) {
        ResponseBuilder::build_error_response(res, "NotFound", "Unknown transfer: " + id,
                                              req.version(), req.keep_alive(),
                                              http::status::not_found);
        return;
    }
    ResponseBuilder::make_json_response(res, http::status::ok, json::value_from(*record),
                                        req.version(), req.keep_alive());
}

void Router::handle_history(const boost::urls::url_view& url, const req_t& req, res_t& res) {
    const auto params = url.params();

    auto who = params.find("requested_by");
    if (who == params.end() || !(*who).has_value || (*who).value.empty()) {
        throw FerryError(ErrorCode::InvalidPlan, "requested_by query parameter is required");
    }
    const std::string requested_by = (*who).value;

    std::size_t limit = DEFAULT_HISTORY_LIMIT;
    if (auto it = params.find("limit"); it != params.end()) {
        const std::string raw = (*it).value;
        const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), limit);
        if (ec != std::errc{} || end != raw.data() + raw.size() || limit == 0 ||
            limit > MAX_HISTORY_LIMIT) {
            throw FerryError(ErrorCode::InvalidPlan,
                             fmt::format("limit must be between 1 and {}", MAX_HISTORY_LIMIT));
        }
    }
    spdlog::debug("Handling GET /transfers for '{}' (limit {})", requested_by, limit);

    const auto records = transfers_->History(requested_by, limit);
    json::array transfers;
    transfers.reserve(records.size());
    for (const auto& record : records) {
        transfers.push_back(json::value_from(record));
    }
    json::object body;
    body["count"] = transfers.size();
    body["transfers"] = std::move(transfers);
    ResponseBuilder::make_json_response(res, http::status::ok, std::move(body), req.version(),
                                        req.keep_alive());
}

}  // namespace ferry
