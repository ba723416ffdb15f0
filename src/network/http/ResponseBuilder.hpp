#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/version.hpp>
#include <boost/json.hpp>
#include <string>
#include <string_view>

#include "types.hpp"

namespace ferry {

using res_t = http::response<http::string_body>;

/**
 * @brief JSON response helpers for the intake API. All responses carry CORS headers.
 */
class ResponseBuilder {
   private:
    static void set_standard_headers(res_t& res) {
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
        res.set(http::field::access_control_max_age, "3600");
    }

   public:
    static void make_json_response(res_t& res, http::status status, const json::value& val,
                                   unsigned int version, bool keep_alive) {
        res.result(status);
        res.version(version);
        res.keep_alive(keep_alive);

        set_standard_headers(res);
        res.set(http::field::content_type, "application/json");

        res.body() = json::serialize(val);
        res.prepare_payload();
    }

    // 202 {transfer_id, state}
    static void build_accepted_response(res_t& res, const std::string& transfer_id,
                                        std::string_view state, unsigned int version,
                                        bool keep_alive = false) {
        json::object body;
        body["transfer_id"] = transfer_id;
        body["state"] = state;
        make_json_response(res, http::status::accepted, body, version, keep_alive);
    }

    // {status: "error", kind, message}
    static void build_error_response(res_t& res, std::string_view kind,
                                     const std::string& error_message, unsigned int version,
                                     bool keep_alive = false,
                                     http::status status = http::status::bad_request) {
        json::object body;
        body["status"] = "error";
        body["kind"] = kind;
        body["message"] = error_message;
        make_json_response(res, status, body, version, keep_alive);
    }

    static void build_options_response(res_t& res, unsigned int version, bool keep_alive = true) {
        res.version(version);
        res.keep_alive(keep_alive);
        res.result(http::status::ok);

        set_standard_headers(res);
        res.set(http::field::content_type, "text/plain");
        res.body() = "OK";
        res.prepare_payload();
    }
};

}  // namespace ferry
