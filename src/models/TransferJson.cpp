#include "TransferJson.hpp"

#include <algorithm>
#include <string>

namespace ferry {

namespace {

// --- Helpers ---

template <class T>
T require(const json::object& obj, const char* key) {
    if (!obj.contains(key)) {
        throw FerryError(ErrorCode::InvalidPlan, std::string("Missing required key: ") + key);
    }
    try {
        return json::value_to<T>(obj.at(key));
    } catch (const std::exception& e) {
        throw FerryError(ErrorCode::InvalidPlan,
                         std::string("Failed to parse key '") + key + "': " + e.what());
    }
}

template <class T>
T get_or(const json::object& obj, const char* key, T default_val) {
    if (!obj.contains(key) || obj.at(key).is_null()) return default_val;
    return require<T>(obj, key);
}

const json::object& require_object(const json::object& obj, const char* key) {
    if (!obj.contains(key) || !obj.at(key).is_object()) {
        throw FerryError(ErrorCode::InvalidPlan, std::string("Missing object: ") + key);
    }
    return obj.at(key).as_object();
}

std::uint16_t parse_port(const json::object& obj, Protocol protocol) {
    if (!obj.contains("port") || obj.at("port").is_null()) {
        return DefaultPort(protocol);
    }
    const auto& v = obj.at("port");
    std::int64_t port = 0;
    if (v.is_int64()) {
        port = v.as_int64();
    } else if (v.is_uint64()) {
        port = static_cast<std::int64_t>(std::min<std::uint64_t>(v.as_uint64(), 70000));
    } else if (v.is_string()) {
        try {
            port = std::stoll(json::value_to<std::string>(v));
        } catch (const std::exception&) {
            throw FerryError(ErrorCode::InvalidPlan, "Port is not a number");
        }
    } else {
        throw FerryError(ErrorCode::InvalidPlan, "Port must be a number");
    }
    if (port < 1 || port > 65535) {
        throw FerryError(ErrorCode::InvalidPlan, "Port out of range: " + std::to_string(port));
    }
    return static_cast<std::uint16_t>(port);
}

Protocol parse_protocol(const json::object& obj) {
    const auto name = require<std::string>(obj, "protocol");
    auto protocol = ParseProtocol(name);
    if (!protocol) {
        throw FerryError(ErrorCode::InvalidPlan, "Unsupported protocol: " + name);
    }
    return *protocol;
}

}  // namespace

// -------- Credentials --------

void tag_invoke(json::value_from_tag, json::value& jv, const Credentials& c) {
    jv = {
        {"access_key_id", c.access_key_id},
        {"secret_access_key", c.secret_access_key},
        {"session_token", c.session_token},
        {"region", c.region},
        {"scope", c.scope},
        {"expiration", ToEpochMillis(c.expiration)},
    };
}

Credentials tag_invoke(json::value_to_tag<Credentials>, const json::value& jv) {
    const auto& o = jv.as_object();
    Credentials c;
    c.access_key_id = json::value_to<std::string>(o.at("access_key_id"));
    c.secret_access_key = json::value_to<std::string>(o.at("secret_access_key"));
    c.session_token = json::value_to<std::string>(o.at("session_token"));
    c.region = json::value_to<std::string>(o.at("region"));
    c.scope = json::value_to<std::string>(o.at("scope"));
    c.expiration = FromEpochMillis(json::value_to<std::int64_t>(o.at("expiration")));
    return c;
}

// -------- Session --------

void tag_invoke(json::value_from_tag, json::value& jv, const Session& s) {
    jv = {
        {"token", s.token},
        {"subject", s.subject},
        {"approval_reference", s.approval_reference},
        {"issued_at", ToEpochMillis(s.issued_at)},
        {"expires_at", ToEpochMillis(s.expires_at)},
        {"credentials", json::value_from(s.credentials)},
    };
}

Session tag_invoke(json::value_to_tag<Session>, const json::value& jv) {
    const auto& o = jv.as_object();
    Session s;
    s.token = json::value_to<std::string>(o.at("token"));
    s.subject = json::value_to<std::string>(o.at("subject"));
    s.approval_reference = json::value_to<std::string>(o.at("approval_reference"));
    s.issued_at = FromEpochMillis(json::value_to<std::int64_t>(o.at("issued_at")));
    s.expires_at = FromEpochMillis(json::value_to<std::int64_t>(o.at("expires_at")));
    s.credentials = json::value_to<Credentials>(o.at("credentials"));
    return s;
}

// -------- Plan --------

void tag_invoke(json::value_from_tag, json::value& jv, const TransferPlan& p) {
    jv = {
        {"source", {{"container", p.source.container}, {"object_key", p.source.object_key}}},
        {"destination",
         {
             {"protocol", ToString(p.destination.protocol)},
             {"host", p.destination.host},
             {"port", p.destination.port},
             {"credentials", {{"username", p.destination.credentials.username}}},
             {"remote_path", p.destination.remote_path},
         }},
        {"requested_by", p.requested_by},
        {"approval_reference", p.approval_reference},
    };
}

TransferPlan tag_invoke(json::value_to_tag<TransferPlan>, const json::value& jv) {
    if (!jv.is_object()) {
        throw FerryError(ErrorCode::InvalidPlan, "transfer_plan must be a JSON object");
    }
    const auto& o = jv.as_object();
    TransferPlan p;

    const auto& src = require_object(o, "source");
    p.source.container = require<std::string>(src, "container");
    p.source.object_key = require<std::string>(src, "object_key");

    const auto& dst = require_object(o, "destination");
    p.destination.protocol = parse_protocol(dst);
    p.destination.host = require<std::string>(dst, "host");
    p.destination.port = parse_port(dst, p.destination.protocol);
    p.destination.remote_path = require<std::string>(dst, "remote_path");
    if (dst.contains("credentials")) {
        const auto& cred = require_object(dst, "credentials");
        p.destination.credentials.username = get_or<std::string>(cred, "username", "");
        p.destination.credentials.password = get_or<std::string>(cred, "password", "");
        p.destination.credentials.private_key_path = get_or<std::string>(cred, "private_key_path", "");
    }

    p.requested_by = get_or<std::string>(o, "requested_by", "");
    p.approval_reference = get_or<std::string>(o, "approval_reference", "");
    return p;
}

// -------- Record --------

void tag_invoke(json::value_from_tag, json::value& jv, const TransferRecord& r) {
    json::object o;
    o["id"] = r.id;
    o["plan"] = json::value_from(r.plan);
    o["strategy"] = r.strategy ? json::value(ToString(*r.strategy)) : json::value(nullptr);
    o["state"] = ToString(r.state);
    o["bytes_total"] = r.bytes_total;
    o["bytes_transferred"] = r.bytes_transferred;
    o["checksum_expected"] = r.checksum_expected;
    o["checksum_actual"] = r.checksum_actual;
    o["attempt_count"] = r.attempt_count;
    o["session"] = r.session_token.substr(0, 8);
    o["started_at"] = ToEpochMillis(r.started_at);
    o["completed_at"] = r.completed_at ? json::value(ToEpochMillis(*r.completed_at)) : json::value(nullptr);
    if (r.error) {
        o["error"] = {
            {"kind", ToString(r.error->kind)},
            {"code", ToString(r.error->code)},
            {"message", r.error->message},
            {"attempt", r.error->attempt},
            {"summary", r.error->Summary()},
        };
    } else {
        o["error"] = nullptr;
    }
    o["audit_ticket"] = r.audit_ticket;
    o["degraded"] = r.degraded;
    o["audit_error"] = r.audit_error;
    jv = std::move(o);
}

TransferRecord tag_invoke(json::value_to_tag<TransferRecord>, const json::value& jv) {
    const auto& o = jv.as_object();
    TransferRecord r;
    r.id = json::value_to<std::string>(o.at("id"));
    r.plan = json::value_to<TransferPlan>(o.at("plan"));
    if (const auto& s = o.at("strategy"); s.is_string()) {
        r.strategy = ParseStrategy(json::value_to<std::string>(s));
    }
    r.state = ParseState(json::value_to<std::string>(o.at("state"))).value_or(TransferState::Failed);
    r.bytes_total = json::value_to<std::uint64_t>(o.at("bytes_total"));
    r.bytes_transferred = json::value_to<std::uint64_t>(o.at("bytes_transferred"));
    r.checksum_expected = json::value_to<std::string>(o.at("checksum_expected"));
    r.checksum_actual = json::value_to<std::string>(o.at("checksum_actual"));
    r.attempt_count = json::value_to<std::uint32_t>(o.at("attempt_count"));
    r.session_token = json::value_to<std::string>(o.at("session"));
    r.started_at = FromEpochMillis(json::value_to<std::int64_t>(o.at("started_at")));
    if (const auto& c = o.at("completed_at"); !c.is_null()) {
        r.completed_at = FromEpochMillis(json::value_to<std::int64_t>(c));
    }
    if (const auto& e = o.at("error"); e.is_object()) {
        const auto& eo = e.as_object();
        FailureInfo info;
        const auto code = json::value_to<std::string>(eo.at("code"));
        for (int i = 0; i <= static_cast<int>(ErrorCode::NotificationFailed); ++i) {
            if (ToString(static_cast<ErrorCode>(i)) == code) {
                info.code = static_cast<ErrorCode>(i);
                break;
            }
        }
        info.kind = KindOf(info.code);
        info.message = json::value_to<std::string>(eo.at("message"));
        info.attempt = json::value_to<std::uint32_t>(eo.at("attempt"));
        r.error = std::move(info);
    }
    r.audit_ticket = json::value_to<std::string>(o.at("audit_ticket"));
    r.degraded = json::value_to<bool>(o.at("degraded"));
    r.audit_error = json::value_to<std::string>(o.at("audit_error"));
    return r;
}

// -------- Intake --------

TransferRequest ParseTransferRequest(const json::object& o) {
    TransferRequest req;
    req.subject = require<std::string>(o, "subject");
    req.approval_reference = require<std::string>(o, "approval_reference");
    if (!o.contains("transfer_plan")) {
        throw FerryError(ErrorCode::InvalidPlan, "Missing required key: transfer_plan");
    }
    req.plan = json::value_to<TransferPlan>(o.at("transfer_plan"));

    if (req.plan.requested_by.empty()) {
        req.plan.requested_by = req.subject;
    }
    if (req.plan.approval_reference.empty()) {
        req.plan.approval_reference = req.approval_reference;
    }
    return req;
}

}  // namespace ferry
