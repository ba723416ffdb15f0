#include <gtest/gtest.h>

#include "TransferJson.hpp"

using namespace ferry;

namespace {

json::object Envelope() {
    return json::parse(R"({
        "subject": "alice",
        "approval_reference": "REQ-1001",
        "transfer_plan": {
            "source": {"container": "reports", "object_key": "2024/q1.csv"},
            "destination": {
                "protocol": "ssh",
                "host": "sftp.partner.example",
                "credentials": {"username": "drop", "password": "hunter2"},
                "remote_path": "/incoming/"
            }
        }
    })").as_object();
}

}  // namespace

TEST(TransferJsonTest, ParsesEnvelopeWithDefaults) {
    const auto req = ParseTransferRequest(Envelope());
    EXPECT_EQ(req.subject, "alice");
    EXPECT_EQ(req.approval_reference, "REQ-1001");
    EXPECT_EQ(req.plan.source.container, "reports");
    EXPECT_EQ(req.plan.source.object_key, "2024/q1.csv");
    EXPECT_EQ(req.plan.destination.protocol, Protocol::Sftp);
    EXPECT_EQ(req.plan.destination.port, 22);
    EXPECT_EQ(req.plan.destination.credentials.password, "hunter2");
    EXPECT_EQ(req.plan.requested_by, "alice");
    EXPECT_EQ(req.plan.approval_reference, "REQ-1001");
}

TEST(TransferJsonTest, ProtocolAliasesAndExplicitPort) {
    auto env = Envelope();
    auto& dst = env["transfer_plan"].as_object()["destination"].as_object();
    dst["protocol"] = "ftp-tls";
    dst["port"] = 990;
    const auto req = ParseTransferRequest(env);
    EXPECT_EQ(req.plan.destination.protocol, Protocol::Ftps);
    EXPECT_EQ(req.plan.destination.port, 990);

    dst["protocol"] = "FTP";
    dst.erase("port");
    EXPECT_EQ(ParseTransferRequest(env).plan.destination.port, 21);
}

TEST(TransferJsonTest, ShapeErrorsAreInvalidPlan) {
    auto missing = Envelope();
    missing.erase("transfer_plan");
    try {
        ParseTransferRequest(missing);
        FAIL() << "expected InvalidPlan";
    } catch (const FerryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidPlan);
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }

    auto bad_protocol = Envelope();
    bad_protocol["transfer_plan"].as_object()["destination"].as_object()["protocol"] = "scp";
    EXPECT_THROW(ParseTransferRequest(bad_protocol), FerryError);

    auto bad_port = Envelope();
    bad_port["transfer_plan"].as_object()["destination"].as_object()["port"] = 70000;
    EXPECT_THROW(ParseTransferRequest(bad_port), FerryError);

    auto wrong_type = Envelope();
    wrong_type["subject"] = 12;
    EXPECT_THROW(ParseTransferRequest(wrong_type), FerryError);
}

TEST(TransferJsonTest, RecordRoundTripRedactsSecrets) {
    TransferRecord record;
    record.id = "t-1";
    record.plan = ParseTransferRequest(Envelope()).plan;
    record.strategy = StrategyKind::Chunked;
    record.state = TransferState::Failed;
    record.bytes_total = 300;
    record.bytes_transferred = 100;
    record.attempt_count = 3;
    record.session_token = "0123456789abcdef";
    record.started_at = FromEpochMillis(1'700'000'000'000);
    record.completed_at = FromEpochMillis(1'700'000'005'000);
    record.error = FailureInfo{ErrorKind::Transfer, ErrorCode::RetriesExhausted, "reset", 3};
    record.degraded = true;
    record.audit_error = "503";

    const auto text = json::serialize(json::value_from(record));
    EXPECT_EQ(text.find("hunter2"), std::string::npos);
    EXPECT_EQ(text.find("0123456789abcdef"), std::string::npos);

    const auto back = json::value_to<TransferRecord>(json::parse(text));
    EXPECT_EQ(back.id, "t-1");
    EXPECT_EQ(back.state, TransferState::Failed);
    ASSERT_TRUE(back.strategy.has_value());
    EXPECT_EQ(*back.strategy, StrategyKind::Chunked);
    EXPECT_EQ(back.bytes_transferred, 100u);
    EXPECT_EQ(back.plan.destination.host, "sftp.partner.example");
    EXPECT_TRUE(back.plan.destination.credentials.password.empty());
    EXPECT_EQ(back.started_at, record.started_at);
    EXPECT_EQ(back.completed_at, record.completed_at);
    ASSERT_TRUE(back.error.has_value());
    EXPECT_EQ(back.error->code, ErrorCode::RetriesExhausted);
    EXPECT_EQ(back.error->attempt, 3u);
    EXPECT_TRUE(back.degraded);
}

TEST(TransferJsonTest, SessionKeepsCredentials) {
    Session s;
    s.token = "tok";
    s.subject = "alice";
    s.approval_reference = "REQ-1001";
    s.issued_at = FromEpochMillis(1000);
    s.expires_at = FromEpochMillis(11000);
    s.credentials.access_key_id = "ASIA1";
    s.credentials.secret_access_key = "secret";
    s.credentials.scope = "read-only:reports/q1.csv";

    const auto back = json::value_to<Session>(json::value_from(s));
    EXPECT_EQ(back.token, "tok");
    EXPECT_EQ(back.expires_at - back.issued_at, std::chrono::seconds(10));
    EXPECT_EQ(back.credentials.secret_access_key, "secret");
    EXPECT_EQ(back.credentials.scope, "read-only:reports/q1.csv");
}
