#include <gtest/gtest.h>

#include <functional>
#include <string>

#include "Errors.hpp"
#include "PlanValidator.hpp"

using namespace ferry;

namespace {

TransferRequest ValidRequest() {
    TransferRequest req;
    req.subject = "alice";
    req.approval_reference = "CHG-0042";
    req.plan.source = {"finance-exports", "2024/q1/ledger.csv"};
    req.plan.destination.protocol = Protocol::Sftp;
    req.plan.destination.host = "sftp.partner.example";
    req.plan.destination.port = 22;
    req.plan.destination.credentials = {"drop", "hunter2", ""};
    req.plan.destination.remote_path = "/inbound/";
    req.plan.requested_by = "alice";
    req.plan.approval_reference = "CHG-0042";
    return req;
}

std::string RejectionOf(const std::function<void(TransferRequest&)>& mutate) {
    auto req = ValidRequest();
    mutate(req);
    try {
        ValidateRequest(req);
    } catch (const FerryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidPlan);
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
        return e.what();
    }
    return {};
}

}  // namespace

TEST(PlanValidatorTest, AcceptsWellFormedRequest) {
    EXPECT_NO_THROW(ValidateRequest(ValidRequest()));
}

TEST(PlanValidatorTest, RequiresIdentityFieldsThatAgree) {
    EXPECT_NE(RejectionOf([](auto& r) { r.subject.clear(); }), "");
    EXPECT_NE(RejectionOf([](auto& r) { r.approval_reference.clear(); }), "");
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.requested_by = "mallory"; }).find("requested_by"),
              std::string::npos);
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.approval_reference = "CHG-0043"; }).find("approval_reference"),
              std::string::npos);
}

TEST(PlanValidatorTest, ChecksContainerNames) {
    EXPECT_EQ(RejectionOf([](auto& r) { r.plan.source.container = "abc"; }), "");
    EXPECT_EQ(RejectionOf([](auto& r) { r.plan.source.container = "logs.2024-archive"; }), "");

    for (const std::string bad : {"ab", "Upper", "under_score", "-leading", "trailing.", ""}) {
        EXPECT_NE(RejectionOf([&](auto& r) { r.plan.source.container = bad; }), "") << bad;
    }
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.source.container = std::string(64, 'a'); }), "");
}

TEST(PlanValidatorTest, ChecksObjectKeyLength) {
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.source.object_key.clear(); }), "");
    EXPECT_EQ(RejectionOf([](auto& r) { r.plan.source.object_key = std::string(1024, 'k'); }), "");
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.source.object_key = std::string(1025, 'k'); }), "");
}

TEST(PlanValidatorTest, ChecksDestinationFields) {
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.destination.host.clear(); }), "");
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.destination.host = "bad host"; }), "");
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.destination.host = "host/path"; }), "");
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.destination.port = 0; }), "");
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.destination.credentials.username.clear(); }), "");
}

TEST(PlanValidatorTest, NeedsPasswordOrKey) {
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.destination.credentials.password.clear(); }), "");
    EXPECT_EQ(RejectionOf([](auto& r) {
                  r.plan.destination.credentials.password.clear();
                  r.plan.destination.credentials.private_key_path = "/etc/ferry/id_ed25519";
              }),
              "");
}

TEST(PlanValidatorTest, PrivateKeysOnlyForSftp) {
    EXPECT_NE(RejectionOf([](auto& r) {
                  r.plan.destination.protocol = Protocol::Ftps;
                  r.plan.destination.credentials.private_key_path = "/etc/ferry/id_ed25519";
              }).find("sftp"),
              std::string::npos);
}

TEST(PlanValidatorTest, RejectsParentTraversal) {
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.destination.remote_path = "/in/../etc/passwd"; }), "");
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.destination.remote_path = ".."; }), "");
    EXPECT_NE(RejectionOf([](auto& r) { r.plan.destination.remote_path = ""; }), "");
    EXPECT_EQ(RejectionOf([](auto& r) { r.plan.destination.remote_path = "/in/..data/file"; }), "");
    EXPECT_EQ(RejectionOf([](auto& r) { r.plan.destination.remote_path = "relative/dir/"; }), "");
}

TEST(PlanValidatorTest, DirectoryPathsReceiveObjectBasename) {
    auto plan = ValidRequest().plan;
    EXPECT_EQ(ResolveRemotePath(plan), "/inbound/ledger.csv");

    plan.source.object_key = "flat.bin";
    EXPECT_EQ(ResolveRemotePath(plan), "/inbound/flat.bin");

    plan.destination.remote_path = "/inbound/renamed.bin";
    EXPECT_EQ(ResolveRemotePath(plan), "/inbound/renamed.bin");
}
