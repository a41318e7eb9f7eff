#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/RuntimeConfigHandler.hpp"
#include "mocks/MockServices.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace autotrader;
using namespace autotrader::adapters::primary;
using namespace autotrader::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using json = nlohmann::json;

// ============================================================================
// Test Fixture
// ============================================================================

class RuntimeConfigHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockConfig_ = std::make_shared<MockRuntimeConfigService>();
        handler_ = std::make_unique<RuntimeConfigHandler>(mockConfig_);
    }

    SimpleRequest createRequest(const std::string& method, const std::string& body = "") {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath("/api/v1/runtime-config");
        req.setBody(body);
        return req;
    }

    std::shared_ptr<MockRuntimeConfigService> mockConfig_;
    std::unique_ptr<RuntimeConfigHandler> handler_;
};

// ============================================================================
// ТЕСТЫ: GET
// ============================================================================

TEST_F(RuntimeConfigHandlerTest, GetReturnsDocument) {
    EXPECT_CALL(*mockConfig_, document()).WillOnce(Return(domain::defaultRuntimeConfigDocument()));

    auto req = createRequest("GET");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(json::parse(res.getBody()), domain::defaultRuntimeConfigDocument());
}

TEST_F(RuntimeConfigHandlerTest, GetStorageFailure_Returns500) {
    EXPECT_CALL(*mockConfig_, document())
        .WillOnce(Throw(domain::RuntimeConfigError("connection refused")));

    auto req = createRequest("GET");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
    EXPECT_EQ(json::parse(res.getBody())["error"], "Runtime config unavailable: connection refused");
}

// ============================================================================
// ТЕСТЫ: PUT
// ============================================================================

TEST_F(RuntimeConfigHandlerTest, PutReturnsStoredDocument) {
    json doc = {{"overrides", {{"trading", {{"max_positions", 3}}}}}};
    json stored = domain::defaultRuntimeConfigDocument();
    stored["overrides"] = doc["overrides"];
    EXPECT_CALL(*mockConfig_, replace(doc)).WillOnce(Return(stored));

    auto req = createRequest("PUT", doc.dump());
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(json::parse(res.getBody())["overrides"]["trading"]["max_positions"], 3);
}

TEST_F(RuntimeConfigHandlerTest, PutInvalidDocument_Returns400) {
    EXPECT_CALL(*mockConfig_, replace(_))
        .WillOnce(Throw(domain::RuntimeConfigError("Unsupported override key: trading.leverage")));

    auto req = createRequest("PUT", R"({"overrides": {"trading": {"leverage": 2}}})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(json::parse(res.getBody())["error"], "Unsupported override key: trading.leverage");
}

TEST_F(RuntimeConfigHandlerTest, PutMalformedJson_Returns400) {
    EXPECT_CALL(*mockConfig_, replace(_)).Times(0);

    auto req = createRequest("PUT", "{not json");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(RuntimeConfigHandlerTest, PutStorageFailure_Returns500) {
    EXPECT_CALL(*mockConfig_, replace(_)).WillOnce(Throw(std::runtime_error("disk full")));

    auto req = createRequest("PUT", "{}");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}

TEST_F(RuntimeConfigHandlerTest, WrongMethod_Returns405) {
    auto req = createRequest("POST", "{}");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}
