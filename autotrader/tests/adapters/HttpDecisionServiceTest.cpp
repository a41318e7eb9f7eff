#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/decision/HttpDecisionService.hpp"
#include <IHttpClient.hpp>
#include <SimpleResponse.hpp>

using namespace autotrader;
using namespace autotrader::adapters::secondary;
using json = nlohmann::json;
using ::testing::_;

// ============================================================================
// Mocks
// ============================================================================

class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(bool, send, (const IRequest& req, IResponse& res), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class HttpDecisionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockHttpClient_ = std::make_shared<MockHttpClient>();
        settings_ = std::make_shared<settings::DecisionServiceSettings>();
        settings_->setApiKey("sk-test");
        settings_->setMaxRetries(2);
        service_ = std::make_shared<HttpDecisionService>(mockHttpClient_, settings_);
    }

    void TearDown() override {
        // Запрос уходит из отдельного потока, который может пережить тест
        ::testing::Mock::VerifyAndClearExpectations(mockHttpClient_.get());
    }

    static std::string completion(const json& content) {
        return json{{"choices", json::array({{{"message", {{"role", "assistant"},
                                                          {"content", content.dump()}}}}})}}.dump();
    }

    static bool respond(IResponse& res, int status, const std::string& body) {
        auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
        simpleRes.setStatus(status);
        simpleRes.setBody(body);
        return true;
    }

    json shortlistContent() {
        return json{{"decision", "SHORTLIST"}, {"confidence", 0.7}, {"score", 0.8}, {"sentiment", 0.3},
                    {"rationale", "Breakout on volume"}, {"key_factors", {"volume"}}, {"key_risks", {"gap"}}};
    }

    std::shared_ptr<MockHttpClient> mockHttpClient_;
    std::shared_ptr<settings::DecisionServiceSettings> settings_;
    std::shared_ptr<HttpDecisionService> service_;
    domain::AiSection ai_;
};

// ============================================================================
// ТЕСТЫ: запрос
// ============================================================================

TEST_F(HttpDecisionServiceTest, RequestCarriesModelPromptAndPayload) {
    json payload = {{"symbol", "AAPL"}, {"price", 190.5}};
    ai_.model = "gpt-test";

    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([this, payload](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getMethod(), "POST");
            EXPECT_EQ(req.getPath(), "/v1/chat/completions");
            EXPECT_EQ(req.getHeaders().at("Authorization"), "Bearer sk-test");

            json body = json::parse(req.getBody());
            EXPECT_EQ(body["model"], "gpt-test");
            EXPECT_EQ(body["temperature"], 0);
            EXPECT_EQ(body["response_format"]["type"], "json_object");
            EXPECT_EQ(body["messages"][0]["role"], "system");
            EXPECT_EQ(json::parse(body["messages"][1]["content"].get<std::string>()), payload);
            return respond(res, 200, completion(shortlistContent()));
        });

    auto d = service_->shortlist(payload, ai_);

    EXPECT_TRUE(d.isShortlisted());
    EXPECT_DOUBLE_EQ(d.score, 0.8);
    EXPECT_EQ(d.rationale, "Breakout on volume");
}

TEST_F(HttpDecisionServiceTest, BuildRequestUsesKindTokenLimit) {
    auto body = HttpDecisionService::buildRequest(application::DecisionKind::OrderReview, json::object(), ai_);

    EXPECT_EQ(body["max_tokens"], application::DecisionPrompts::maxTokens(application::DecisionKind::OrderReview));
    EXPECT_EQ(body["messages"].size(), 2u);
}

// ============================================================================
// ТЕСТЫ: разбор ответа
// ============================================================================

TEST_F(HttpDecisionServiceTest, ExtractContent) {
    EXPECT_EQ(HttpDecisionService::extractContent(completion(json{{"a", 1}})), "{\"a\":1}");
    EXPECT_THROW(HttpDecisionService::extractContent("not json"), domain::DecisionError);
    EXPECT_THROW(HttpDecisionService::extractContent(R"({"choices": []})"), domain::DecisionError);
    EXPECT_THROW(HttpDecisionService::extractContent(R"({"choices": [{"message": {}}]})"),
                 domain::DecisionError);
}

TEST_F(HttpDecisionServiceTest, InvalidDecisionIsRejected) {
    auto content = shortlistContent();
    content["confidence"] = 3.0;
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([content](const IRequest&, IResponse& res) {
            return respond(res, 200, completion(content));
        });

    EXPECT_THROW(service_->shortlist(json::object(), ai_), domain::DecisionError);
}

TEST_F(HttpDecisionServiceTest, BuySelectionKeepsModelOrder) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse& res) {
            return respond(res, 200, completion(json{{"selected_symbols", {"MSFT", "AAPL"}},
                                                     {"rationale", "best two"}}));
        });

    auto s = service_->selectBuys(json::object(), {"AAPL", "MSFT"}, 2, ai_);

    ASSERT_EQ(s.selectedSymbols.size(), 2u);
    EXPECT_EQ(s.selectedSymbols[0], "MSFT");
    EXPECT_EQ(s.selectedSymbols[1], "AAPL");
}

TEST_F(HttpDecisionServiceTest, BuySelectionRejectsUnknownSymbol) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse& res) {
            return respond(res, 200, completion(json{{"selected_symbols", {"ZZZ"}}, {"rationale", "x"}}));
        });

    EXPECT_THROW(service_->selectBuys(json::object(), {"AAPL"}, 1, ai_), domain::DecisionError);
}

TEST_F(HttpDecisionServiceTest, BuySelectionWithoutCapacitySkipsCall) {
    EXPECT_CALL(*mockHttpClient_, send(_, _)).Times(0);

    EXPECT_TRUE(service_->selectBuys(json::object(), {"AAPL"}, 0, ai_).selectedSymbols.empty());
    EXPECT_TRUE(service_->selectBuys(json::object(), {}, 2, ai_).selectedSymbols.empty());
}

TEST_F(HttpDecisionServiceTest, PositionReview) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse& res) {
            return respond(res, 200, completion(json{{"action", "ADJUST_STOP"}, {"new_stop_loss", 9.5},
                                                     {"confidence", 0.8}, {"rationale", "trail"}}));
        });

    auto d = service_->reviewPosition(json::object(), ai_);

    EXPECT_EQ(d.action, domain::PositionAction::ADJUST_STOP);
    EXPECT_DOUBLE_EQ(*d.newStopLoss, 9.5);
}

// ============================================================================
// ТЕСТЫ: повторы и ошибки
// ============================================================================

TEST_F(HttpDecisionServiceTest, RetriesServerErrors) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse& res) { return respond(res, 503, "busy"); })
        .WillOnce([](const IRequest&, IResponse& res) { return respond(res, 429, "slow down"); })
        .WillOnce([this](const IRequest&, IResponse& res) {
            return respond(res, 200, completion(shortlistContent()));
        });

    EXPECT_TRUE(service_->shortlist(json::object(), ai_).isShortlisted());
}

TEST_F(HttpDecisionServiceTest, RetriesTransportFailures) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse&) { return false; })
        .WillOnce([this](const IRequest&, IResponse& res) {
            return respond(res, 200, completion(shortlistContent()));
        });

    EXPECT_NO_THROW(service_->shortlist(json::object(), ai_));
}

TEST_F(HttpDecisionServiceTest, GivesUpAfterMaxRetries) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .Times(3)
        .WillRepeatedly([](const IRequest&, IResponse& res) { return respond(res, 500, "oops"); });

    try {
        service_->shortlist(json::object(), ai_);
        FAIL() << "Expected DecisionError";
    } catch (const domain::DecisionError& e) {
        EXPECT_EQ(std::string(e.what()), "Decision service unavailable after 3 attempt(s): HTTP 500");
    }
}

TEST_F(HttpDecisionServiceTest, ClientErrorIsNotRetried) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse& res) { return respond(res, 401, "bad key"); });

    try {
        service_->shortlist(json::object(), ai_);
        FAIL() << "Expected DecisionError";
    } catch (const domain::DecisionError& e) {
        EXPECT_EQ(std::string(e.what()), "Decision service returned HTTP 401: bad key");
    }
}

TEST_F(HttpDecisionServiceTest, MissingApiKeyFailsWithoutCall) {
    settings_->setApiKey("");
    EXPECT_CALL(*mockHttpClient_, send(_, _)).Times(0);

    EXPECT_THROW(service_->reviewOrder(json::object(), ai_), domain::DecisionError);
}
