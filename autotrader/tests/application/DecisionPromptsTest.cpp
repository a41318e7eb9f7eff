#include <gtest/gtest.h>

#include "application/DecisionPrompts.hpp"

using namespace autotrader;
using namespace autotrader::application;

// ============================================================================
// ТЕСТЫ: system prompts
// ============================================================================

TEST(DecisionPromptsTest, DefaultPromptEndsWithOutputSchema) {
    domain::AiSection ai;
    std::string prompt = DecisionPrompts::systemPrompt(DecisionKind::Shortlist, ai);

    EXPECT_EQ(prompt.rfind(DecisionPrompts::templateFor(DecisionKind::Shortlist), 0), 0u);
    EXPECT_NE(prompt.find("decision: SHORTLIST | SKIP"), std::string::npos);
}

TEST(DecisionPromptsTest, CustomPromptReplacesStrategyButKeepsSchema) {
    domain::AiSection ai;
    ai.positionReviewSystemPrompt = "Be conservative.\nSell early.";
    std::string prompt = DecisionPrompts::systemPrompt(DecisionKind::PositionReview, ai);

    EXPECT_EQ(prompt.rfind("Be conservative.\nSell early.\n=== OUTPUT ===", 0), 0u);
    EXPECT_NE(prompt.find("action: HOLD | SELL | ADJUST_STOP | ADJUST_TP"), std::string::npos);
    EXPECT_EQ(prompt.find("managing an open position"), std::string::npos);
}

TEST(DecisionPromptsTest, BlankCustomPromptFallsBackToDefault) {
    domain::AiSection ai;
    ai.orderReviewSystemPrompt = "  \n\t";
    EXPECT_EQ(DecisionPrompts::systemPrompt(DecisionKind::OrderReview, ai),
              DecisionPrompts::systemPrompt(DecisionKind::OrderReview, domain::AiSection{}));
}

TEST(DecisionPromptsTest, OverridesAreScopedByKind) {
    domain::AiSection ai;
    ai.shortlistSystemPrompt = "Custom shortlist";
    EXPECT_EQ(DecisionPrompts::systemPrompt(DecisionKind::BuySelection, ai).find("Custom shortlist"),
              std::string::npos);
    EXPECT_NE(DecisionPrompts::systemPrompt(DecisionKind::BuySelection, ai).find("selected_symbols"),
              std::string::npos);
}

TEST(DecisionPromptsTest, MaxTokensPerKind) {
    EXPECT_EQ(DecisionPrompts::maxTokens(DecisionKind::Shortlist), 700);
    EXPECT_EQ(DecisionPrompts::maxTokens(DecisionKind::OrderReview), 400);
}
