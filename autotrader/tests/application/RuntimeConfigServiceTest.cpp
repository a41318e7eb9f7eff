#include <gtest/gtest.h>

#include "application/RuntimeConfigService.hpp"
#include "mocks/InMemoryRepositories.hpp"

using namespace autotrader;
using namespace autotrader::application;
using namespace autotrader::tests;
using json = nlohmann::json;

// ============================================================================
// Test Fixture
// ============================================================================

class RuntimeConfigServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        domain::TradingConfig base;
        base.trading.maxPositions = 5;
        repository_ = std::make_shared<InMemoryRuntimeConfigRepository>();
        service_ = std::make_unique<RuntimeConfigService>(
            repository_, std::make_shared<settings::TradingSettings>(base));
    }

    std::shared_ptr<InMemoryRuntimeConfigRepository> repository_;
    std::unique_ptr<RuntimeConfigService> service_;
};

// ============================================================================
// ТЕСТЫ
// ============================================================================

TEST_F(RuntimeConfigServiceTest, EmptyOverlayKeepsBase) {
    EXPECT_EQ(service_->effectiveConfig().trading.maxPositions, 5);
}

TEST_F(RuntimeConfigServiceTest, ReplaceStoresNormalisedDocument) {
    json doc = json{{"overrides", {{"trading", {{"max_positions", 3}}}}}};

    auto stored = service_->replace(doc);

    EXPECT_EQ(repository_->saveCount(), 1);
    EXPECT_EQ(stored["active_strategy"], "Default");
    EXPECT_EQ(repository_->stored(), stored);
    EXPECT_EQ(service_->effectiveConfig().trading.maxPositions, 3);
}

TEST_F(RuntimeConfigServiceTest, InvalidDocumentIsNotSaved) {
    json doc = json{{"overrides", {{"trading", {{"leverage", 2}}}}}};

    EXPECT_THROW(service_->replace(doc), domain::RuntimeConfigError);
    EXPECT_EQ(repository_->saveCount(), 0);
    EXPECT_EQ(service_->effectiveConfig().trading.maxPositions, 5);
}

TEST_F(RuntimeConfigServiceTest, StoredInvalidDocumentFailsEffectiveConfig) {
    repository_->setDocument(json{{"schema_version", 2}});

    EXPECT_THROW(service_->effectiveConfig(), domain::RuntimeConfigError);
}

TEST_F(RuntimeConfigServiceTest, LoadFailurePropagates) {
    repository_->setFailure(std::string("connection refused"));

    EXPECT_THROW(service_->document(), domain::RuntimeConfigError);
    EXPECT_THROW(service_->effectiveConfig(), domain::RuntimeConfigError);
}

TEST_F(RuntimeConfigServiceTest, EveryCallRereadsRepository) {
    EXPECT_EQ(service_->effectiveConfig().trading.maxPositions, 5);

    repository_->setDocument(json{{"overrides", {{"trading", {{"max_positions", 7}}}}}});

    EXPECT_EQ(service_->effectiveConfig().trading.maxPositions, 7);
}
