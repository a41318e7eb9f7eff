#pragma once

#include "domain/TradeRecord.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace autotrader::ports::output {

class ITradeRepository {
public:
    virtual ~ITradeRepository() = default;

    virtual int64_t insert(const domain::TradeRecord& trade) = 0;

    /**
     * @brief Последняя покупка по символу (для оценки времени входа)
     */
    virtual std::optional<domain::TradeRecord> lastBuy(const std::string& symbol) = 0;
    virtual std::vector<domain::TradeRecord> recent(int limit) = 0;
};

} // namespace autotrader::ports::output
