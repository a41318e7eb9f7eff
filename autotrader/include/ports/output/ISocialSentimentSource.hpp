#pragma once

#include "domain/MarketContext.hpp"
#include <optional>
#include <string>
#include <vector>

namespace autotrader::ports::output {

/**
 * @brief Последние оценки обсуждений символов в соцсетях
 */
class ISocialSentimentSource {
public:
    virtual ~ISocialSentimentSource() = default;

    virtual std::optional<domain::SocialSentiment> latest(const std::string& symbol) = 0;

    /**
     * @brief Самые обсуждаемые символы последнего снимка
     */
    virtual std::vector<std::string> topSymbols(int limit) = 0;
};

} // namespace autotrader::ports::output
