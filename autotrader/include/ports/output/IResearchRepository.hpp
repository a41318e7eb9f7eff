#pragma once

#include "domain/ResearchRecord.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace autotrader::ports::output {

/**
 * @brief Журнал исследования кандидатов (research_log)
 */
class IResearchRepository {
public:
    virtual ~IResearchRepository() = default;

    /**
     * @return id вставленной строки
     */
    virtual int64_t insert(const domain::ResearchRecord& record) = 0;
    virtual void updateOutcome(int64_t id, domain::ResearchDecision decision,
                               const std::string& reason) = 0;
    virtual void updateRank(int64_t id, int rank) = 0;
    virtual std::vector<domain::ResearchRecord> recent(int limit) = 0;
};

} // namespace autotrader::ports::output
