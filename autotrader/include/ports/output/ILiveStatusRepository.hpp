#pragma once

#include "domain/EventRecord.hpp"
#include <string>

namespace autotrader::ports::output {

class ILiveStatusRepository {
public:
    virtual ~ILiveStatusRepository() = default;

    virtual void update(const std::string& symbol, const std::string& step) = 0;
    virtual domain::LiveStatus get() = 0;
};

} // namespace autotrader::ports::output
