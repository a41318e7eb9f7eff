#pragma once

#include <algorithm>
#include <map>
#include <string>

namespace autotrader::domain {

/**
 * @brief Остаток денежного бюджета по валютам на текущий цикл
 *
 * Только убывает; внутри цикла не пересчитывается.
 */
class BudgetLedger {
public:
    void set(const std::string& currency, double amount) {
        budgets_[currency] = std::max(0.0, amount);
    }

    bool has(const std::string& currency) const {
        return budgets_.count(currency) > 0;
    }

    double remaining(const std::string& currency) const {
        auto it = budgets_.find(currency);
        return it != budgets_.end() ? it->second : 0.0;
    }

    /**
     * @brief Списать сумму; остаток не уходит ниже нуля
     */
    double debit(const std::string& currency, double amount) {
        double& value = budgets_[currency];
        value = std::max(0.0, value - amount);
        return value;
    }

    const std::map<std::string, double>& all() const { return budgets_; }

private:
    std::map<std::string, double> budgets_;
};

} // namespace autotrader::domain
