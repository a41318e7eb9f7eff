#pragma once

#include "Contract.hpp"
#include "Timestamp.hpp"
#include "enums/OrderAction.hpp"
#include "enums/OrderType.hpp"
#include <optional>
#include <string>

namespace autotrader::domain {

/**
 * @brief Рабочий ордер у брокера
 *
 * parentId == 0 - самостоятельный ордер, иначе нога брекета.
 * Пара защитных ордеров (STP + LMT) одного символа живёт в одной OCA-группе.
 */
struct OpenOrder {
    int orderId = 0;
    Contract contract;
    OrderAction action = OrderAction::BUY;
    OrderType orderType = OrderType::MKT;
    double totalQuantity = 0.0;
    double filled = 0.0;
    double remaining = 0.0;
    std::optional<double> lmtPrice;
    std::optional<double> auxPrice;
    std::string status;
    int parentId = 0;
    std::string ocaGroup;
    int ocaType = 0;
    std::optional<Timestamp> submittedAt;

    /**
     * @brief Цена, по которой ордер сработает (LMT -> лимит, STP -> стоп)
     */
    std::optional<double> orderPrice() const {
        if (orderType == OrderType::LMT) return lmtPrice;
        if (orderType == OrderType::STP) return auxPrice;
        return std::nullopt;
    }
};

} // namespace autotrader::domain
