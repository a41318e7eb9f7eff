#pragma once

#include "Contract.hpp"
#include "OpenOrder.hpp"
#include "enums/OrderAction.hpp"
#include "enums/OrderType.hpp"
#include <optional>
#include <string>

namespace autotrader::domain {

/**
 * @brief Запрос на размещение или изменение ордера
 *
 * orderId == 0 - новый ордер; иначе модификация существующего.
 */
struct OrderRequest {
    int orderId = 0;
    Contract contract;
    OrderAction action = OrderAction::BUY;
    OrderType orderType = OrderType::MKT;
    double quantity = 0.0;
    std::optional<double> lmtPrice;
    std::optional<double> auxPrice;
    int parentId = 0;
    std::string ocaGroup;
    int ocaType = 0;
    bool transmit = true;

    static OrderRequest market(const Contract& c, OrderAction action, double qty) {
        OrderRequest r;
        r.contract = c;
        r.action = action;
        r.orderType = OrderType::MKT;
        r.quantity = qty;
        return r;
    }

    static OrderRequest limit(const Contract& c, OrderAction action, double qty, double price) {
        OrderRequest r = market(c, action, qty);
        r.orderType = OrderType::LMT;
        r.lmtPrice = price;
        return r;
    }

    static OrderRequest stop(const Contract& c, OrderAction action, double qty, double stopPrice) {
        OrderRequest r = market(c, action, qty);
        r.orderType = OrderType::STP;
        r.auxPrice = stopPrice;
        return r;
    }

    /**
     * @brief Запрос на модификацию существующего ордера
     */
    static OrderRequest modify(const OpenOrder& order) {
        OrderRequest r;
        r.orderId = order.orderId;
        r.contract = order.contract;
        r.action = order.action;
        r.orderType = order.orderType;
        r.quantity = order.totalQuantity;
        r.lmtPrice = order.lmtPrice;
        r.auxPrice = order.auxPrice;
        r.parentId = order.parentId;
        r.ocaGroup = order.ocaGroup;
        r.ocaType = order.ocaType;
        return r;
    }
};

/**
 * @brief Ответ брокера на placeOrder
 */
struct PlacedOrder {
    int orderId = 0;
    std::string status;
};

} // namespace autotrader::domain
