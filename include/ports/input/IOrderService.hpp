// include/ports/input/IOrderService.hpp
#pragma once

#include "domain/DraftOrder.hpp"
#include "domain/Order.hpp"
#include "domain/OrderItem.hpp"
#include "domain/OrderLineRequest.hpp"
#include <optional>
#include <string>
#include <vector>

namespace marketplace::ports::input {

/**
 * @brief Интерфейс сервиса заказов
 */
class IOrderService {
public:
    virtual ~IOrderService() = default;

    /**
     * @brief Разместить заказ атомарно: проверка и резерв остатков, комиссия, запись
     *
     * @throws domain::ProductNotFoundException товар не найден
     * @throws domain::InsufficientStockException не хватает остатка хотя бы по одной позиции
     * @throws domain::InvalidOrderException некорректный черновик
     * @throws domain::VendorNotFoundException продавец не найден (ошибка целостности)
     */
    virtual domain::Order placeOrder(const domain::DraftOrder& draft,
                                     const std::vector<domain::OrderLineRequest>& lines) = 0;

    /**
     * @brief Отменить заказ и вернуть остатки
     * @return true если остатки возвращены этим вызовом
     */
    virtual bool cancelOrder(const std::string& orderId) = 0;

    virtual std::optional<domain::Order> getOrder(const std::string& orderId) = 0;

    virtual std::vector<domain::OrderItem> getOrderItems(const std::string& orderId) = 0;
};

} // namespace marketplace::ports::input
