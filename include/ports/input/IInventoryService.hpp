#pragma once

#include "domain/Product.hpp"
#include <cstdint>
#include <string>

namespace marketplace::ports::input {

/**
 * @brief Интерфейс сервиса остатков
 */
class IInventoryService {
public:
    virtual ~IInventoryService() = default;

    /**
     * @brief Компенсирующая транзакция: вернуть остатки отменённого заказа
     *
     * Идемпотентна: повторный вызов для того же заказа ничего не меняет.
     * @return true если остатки возвращены этим вызовом
     * @throws domain::OrderNotFoundException
     * @throws domain::InvalidOrderException заказ не в статусе cancelled
     */
    virtual bool restoreInventory(const std::string& orderId) = 0;

    /**
     * @brief Ручная правка остатка продавцом
     * @throws domain::ProductNotFoundException
     * @throws domain::InvalidOrderException отрицательный остаток
     */
    virtual domain::Product adjustStock(const std::string& productId, int64_t newQuantity,
                                        const std::string& reason) = 0;
};

} // namespace marketplace::ports::input
