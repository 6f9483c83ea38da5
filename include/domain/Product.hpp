#pragma once

#include <string>
#include <cstdint>

namespace marketplace::domain {

/**
 * @brief Товар (только поля, нужные движку заказов)
 *
 * Если trackQuantity = false, товар всегда доступен и остаток не меняется.
 * Для отслеживаемых товаров сохранённый quantity >= 0.
 */
struct Product {
    std::string id;
    std::string vendorId;
    std::string name;
    int64_t quantity = 0;
    bool trackQuantity = true;

    /**
     * @brief Хватит ли остатка на requested единиц
     */
    bool canFulfil(int64_t requested) const {
        return !trackQuantity || quantity >= requested;
    }
};

/**
 * @brief Остаток мало, но товар ещё есть: 0 < quantity <= threshold
 */
inline bool isLowStock(int64_t quantity, int64_t threshold) {
    return quantity > 0 && quantity <= threshold;
}

} // namespace marketplace::domain
