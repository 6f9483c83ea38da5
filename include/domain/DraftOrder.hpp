#pragma once

#include "DeliveryAddress.hpp"
#include <optional>
#include <string>

namespace marketplace::domain {

/**
 * @brief Черновик заказа от API слоя
 *
 * Денежные поля хранятся строками в формате DECIMAL, проверяются до открытия транзакции.
 * totalAmount должен быть равен subtotal + deliveryFee + taxAmount
 * (проверка отключается настройкой ORDER_VALIDATE_TOTALS=false).
 * requestId: ключ идемпотентности команды, повтор с тем же ключом заказ не создаёт.
 */
struct DraftOrder {
    std::optional<std::string> requestId;
    std::string vendorId;
    std::string customerId;
    std::string subtotal;
    std::string deliveryFee = "0.00";
    std::string taxAmount = "0.00";
    std::string totalAmount;
    std::string currency = "XOF";
    std::optional<std::string> paymentMethod;
    std::optional<DeliveryAddress> deliveryAddress;
    std::optional<std::string> deliveryInstructions;
    std::optional<std::string> notes;
};

} // namespace marketplace::domain
