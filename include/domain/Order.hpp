// include/domain/Order.hpp
#pragma once

#include "CommissionSplit.hpp"
#include "DeliveryAddress.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/OrderStatus.hpp"
#include <optional>
#include <string>

namespace marketplace::domain {

/**
 * @brief Заказ одного продавца
 *
 * Поля commission хранят замороженный снимок ставки продавца на момент продажи,
 * от них зависят отчёты, поэтому они никогда не пересчитываются.
 * inventoryRestoredAt выставляется при возврате остатков после отмены
 * и защищает от повторного возврата.
 */
class Order {
public:
    std::string id;
    std::string orderNumber;
    std::optional<std::string> requestId;
    std::string vendorId;
    std::string customerId;
    OrderStatus status = OrderStatus::PENDING;
    Money subtotal;
    Money deliveryFee;
    Money taxAmount;
    Money totalAmount;
    CommissionSplit commission;
    std::string currency = "XOF";
    std::optional<std::string> paymentMethod;
    std::string paymentStatus = "pending";
    std::optional<DeliveryAddress> deliveryAddress;
    std::optional<std::string> deliveryInstructions;
    std::optional<std::string> notes;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<Timestamp> inventoryRestoredAt;

    Order() = default;

    bool isCancelled() const { return status == OrderStatus::CANCELLED; }
    bool isInventoryRestored() const { return inventoryRestoredAt.has_value(); }
};

} // namespace marketplace::domain
