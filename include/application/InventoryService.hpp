// include/application/InventoryService.hpp
#pragma once

#include "ports/input/IInventoryService.hpp"
#include "ports/input/INotificationService.hpp"
#include "ports/output/IOrderStore.hpp"
#include "settings/IOrderSettings.hpp"
#include "domain/exceptions/OrderException.hpp"
#include "domain/Product.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace marketplace::application {

/**
 * @brief Сервис остатков
 *
 * - restoreInventory: компенсирующая транзакция для отменённого заказа
 * - adjustStock: ручная правка остатка продавцом
 *
 * Оба метода блокируют строки товаров так же, как OrderService
 * (lockProducts, id по возрастанию), поэтому конкурентные изменения
 * одного товара сериализуются.
 */
class InventoryService : public ports::input::IInventoryService {
public:
    InventoryService(
        std::shared_ptr<ports::output::IOrderStore> store,
        std::shared_ptr<ports::input::INotificationService> notifications,
        std::shared_ptr<settings::IOrderSettings> settings
    ) : store_(std::move(store))
      , notifications_(std::move(notifications))
      , settings_(std::move(settings))
    {
        std::cout << "[InventoryService] Created" << std::endl;
    }

    /**
     * @brief Вернуть остатки по всем отслеживаемым позициям заказа
     *
     * Заказ блокируется первым, флаг inventory_restored_at проверяется под
     * блокировкой, поэтому два конкурентных вызова не вернут остаток дважды.
     */
    bool restoreInventory(const std::string& orderId) override {
        auto txn = store_->begin();

        auto order = txn->lockOrder(orderId);
        if (!order) {
            throw domain::OrderNotFoundException(orderId);
        }

        // Остаток активного заказа остаётся зарезервированным
        if (!order->isCancelled()) {
            throw domain::InvalidOrderException(
                "Order " + order->orderNumber + " is " + domain::toString(order->status) +
                ", inventory is restored only for cancelled orders");
        }

        if (order->isInventoryRestored()) {
            std::cout << "[InventoryService] Inventory for order " << order->orderNumber
                      << " already restored, skipping" << std::endl;
            return false;
        }

        // std::map: id по возрастанию, одна строка на товар
        std::map<std::string, int64_t> quantities;
        for (const auto& item : txn->findOrderItems(orderId)) {
            quantities[item.productId] += item.quantity;
        }

        std::vector<std::string> productIds;
        for (const auto& [productId, quantity] : quantities) {
            productIds.push_back(productId);
        }

        std::unordered_map<std::string, domain::Product> products;
        for (auto& product : txn->lockProducts(productIds)) {
            products[product.id] = product;
        }

        for (const auto& [productId, quantity] : quantities) {
            auto it = products.find(productId);
            if (it == products.end()) {
                std::cerr << "[InventoryService] Product " << productId
                          << " no longer exists, cannot restore " << quantity << " units" << std::endl;
                continue;
            }
            if (!it->second.trackQuantity) {
                continue;
            }

            int64_t after = txn->incrementStock(productId, quantity);
            std::cout << "[InventoryService] Restored " << quantity << " units for product \""
                      << it->second.name << "\" (now " << after << ", order cancellation: "
                      << order->orderNumber << ")" << std::endl;
        }

        txn->markInventoryRestored(orderId);
        txn->commit();
        return true;
    }

    domain::Product adjustStock(const std::string& productId, int64_t newQuantity,
                                const std::string& reason) override {
        if (newQuantity < 0) {
            throw domain::InvalidOrderException(
                "Stock quantity cannot be negative: " + std::to_string(newQuantity));
        }

        domain::Product product;
        {
            auto txn = store_->begin();
            auto locked = txn->lockProducts({productId});
            if (locked.empty()) {
                throw domain::ProductNotFoundException(productId);
            }

            product = locked.front();
            txn->setStock(productId, newQuantity);
            txn->commit();
        }

        std::cout << "[InventoryService] Updated stock for product " << productId << ": "
                  << product.quantity << " -> " << newQuantity << " units. Reason: "
                  << (reason.empty() ? "Manual adjustment" : reason) << std::endl;

        product.quantity = newQuantity;
        if (product.trackQuantity && domain::isLowStock(newQuantity, settings_->getLowStockThreshold())) {
            notifyLowStock(product);
        }
        return product;
    }

private:
    std::shared_ptr<ports::output::IOrderStore> store_;
    std::shared_ptr<ports::input::INotificationService> notifications_;
    std::shared_ptr<settings::IOrderSettings> settings_;

    void notifyLowStock(const domain::Product& product) {
        try {
            auto vendor = store_->findVendor(product.vendorId);
            if (!vendor) {
                std::cerr << "[InventoryService] Vendor " << product.vendorId
                          << " not found, low stock notification skipped" << std::endl;
                return;
            }
            notifications_->notifyLowStock(vendor->userId, product.name, product.quantity);
        } catch (const std::exception& e) {
            std::cerr << "[InventoryService] Error creating low stock notification: " << e.what() << std::endl;
        }
    }
};

} // namespace marketplace::application
