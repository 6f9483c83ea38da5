// include/application/OrderService.hpp
#pragma once

#include "ports/input/IOrderService.hpp"
#include "ports/input/IInventoryService.hpp"
#include "ports/input/INotificationService.hpp"
#include "ports/output/IOrderStore.hpp"
#include "settings/IOrderSettings.hpp"
#include "domain/CommissionCalculator.hpp"
#include "domain/DraftOrder.hpp"
#include "domain/Money.hpp"
#include "domain/Order.hpp"
#include "domain/OrderItem.hpp"
#include "domain/OrderLineRequest.hpp"
#include "domain/OrderNumber.hpp"
#include "domain/StockChange.hpp"
#include "domain/Timestamp.hpp"
#include "domain/Vendor.hpp"
#include "domain/exceptions/OrderException.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace marketplace::application {

/**
 * @brief Сервис размещения и отмены заказов
 *
 * placeOrder выполняется в одной транзакции:
 * 1. блокировка строк товаров (FOR UPDATE, id по возрастанию);
 *    если заказ с тем же requestId уже есть, он возвращается без изменений
 * 2. проверка остатков по всем позициям сразу (всё или ничего)
 * 3. ставка продавца → комиссия (только от subtotal)
 * 4. номер заказа из последовательности
 * 5-6. запись заказа и позиций
 * 7. условное списание остатков (quantity >= N)
 * 8. commit; любая ошибка откатывает всё
 * 9. после commit: уведомления о низком остатке (best-effort)
 *
 * cancelOrder: статус cancelled, затем отдельная транзакция
 * InventoryService::restoreInventory (идемпотентна).
 */
class OrderService : public ports::input::IOrderService {
public:
    OrderService(
        std::shared_ptr<ports::output::IOrderStore> store,
        std::shared_ptr<ports::input::IInventoryService> inventory,
        std::shared_ptr<ports::input::INotificationService> notifications,
        std::shared_ptr<settings::IOrderSettings> settings
    ) : store_(std::move(store))
      , inventory_(std::move(inventory))
      , notifications_(std::move(notifications))
      , settings_(std::move(settings))
    {
        std::cout << "[OrderService] Created" << std::endl;
    }

    domain::Order placeOrder(const domain::DraftOrder& draft,
                             const std::vector<domain::OrderLineRequest>& lines) override {
        auto amounts = validateDraft(draft);
        auto requested = validateLines(lines);

        std::vector<std::string> productIds;
        for (const auto& [productId, quantity] : requested) {
            productIds.push_back(productId);
        }

        domain::Order created;
        domain::Vendor vendor;
        std::vector<domain::StockChange> stockChanges;

        {
            auto txn = store_->begin();

            // 1. Все товары существуют (строки заблокированы до конца транзакции)
            std::unordered_map<std::string, domain::Product> products;
            for (auto& product : txn->lockProducts(productIds)) {
                products[product.id] = product;
            }

            // Повторная доставка команды: блокировки товаров сериализуют её с первой попыткой
            if (draft.requestId && !draft.requestId->empty()) {
                auto existing = txn->findOrderByRequestId(*draft.requestId);
                if (existing) {
                    std::cout << "[OrderService] Duplicate request " << *draft.requestId
                              << ", returning existing order " << existing->orderNumber << std::endl;
                    txn->commit();
                    return *existing;
                }
            }

            for (const auto& productId : productIds) {
                if (products.find(productId) == products.end()) {
                    std::cerr << "[OrderService] REJECTED: product " << productId << " not found" << std::endl;
                    throw domain::ProductNotFoundException(productId);
                }
            }

            // 2. Остатков хватает по всем позициям
            for (const auto& [productId, quantity] : requested) {
                const auto& product = products.at(productId);
                if (!product.canFulfil(quantity)) {
                    std::cout << "[OrderService] REJECTED: insufficient stock for \"" << product.name
                              << "\" available=" << product.quantity << " requested=" << quantity << std::endl;
                    throw domain::InsufficientStockException(productId, product.name, product.quantity, quantity);
                }
            }

            // 3. Комиссия по ставке продавца на момент продажи
            auto foundVendor = txn->findVendor(draft.vendorId);
            if (!foundVendor) {
                std::cerr << "[OrderService] ERROR: vendor " << draft.vendorId
                          << " not found for customer " << draft.customerId << std::endl;
                throw domain::VendorNotFoundException(draft.vendorId);
            }
            vendor = *foundVendor;

            auto split = domain::CommissionCalculator::computeSplit(
                amounts.subtotal,
                domain::CommissionCalculator::parseRate(vendor.commissionRate),
                settings_->getDefaultCommissionRate());

            // 4. Номер заказа
            auto now = domain::Timestamp::now();
            std::string orderNumber = domain::OrderNumber::format(
                settings_->getOrderNumberPrefix(), now.year(), txn->nextOrderSequence());

            logCommission(orderNumber, amounts, split);

            // 5. Заказ
            created = txn->insertOrder(buildOrder(draft, amounts, split, orderNumber, now));

            // 6. Позиции
            std::vector<domain::OrderItem> items;
            for (const auto& line : lines) {
                domain::OrderItem item;
                item.orderId = created.id;
                item.productId = line.productId;
                item.quantity = line.requestedQuantity;
                item.unitPrice = domain::Money(domain::Money::roundMoney(line.unitPrice), draft.currency);
                item.totalPrice = domain::Money(
                    domain::Money::roundMoney(item.unitPrice.amount * line.requestedQuantity), draft.currency);
                items.push_back(item);
            }
            txn->insertOrderItems(items);

            // 7. Списание остатков
            for (const auto& [productId, quantity] : requested) {
                const auto& product = products.at(productId);
                if (!product.trackQuantity) {
                    continue;
                }

                auto after = txn->decrementStock(productId, quantity);
                if (!after) {
                    std::cout << "[OrderService] REJECTED: stock for \"" << product.name
                              << "\" changed concurrently" << std::endl;
                    throw domain::InsufficientStockException(productId, product.name, product.quantity, quantity);
                }

                stockChanges.push_back({productId, product.name, product.vendorId, product.quantity, *after});
                std::cout << "[OrderService] Reserved " << quantity << " units of product " << productId
                          << " for order " << orderNumber << std::endl;
            }

            // 8. Commit
            txn->commit();
        }

        std::cout << "[OrderService] Created order " << created.orderNumber
                  << " with commission tracking" << std::endl;

        // 9. После commit, вне атомарной операции
        notifyLowStock(vendor, stockChanges);

        return created;
    }

    bool cancelOrder(const std::string& orderId) override {
        domain::Order order;
        bool transitioned = false;

        {
            auto txn = store_->begin();
            auto found = txn->lockOrder(orderId);
            if (!found) {
                throw domain::OrderNotFoundException(orderId);
            }
            if (found->status == domain::OrderStatus::DELIVERED) {
                throw domain::InvalidOrderException(
                    "Delivered order " + found->orderNumber + " cannot be cancelled");
            }
            if (!found->isCancelled()) {
                txn->updateOrderStatus(orderId, domain::OrderStatus::CANCELLED);
                transitioned = true;
            }
            txn->commit();
            order = *found;
        }

        if (transitioned) {
            std::cout << "[OrderService] Order " << order.orderNumber << " cancelled" << std::endl;
        }

        bool restored = inventory_->restoreInventory(orderId);

        if (transitioned) {
            notifications_->notifyOrderStatus(order.customerId, order.id,
                                              domain::OrderStatus::CANCELLED, order.orderNumber);
        }

        return restored;
    }

    std::optional<domain::Order> getOrder(const std::string& orderId) override {
        return store_->findOrder(orderId);
    }

    std::vector<domain::OrderItem> getOrderItems(const std::string& orderId) override {
        return store_->findOrderItems(orderId);
    }

private:
    struct DraftAmounts {
        domain::Decimal subtotal;
        domain::Decimal deliveryFee;
        domain::Decimal taxAmount;
        domain::Decimal totalAmount;
    };

    std::shared_ptr<ports::output::IOrderStore> store_;
    std::shared_ptr<ports::input::IInventoryService> inventory_;
    std::shared_ptr<ports::input::INotificationService> notifications_;
    std::shared_ptr<settings::IOrderSettings> settings_;

    static domain::Decimal requireAmount(const std::string& field, const std::string& value,
                                         bool emptyIsZero) {
        if (value.empty() && emptyIsZero) {
            return domain::Decimal(0);
        }
        if (!domain::Money::isValidMoneyAmount(value)) {
            throw domain::InvalidOrderException("Invalid " + field + ": '" + value + "'");
        }
        return domain::Money::roundMoney(value);
    }

    DraftAmounts validateDraft(const domain::DraftOrder& draft) const {
        if (draft.vendorId.empty()) {
            throw domain::InvalidOrderException("Missing vendor id");
        }
        if (draft.customerId.empty()) {
            throw domain::InvalidOrderException("Missing customer id");
        }

        DraftAmounts amounts;
        amounts.subtotal = requireAmount("subtotal", draft.subtotal, false);
        amounts.deliveryFee = requireAmount("delivery fee", draft.deliveryFee, true);
        amounts.taxAmount = requireAmount("tax amount", draft.taxAmount, true);
        amounts.totalAmount = requireAmount("total amount", draft.totalAmount, false);

        if (settings_->shouldValidateTotals()) {
            auto expected = amounts.subtotal + amounts.deliveryFee + amounts.taxAmount;
            if (expected != amounts.totalAmount) {
                throw domain::InvalidOrderException(
                    "Total amount " + domain::Money::toFixed(amounts.totalAmount) +
                    " does not match subtotal + delivery fee + tax = " + domain::Money::toFixed(expected));
            }
        }
        return amounts;
    }

    /**
     * @brief Количество на товар (повторяющиеся товары суммируются), id по возрастанию
     */
    static std::map<std::string, int64_t> validateLines(const std::vector<domain::OrderLineRequest>& lines) {
        if (lines.empty()) {
            throw domain::InvalidOrderException("Order has no line items");
        }

        std::map<std::string, int64_t> requested;
        for (const auto& line : lines) {
            if (line.productId.empty()) {
                throw domain::InvalidOrderException("Line item without product id");
            }
            if (line.requestedQuantity <= 0) {
                throw domain::InvalidOrderException(
                    "Invalid quantity " + std::to_string(line.requestedQuantity) +
                    " for product " + line.productId);
            }
            if (!domain::Money::isValidMoneyAmount(line.unitPrice)) {
                throw domain::InvalidOrderException(
                    "Invalid unit price '" + line.unitPrice + "' for product " + line.productId);
            }
            auto& total = requested[line.productId];
            if (line.requestedQuantity > std::numeric_limits<int64_t>::max() - total) {
                throw domain::InvalidOrderException(
                    "Requested quantity overflow for product " + line.productId);
            }
            total += line.requestedQuantity;
        }
        return requested;
    }

    static domain::Order buildOrder(const domain::DraftOrder& draft, const DraftAmounts& amounts,
                                    const domain::CommissionSplit& split, const std::string& orderNumber,
                                    const domain::Timestamp& now) {
        domain::Order order;
        order.orderNumber = orderNumber;
        if (draft.requestId && !draft.requestId->empty()) {
            order.requestId = draft.requestId;
        }
        order.vendorId = draft.vendorId;
        order.customerId = draft.customerId;
        order.status = domain::OrderStatus::PENDING;
        order.currency = draft.currency;
        order.subtotal = domain::Money(amounts.subtotal, draft.currency);
        order.deliveryFee = domain::Money(amounts.deliveryFee, draft.currency);
        order.taxAmount = domain::Money(amounts.taxAmount, draft.currency);
        order.totalAmount = domain::Money(amounts.totalAmount, draft.currency);
        order.commission = split;
        order.paymentMethod = draft.paymentMethod;
        order.paymentStatus = "pending";
        order.deliveryAddress = draft.deliveryAddress;
        order.deliveryInstructions = draft.deliveryInstructions;
        order.notes = draft.notes;
        order.createdAt = now;
        order.updatedAt = now;
        return order;
    }

    static void logCommission(const std::string& orderNumber, const DraftAmounts& amounts,
                              const domain::CommissionSplit& split) {
        nlohmann::json breakdown;
        breakdown["subtotal"] = domain::Money::toFixed(amounts.subtotal);
        breakdown["commissionRate"] = split.rateFixed() + "%";
        breakdown["commissionAmount"] = split.commissionAmountFixed();
        breakdown["vendorEarnings"] = split.vendorEarningsFixed();
        breakdown["platformRevenue"] = split.platformRevenueFixed();
        breakdown["deliveryFee"] = domain::Money::toFixed(amounts.deliveryFee);
        breakdown["taxAmount"] = domain::Money::toFixed(amounts.taxAmount);
        breakdown["totalAmount"] = domain::Money::toFixed(amounts.totalAmount);

        std::cout << "[OrderService] Order " << orderNumber << " commission breakdown: "
                  << breakdown.dump() << std::endl;
    }

    void notifyLowStock(const domain::Vendor& vendor, const std::vector<domain::StockChange>& changes) {
        for (const auto& change : changes) {
            if (!domain::isLowStock(change.quantityAfter, settings_->getLowStockThreshold())) {
                continue;
            }
            try {
                std::string vendorUserId = vendor.userId;
                if (change.vendorId != vendor.id) {
                    auto owner = store_->findVendor(change.vendorId);
                    if (!owner) {
                        std::cerr << "[OrderService] Vendor " << change.vendorId
                                  << " not found, low stock notification skipped" << std::endl;
                        continue;
                    }
                    vendorUserId = owner->userId;
                }
                notifications_->notifyLowStock(vendorUserId, change.productName, change.quantityAfter);
            } catch (const std::exception& e) {
                std::cerr << "[OrderService] Error creating low stock notification: " << e.what() << std::endl;
            }
        }
    }
};

} // namespace marketplace::application
