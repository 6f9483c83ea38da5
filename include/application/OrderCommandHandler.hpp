// include/application/OrderCommandHandler.hpp
#pragma once

#include "ports/input/IOrderService.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "domain/DraftOrder.hpp"
#include "domain/OrderLineRequest.hpp"
#include "domain/exceptions/OrderException.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace marketplace::application {

/**
 * @brief Обработчик команд на размещение/отмену заказов
 *
 * Слушает события из marketplace.events exchange:
 * - order.place → OrderService::placeOrder
 * - order.cancel → OrderService::cancelOrder
 *
 * Публикует результаты:
 * - order.placed → заказ создан (номер и снимок комиссии)
 * - order.rejected → заказ отклонён (code: product_not_found,
 *   insufficient_stock, invalid_order, internal_error)
 * - order.cancelled → заказ отменён
 * - order.cancel_failed → отмена не выполнена
 *
 * Детали ошибок целостности наружу не отдаются, только в лог.
 * Повтор order.place с тем же request_id (повторная доставка брокером)
 * заново публикует order.placed по уже созданному заказу.
 */
class OrderCommandHandler {
public:
    OrderCommandHandler(
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<ports::input::IOrderService> orderService
    ) : eventConsumer_(std::move(eventConsumer))
      , eventPublisher_(std::move(eventPublisher))
      , orderService_(std::move(orderService))
    {
        std::cout << "[OrderCommandHandler] Created" << std::endl;
        subscribe();
    }

    void handleCommand(const std::string& routingKey, const std::string& message) {
        std::cout << "[OrderCommandHandler] Received " << routingKey << std::endl;

        nlohmann::json json;
        try {
            json = nlohmann::json::parse(message);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[OrderCommandHandler] Malformed " << routingKey << ": " << e.what() << std::endl;
            if (routingKey == "order.place") {
                publishRejected(nlohmann::json::object(), "invalid_order", "Malformed JSON payload");
            }
            return;
        }

        if (routingKey == "order.place") {
            handlePlaceOrder(json);
        } else if (routingKey == "order.cancel") {
            handleCancelOrder(json);
        }
    }

private:
    void subscribe() {
        std::cout << "[OrderCommandHandler] Subscribing to order.place, order.cancel" << std::endl;

        eventConsumer_->subscribe(
            {"order.place", "order.cancel"},
            [this](const std::string& routingKey, const std::string& message) {
                handleCommand(routingKey, message);
            }
        );
    }

    void handlePlaceOrder(const nlohmann::json& json) {
        try {
            auto draft = parseDraft(json);
            auto lines = parseLines(json);

            auto order = orderService_->placeOrder(draft, lines);
            publishPlaced(json, order);

        } catch (const domain::InsufficientStockException& e) {
            nlohmann::json details;
            details["product_id"] = e.productId();
            details["product_name"] = e.productName();
            details["available"] = e.available();
            details["requested"] = e.requested();
            publishRejected(json, "insufficient_stock", e.what(), details);
        } catch (const domain::ProductNotFoundException& e) {
            nlohmann::json details;
            details["product_id"] = e.productId();
            publishRejected(json, "product_not_found", e.what(), details);
        } catch (const domain::OrderValidationException& e) {
            publishRejected(json, "invalid_order", e.what());
        } catch (const nlohmann::json::exception& e) {
            publishRejected(json, "invalid_order", std::string("Invalid payload: ") + e.what());
        } catch (const domain::OrderIntegrityException& e) {
            std::cerr << "[OrderCommandHandler] Integrity error: " << e.what() << std::endl;
            publishRejected(json, "internal_error", "Order could not be processed");
        } catch (const std::exception& e) {
            std::cerr << "[OrderCommandHandler] Failed to place order: " << e.what() << std::endl;
            publishRejected(json, "internal_error", "Order could not be processed");
        }
    }

    void handleCancelOrder(const nlohmann::json& json) {
        std::string orderId;
        if (json.contains("order_id") && json.at("order_id").is_string()) {
            orderId = json.at("order_id").get<std::string>();
        }
        if (orderId.empty()) {
            publishCancelFailed(json, "invalid_order", "Missing required field: order_id");
            return;
        }

        try {
            bool restored = orderService_->cancelOrder(orderId);

            nlohmann::json event;
            event["order_id"] = orderId;
            event["status"] = "cancelled";
            event["inventory_restored"] = restored;
            event["timestamp"] = getCurrentTimestamp();
            eventPublisher_->publish("order.cancelled", event.dump());

        } catch (const domain::OrderNotFoundException& e) {
            publishCancelFailed(json, "order_not_found", e.what());
        } catch (const domain::OrderValidationException& e) {
            publishCancelFailed(json, "invalid_order", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[OrderCommandHandler] Failed to cancel order " << orderId << ": " << e.what() << std::endl;
            publishCancelFailed(json, "internal_error", "Order could not be cancelled");
        }
    }

    /**
     * @brief Деньги приходят строкой ("3000.00") или числом (3000)
     */
    static std::string moneyField(const nlohmann::json& json, const std::string& key,
                                  const std::string& defaultValue) {
        if (!json.contains(key) || json.at(key).is_null()) {
            return defaultValue;
        }
        const auto& value = json.at(key);
        if (value.is_string()) {
            return value.get<std::string>();
        }
        if (value.is_number()) {
            return value.dump();
        }
        return "";
    }

    /**
     * @brief Количество только целым числом, дробное или строка отклоняются
     */
    static int64_t quantityField(const nlohmann::json& item, const std::string& productId) {
        if (!item.contains("quantity") || item.at("quantity").is_null()) {
            return 1;
        }
        const auto& value = item.at("quantity");
        if (!value.is_number_integer() ||
            (value.is_number_unsigned() &&
             value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))) {
            throw domain::InvalidOrderException(
                "Invalid quantity " + value.dump() + " for product " + productId);
        }
        return value.get<int64_t>();
    }

    static std::optional<std::string> optionalString(const nlohmann::json& json, const std::string& key) {
        if (!json.contains(key) || !json.at(key).is_string()) {
            return std::nullopt;
        }
        return json.at(key).get<std::string>();
    }

    static domain::DraftOrder parseDraft(const nlohmann::json& json) {
        domain::DraftOrder draft;
        draft.requestId = optionalString(json, "request_id");
        draft.vendorId = json.value("vendor_id", "");
        draft.customerId = json.value("customer_id", "");
        draft.subtotal = moneyField(json, "subtotal", "");
        draft.deliveryFee = moneyField(json, "delivery_fee", "0.00");
        draft.taxAmount = moneyField(json, "tax_amount", "0.00");
        draft.totalAmount = moneyField(json, "total_amount", "");
        draft.currency = json.value("currency", "XOF");
        draft.paymentMethod = optionalString(json, "payment_method");
        draft.deliveryInstructions = optionalString(json, "delivery_instructions");
        draft.notes = optionalString(json, "notes");

        if (json.contains("delivery_address") && json.at("delivery_address").is_object()) {
            const auto& address = json.at("delivery_address");
            domain::DeliveryAddress delivery;
            delivery.street = address.value("street", "");
            delivery.city = address.value("city", "");
            delivery.district = address.value("district", "");
            delivery.phone = address.value("phone", "");
            if (address.contains("latitude") && address.at("latitude").is_number()) {
                delivery.latitude = address.at("latitude").get<double>();
            }
            if (address.contains("longitude") && address.at("longitude").is_number()) {
                delivery.longitude = address.at("longitude").get<double>();
            }
            draft.deliveryAddress = delivery;
        }
        return draft;
    }

    static std::vector<domain::OrderLineRequest> parseLines(const nlohmann::json& json) {
        std::vector<domain::OrderLineRequest> lines;
        if (!json.contains("items") || !json.at("items").is_array()) {
            return lines;
        }
        for (const auto& item : json.at("items")) {
            domain::OrderLineRequest line;
            line.productId = item.value("product_id", "");
            line.requestedQuantity = quantityField(item, line.productId);
            line.unitPrice = moneyField(item, "unit_price", "0.00");
            lines.push_back(line);
        }
        return lines;
    }

    void publishPlaced(const nlohmann::json& command, const domain::Order& order) {
        nlohmann::json event;
        event["request_id"] = optionalString(command, "request_id").value_or("");
        event["order_id"] = order.id;
        event["order_number"] = order.orderNumber;
        event["vendor_id"] = order.vendorId;
        event["customer_id"] = order.customerId;
        event["status"] = domain::toString(order.status);
        event["subtotal"] = order.subtotal.toString();
        event["delivery_fee"] = order.deliveryFee.toString();
        event["tax_amount"] = order.taxAmount.toString();
        event["total_amount"] = order.totalAmount.toString();
        event["currency"] = order.currency;
        event["commission_rate"] = order.commission.rateFixed();
        event["commission_amount"] = order.commission.commissionAmountFixed();
        event["vendor_earnings"] = order.commission.vendorEarningsFixed();
        event["platform_revenue"] = order.commission.platformRevenueFixed();
        event["timestamp"] = getCurrentTimestamp();
        eventPublisher_->publish("order.placed", event.dump());

        std::cout << "[OrderCommandHandler] PLACED order=" << order.orderNumber
                  << " customer=" << order.customerId << std::endl;
    }

    void publishRejected(const nlohmann::json& command, const std::string& code, const std::string& reason,
                         const nlohmann::json& details = nlohmann::json::object()) {
        std::cout << "[OrderCommandHandler] REJECTED code=" << code << " reason=" << reason << std::endl;

        nlohmann::json event = details;
        event["request_id"] = optionalString(command, "request_id").value_or("");
        event["customer_id"] = optionalString(command, "customer_id").value_or("");
        event["status"] = "rejected";
        event["code"] = code;
        event["reason"] = reason;
        event["timestamp"] = getCurrentTimestamp();
        eventPublisher_->publish("order.rejected", event.dump());
    }

    void publishCancelFailed(const nlohmann::json& command, const std::string& code, const std::string& reason) {
        nlohmann::json event;
        event["order_id"] = optionalString(command, "order_id").value_or("");
        event["code"] = code;
        event["reason"] = reason;
        event["timestamp"] = getCurrentTimestamp();
        eventPublisher_->publish("order.cancel_failed", event.dump());
    }

    static int64_t getCurrentTimestamp() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<ports::input::IOrderService> orderService_;
};

} // namespace marketplace::application
