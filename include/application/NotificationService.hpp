// include/application/NotificationService.hpp
#pragma once

#include "ports/input/INotificationService.hpp"
#include "ports/output/INotificationRepository.hpp"
#include "domain/Notification.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <utility>

namespace marketplace::application {

/**
 * @brief Сервис уведомлений продавцов и покупателей
 *
 * Работает вне транзакций заказа: любая ошибка записи логируется
 * и не влияет на результат вызывающей операции.
 */
class NotificationService : public ports::input::INotificationService {
public:
    explicit NotificationService(std::shared_ptr<ports::output::INotificationRepository> repository)
        : repository_(std::move(repository))
    {
        std::cout << "[NotificationService] Created" << std::endl;
    }

    void notifyLowStock(const std::string& vendorUserId, const std::string& productName,
                        int64_t remainingQuantity) override {
        domain::Notification notification;
        notification.userId = vendorUserId;
        notification.type = domain::NotificationType::LOW_STOCK;
        notification.title = "Stock faible";
        notification.message = "Le produit \"" + productName + "\" n'a plus que " +
                               std::to_string(remainingQuantity) +
                               (remainingQuantity != 1 ? " unités" : " unité") + " en stock.";
        notification.data = {
            {"productName", productName},
            {"stockQuantity", remainingQuantity}
        };

        if (save(notification)) {
            std::cout << "[NotificationService] Low stock notification for \"" << productName
                      << "\" (" << remainingQuantity << " left) sent to " << vendorUserId << std::endl;
        }
    }

    void notifyOrderStatus(const std::string& userId, const std::string& orderId,
                           domain::OrderStatus status, const std::string& orderNumber) override {
        auto text = statusText(status, orderNumber);
        if (!text) {
            return;
        }

        domain::Notification notification;
        notification.userId = userId;
        notification.type = domain::NotificationType::ORDER_STATUS;
        notification.title = text->first;
        notification.message = text->second;
        notification.data = {
            {"orderId", orderId},
            {"status", domain::toString(status)},
            {"orderNumber", orderNumber}
        };

        if (save(notification)) {
            std::cout << "[NotificationService] Order " << orderNumber << " -> "
                      << domain::toString(status) << " notification sent to " << userId << std::endl;
        }
    }

private:
    std::shared_ptr<ports::output::INotificationRepository> repository_;

    bool save(const domain::Notification& notification) {
        try {
            repository_->save(notification);
            return true;
        } catch (const std::exception& e) {
            std::cerr << "[NotificationService] Failed to create " << domain::toString(notification.type)
                      << " notification for " << notification.userId << ": " << e.what() << std::endl;
            return false;
        }
    }

    using StatusText = std::pair<std::string, std::string>;

    static std::optional<StatusText> statusText(
        domain::OrderStatus status, const std::string& orderNumber)
    {
        const std::string ref = "Votre commande #" + orderNumber;
        switch (status) {
            case domain::OrderStatus::CONFIRMED:
                return StatusText("Commande confirmée", ref + " a été confirmée par le vendeur.");
            case domain::OrderStatus::PREPARING:
                return StatusText("Commande en préparation", ref + " est en cours de préparation.");
            case domain::OrderStatus::READY_FOR_PICKUP:
                return StatusText("Commande prête", ref + " est prête pour la livraison.");
            case domain::OrderStatus::IN_TRANSIT:
                return StatusText("Commande en transit", ref + " est en cours de livraison.");
            case domain::OrderStatus::DELIVERED:
                return StatusText("Commande livrée", ref + " a été livrée avec succès.");
            case domain::OrderStatus::CANCELLED:
                return StatusText("Commande annulée", ref + " a été annulée.");
            default:
                return std::nullopt;
        }
    }
};

} // namespace marketplace::application
