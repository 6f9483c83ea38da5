/**
 * @file NotificationServiceTest.cpp
 * @brief Unit tests for NotificationService
 */

#include <gtest/gtest.h>
#include "application/NotificationService.hpp"
#include "../mocks/InMemoryNotificationRepository.hpp"

using namespace marketplace;
using namespace marketplace::application;
using namespace marketplace::tests::mocks;

class NotificationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<InMemoryNotificationRepository>();
        service_ = std::make_shared<NotificationService>(repository_);
    }

    std::shared_ptr<InMemoryNotificationRepository> repository_;
    std::shared_ptr<NotificationService> service_;
};

TEST_F(NotificationServiceTest, LowStock_PluralMessage) {
    service_->notifyLowStock("user-vendor-1", "Savon noir", 3);

    auto notifications = repository_->all();
    ASSERT_EQ(notifications.size(), 1u);
    EXPECT_EQ(notifications[0].type, domain::NotificationType::LOW_STOCK);
    EXPECT_EQ(notifications[0].title, "Stock faible");
    EXPECT_EQ(notifications[0].message, "Le produit \"Savon noir\" n'a plus que 3 unités en stock.");
    EXPECT_EQ(notifications[0].data["productName"], "Savon noir");
    EXPECT_EQ(notifications[0].data["stockQuantity"], 3);
    EXPECT_FALSE(notifications[0].isRead);
}

TEST_F(NotificationServiceTest, LowStock_SingularMessage) {
    service_->notifyLowStock("user-vendor-1", "Savon noir", 1);

    EXPECT_EQ(repository_->all()[0].message, "Le produit \"Savon noir\" n'a plus que 1 unité en stock.");
}

TEST_F(NotificationServiceTest, OrderStatus_Confirmed) {
    service_->notifyOrderStatus("customer-1", "order-1", domain::OrderStatus::CONFIRMED, "ZK-2025-000042");

    auto notifications = repository_->all();
    ASSERT_EQ(notifications.size(), 1u);
    EXPECT_EQ(notifications[0].type, domain::NotificationType::ORDER_STATUS);
    EXPECT_EQ(notifications[0].title, "Commande confirmée");
    EXPECT_EQ(notifications[0].message, "Votre commande #ZK-2025-000042 a été confirmée par le vendeur.");
    EXPECT_EQ(notifications[0].data["orderId"], "order-1");
    EXPECT_EQ(notifications[0].data["status"], "confirmed");
}

TEST_F(NotificationServiceTest, OrderStatus_PendingHasNoNotification) {
    service_->notifyOrderStatus("customer-1", "order-1", domain::OrderStatus::PENDING, "ZK-2025-000042");

    EXPECT_EQ(repository_->size(), 0u);
}

TEST_F(NotificationServiceTest, RepositoryFailure_Swallowed) {
    repository_->setFailing(true);

    EXPECT_NO_THROW(service_->notifyLowStock("user-vendor-1", "Savon noir", 2));
    EXPECT_NO_THROW(service_->notifyOrderStatus("customer-1", "order-1",
                                                domain::OrderStatus::CANCELLED, "ZK-2025-000042"));
    EXPECT_EQ(repository_->size(), 0u);
}
