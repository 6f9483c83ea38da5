/**
 * @file OrderServiceTest.cpp
 * @brief Unit tests for OrderService (placement, rollback, cancellation)
 */

#include <gtest/gtest.h>
#include "application/OrderService.hpp"
#include "application/InventoryService.hpp"
#include "application/NotificationService.hpp"
#include "../mocks/InMemoryOrderStore.hpp"
#include "../mocks/InMemoryNotificationRepository.hpp"
#include "../mocks/StubOrderSettings.hpp"
#include <atomic>
#include <limits>
#include <thread>

using namespace marketplace;
using namespace marketplace::application;
using namespace marketplace::tests::mocks;

class OrderServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryOrderStore>();
        notificationRepo_ = std::make_shared<InMemoryNotificationRepository>();
        settings_ = std::make_shared<StubOrderSettings>();

        auto notifications = std::make_shared<NotificationService>(notificationRepo_);
        auto inventory = std::make_shared<InventoryService>(store_, notifications, settings_);
        orderService_ = std::make_shared<OrderService>(store_, inventory, notifications, settings_);

        store_->addVendor("vendor-1", "user-vendor-1", std::string("5.00"));
        store_->addProduct("prod-a", "vendor-1", "Tissu wax", 10);
        store_->addProduct("prod-b", "vendor-1", "Beurre de karité", 5);
    }

    static domain::DraftOrder draft(const std::string& subtotal, const std::string& total,
                                    const std::string& deliveryFee = "0.00") {
        domain::DraftOrder d;
        d.vendorId = "vendor-1";
        d.customerId = "customer-1";
        d.subtotal = subtotal;
        d.deliveryFee = deliveryFee;
        d.totalAmount = total;
        return d;
    }

    static domain::OrderLineRequest line(const std::string& productId, int64_t quantity,
                                         const std::string& unitPrice) {
        domain::OrderLineRequest l;
        l.productId = productId;
        l.requestedQuantity = quantity;
        l.unitPrice = unitPrice;
        return l;
    }

    std::shared_ptr<InMemoryOrderStore> store_;
    std::shared_ptr<InMemoryNotificationRepository> notificationRepo_;
    std::shared_ptr<StubOrderSettings> settings_;
    std::shared_ptr<OrderService> orderService_;
};

// ============================================================================
// PLACE ORDER TESTS
// ============================================================================

TEST_F(OrderServiceTest, PlaceOrder_DecrementsStockAndSnapshotsCommission) {
    auto order = orderService_->placeOrder(draft("3000.00", "3000.00"),
                                           {line("prod-a", 3, "1000.00")});

    EXPECT_FALSE(order.id.empty());
    EXPECT_EQ(order.status, domain::OrderStatus::PENDING);
    EXPECT_EQ(order.paymentStatus, "pending");
    EXPECT_EQ(order.subtotal.toString(), "3000.00");
    EXPECT_EQ(order.commission.rateFixed(), "5.00");
    EXPECT_EQ(order.commission.commissionAmountFixed(), "150.00");
    EXPECT_EQ(order.commission.vendorEarningsFixed(), "2850.00");
    EXPECT_EQ(order.commission.platformRevenueFixed(), "150.00");

    EXPECT_EQ(store_->product("prod-a").quantity, 7);

    auto items = orderService_->getOrderItems(order.id);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].quantity, 3);
    EXPECT_EQ(items[0].unitPrice.toString(), "1000.00");
    EXPECT_EQ(items[0].totalPrice.toString(), "3000.00");
}

TEST_F(OrderServiceTest, PlaceOrder_OrderNumberFormat) {
    auto first = orderService_->placeOrder(draft("100.00", "100.00"), {line("prod-a", 1, "100.00")});
    auto second = orderService_->placeOrder(draft("100.00", "100.00"), {line("prod-a", 1, "100.00")});

    int year = domain::Timestamp::now().year();
    EXPECT_EQ(first.orderNumber, "ZK-" + std::to_string(year) + "-000001");
    EXPECT_EQ(second.orderNumber, "ZK-" + std::to_string(year) + "-000002");
}

TEST_F(OrderServiceTest, PlaceOrder_CommissionIgnoresDeliveryFee) {
    auto order = orderService_->placeOrder(draft("1000.00", "1500.00", "500.00"),
                                           {line("prod-a", 1, "1000.00")});

    EXPECT_EQ(order.totalAmount.toString(), "1500.00");
    EXPECT_EQ(order.commission.commissionAmountFixed(), "50.00");
    EXPECT_EQ(order.commission.vendorEarningsFixed(), "950.00");
}

TEST_F(OrderServiceTest, PlaceOrder_VendorWithoutRateUsesDefault) {
    store_->setVendorRate("vendor-1", std::nullopt);
    settings_->defaultCommissionRate = domain::Decimal(10);

    auto order = orderService_->placeOrder(draft("200.00", "200.00"), {line("prod-a", 1, "200.00")});

    EXPECT_EQ(order.commission.rateFixed(), "10.00");
    EXPECT_EQ(order.commission.commissionAmountFixed(), "20.00");
}

TEST_F(OrderServiceTest, PlaceOrder_RateChangeDoesNotAffectPlacedOrder) {
    auto order = orderService_->placeOrder(draft("3000.00", "3000.00"), {line("prod-a", 2, "1500.00")});

    store_->setVendorRate("vendor-1", std::string("20.00"));

    auto reloaded = orderService_->getOrder(order.id);
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded->commission.rateFixed(), "5.00");
    EXPECT_EQ(reloaded->commission.commissionAmountFixed(), "150.00");
}

TEST_F(OrderServiceTest, PlaceOrder_UntrackedProductNotDecremented) {
    store_->addProduct("prod-digital", "vendor-1", "Carte cadeau", 0, false);

    auto order = orderService_->placeOrder(draft("5000.00", "5000.00"),
                                           {line("prod-digital", 50, "100.00")});

    EXPECT_FALSE(order.id.empty());
    EXPECT_EQ(store_->product("prod-digital").quantity, 0);
}

TEST_F(OrderServiceTest, PlaceOrder_InsufficientStock_NothingWritten) {
    store_->addProduct("prod-b", "vendor-1", "Beurre de karité", 2);

    try {
        orderService_->placeOrder(draft("5000.00", "5000.00"), {line("prod-b", 5, "1000.00")});
        FAIL() << "Expected InsufficientStockException";
    } catch (const domain::InsufficientStockException& e) {
        EXPECT_EQ(e.productId(), "prod-b");
        EXPECT_EQ(e.productName(), "Beurre de karité");
        EXPECT_EQ(e.available(), 2);
        EXPECT_EQ(e.requested(), 5);
        EXPECT_NE(std::string(e.what()).find("Available: 2, Requested: 5"), std::string::npos);
    }

    EXPECT_EQ(store_->orderCount(), 0u);
    EXPECT_EQ(store_->itemCount(), 0u);
    EXPECT_EQ(store_->product("prod-b").quantity, 2);
}

TEST_F(OrderServiceTest, PlaceOrder_OneLineShort_WholeOrderRejected) {
    EXPECT_THROW(orderService_->placeOrder(draft("7000.00", "7000.00"),
                                           {line("prod-a", 1, "1000.00"), line("prod-b", 6, "1000.00")}),
                 domain::InsufficientStockException);

    EXPECT_EQ(store_->orderCount(), 0u);
    EXPECT_EQ(store_->itemCount(), 0u);
    EXPECT_EQ(store_->product("prod-a").quantity, 10);
    EXPECT_EQ(store_->product("prod-b").quantity, 5);
}

TEST_F(OrderServiceTest, PlaceOrder_ProductNotFound) {
    try {
        orderService_->placeOrder(draft("100.00", "100.00"), {line("prod-missing", 1, "100.00")});
        FAIL() << "Expected ProductNotFoundException";
    } catch (const domain::ProductNotFoundException& e) {
        EXPECT_EQ(e.productId(), "prod-missing");
    }
    EXPECT_EQ(store_->orderCount(), 0u);
}

TEST_F(OrderServiceTest, PlaceOrder_VendorNotFound_IsIntegrityError) {
    auto d = draft("100.00", "100.00");
    d.vendorId = "vendor-ghost";

    EXPECT_THROW(orderService_->placeOrder(d, {line("prod-a", 1, "100.00")}),
                 domain::VendorNotFoundException);
    EXPECT_EQ(store_->orderCount(), 0u);
    EXPECT_EQ(store_->product("prod-a").quantity, 10);
}

TEST_F(OrderServiceTest, PlaceOrder_InvalidVendorRate_IsIntegrityError) {
    store_->setVendorRate("vendor-1", std::string("150.00"));

    EXPECT_THROW(orderService_->placeOrder(draft("100.00", "100.00"), {line("prod-a", 1, "100.00")}),
                 domain::OrderIntegrityException);
    EXPECT_EQ(store_->product("prod-a").quantity, 10);
}

TEST_F(OrderServiceTest, PlaceOrder_TotalMismatch_Rejected) {
    EXPECT_THROW(orderService_->placeOrder(draft("1000.00", "1200.00"), {line("prod-a", 1, "1000.00")}),
                 domain::InvalidOrderException);
    EXPECT_EQ(store_->commitCount(), 0);
}

TEST_F(OrderServiceTest, PlaceOrder_TotalMismatch_AllowedWhenValidationDisabled) {
    settings_->validateTotals = false;

    auto order = orderService_->placeOrder(draft("1000.00", "1200.00"), {line("prod-a", 1, "1000.00")});
    EXPECT_EQ(order.totalAmount.toString(), "1200.00");
}

TEST_F(OrderServiceTest, PlaceOrder_InvalidInput_Rejected) {
    EXPECT_THROW(orderService_->placeOrder(draft("100.00", "100.00"), {}),
                 domain::InvalidOrderException);
    EXPECT_THROW(orderService_->placeOrder(draft("100.00", "100.00"), {line("prod-a", 0, "100.00")}),
                 domain::InvalidOrderException);
    EXPECT_THROW(orderService_->placeOrder(draft("100.00", "100.00"), {line("prod-a", -1, "100.00")}),
                 domain::InvalidOrderException);
    EXPECT_THROW(orderService_->placeOrder(draft("abc", "100.00"), {line("prod-a", 1, "100.00")}),
                 domain::InvalidOrderException);
    EXPECT_THROW(orderService_->placeOrder(draft("100.00", "100.00"), {line("prod-a", 1, "-5")}),
                 domain::InvalidOrderException);

    auto noCustomer = draft("100.00", "100.00");
    noCustomer.customerId.clear();
    EXPECT_THROW(orderService_->placeOrder(noCustomer, {line("prod-a", 1, "100.00")}),
                 domain::InvalidOrderException);

    EXPECT_EQ(store_->product("prod-a").quantity, 10);
}

TEST_F(OrderServiceTest, PlaceOrder_DuplicateProductLinesMerged) {
    // 3 + 3 > 5: проверяется суммарное количество, а не каждая строка
    EXPECT_THROW(orderService_->placeOrder(draft("600.00", "600.00"),
                                           {line("prod-b", 3, "100.00"), line("prod-b", 3, "100.00")}),
                 domain::InsufficientStockException);
    EXPECT_EQ(store_->product("prod-b").quantity, 5);

    auto order = orderService_->placeOrder(draft("400.00", "400.00"),
                                           {line("prod-b", 2, "100.00"), line("prod-b", 2, "100.00")});
    EXPECT_EQ(store_->product("prod-b").quantity, 1);
    EXPECT_EQ(orderService_->getOrderItems(order.id).size(), 2u);
}

TEST_F(OrderServiceTest, PlaceOrder_MergedQuantityOverflow_Rejected) {
    EXPECT_THROW(orderService_->placeOrder(draft("100.00", "100.00"),
                                           {line("prod-a", std::numeric_limits<int64_t>::max(), "0.00"),
                                            line("prod-a", 2, "0.00")}),
                 domain::InvalidOrderException);

    EXPECT_EQ(store_->orderCount(), 0u);
    EXPECT_EQ(store_->product("prod-a").quantity, 10);
}

TEST_F(OrderServiceTest, PlaceOrder_SameRequestIdReturnsExistingOrder) {
    auto d = draft("300.00", "300.00");
    d.requestId = "req-42";

    auto first = orderService_->placeOrder(d, {line("prod-a", 3, "100.00")});
    auto second = orderService_->placeOrder(d, {line("prod-a", 3, "100.00")});

    EXPECT_EQ(second.id, first.id);
    EXPECT_EQ(second.orderNumber, first.orderNumber);
    EXPECT_EQ(store_->orderCount(), 1u);
    EXPECT_EQ(store_->itemCount(), 1u);
    EXPECT_EQ(store_->product("prod-a").quantity, 7);

    d.requestId = "req-43";
    auto third = orderService_->placeOrder(d, {line("prod-a", 3, "100.00")});
    EXPECT_NE(third.id, first.id);
    EXPECT_EQ(store_->product("prod-a").quantity, 4);
}

TEST_F(OrderServiceTest, PlaceOrder_FailureAfterInsert_RollsBackEverything) {
    store_->failOn("insertOrderItems");

    EXPECT_THROW(orderService_->placeOrder(draft("100.00", "100.00"), {line("prod-a", 1, "100.00")}),
                 std::runtime_error);

    EXPECT_EQ(store_->orderCount(), 0u);
    EXPECT_EQ(store_->itemCount(), 0u);
    EXPECT_EQ(store_->product("prod-a").quantity, 10);
}

TEST_F(OrderServiceTest, PlaceOrder_ConditionalDecrementFails_RollsBack) {
    store_->simulateStockRace("prod-b");

    EXPECT_THROW(orderService_->placeOrder(draft("200.00", "200.00"),
                                           {line("prod-a", 1, "100.00"), line("prod-b", 1, "100.00")}),
                 domain::InsufficientStockException);

    EXPECT_EQ(store_->orderCount(), 0u);
    EXPECT_EQ(store_->product("prod-a").quantity, 10);
}

TEST_F(OrderServiceTest, PlaceOrder_ItemTotalRoundedHalfUp) {
    auto order = orderService_->placeOrder(draft("3.36", "3.36"), {line("prod-a", 3, "1.115")});

    auto items = orderService_->getOrderItems(order.id);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].unitPrice.toString(), "1.12");
    EXPECT_EQ(items[0].totalPrice.toString(), "3.36");
}

// ============================================================================
// LOW STOCK NOTIFICATIONS
// ============================================================================

TEST_F(OrderServiceTest, PlaceOrder_LowStockNotifiesVendor) {
    orderService_->placeOrder(draft("300.00", "300.00"), {line("prod-b", 3, "100.00")});

    auto notifications = notificationRepo_->all();
    ASSERT_EQ(notifications.size(), 1u);
    EXPECT_EQ(notifications[0].userId, "user-vendor-1");
    EXPECT_EQ(notifications[0].type, domain::NotificationType::LOW_STOCK);
    EXPECT_EQ(notifications[0].data["stockQuantity"], 2);
    EXPECT_EQ(notifications[0].data["productName"], "Beurre de karité");
}

TEST_F(OrderServiceTest, PlaceOrder_SoldOutDoesNotNotify) {
    orderService_->placeOrder(draft("500.00", "500.00"), {line("prod-b", 5, "100.00")});

    EXPECT_EQ(store_->product("prod-b").quantity, 0);
    EXPECT_EQ(notificationRepo_->size(), 0u);
}

TEST_F(OrderServiceTest, PlaceOrder_NotificationFailureDoesNotFailOrder) {
    notificationRepo_->setFailing(true);

    auto order = orderService_->placeOrder(draft("300.00", "300.00"), {line("prod-b", 3, "100.00")});

    EXPECT_FALSE(order.id.empty());
    EXPECT_EQ(store_->product("prod-b").quantity, 2);
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(OrderServiceTest, PlaceOrder_ConcurrentOrdersNeverOversell) {
    std::atomic<int> placed{0};
    std::atomic<int> rejected{0};

    auto attempt = [&]() {
        try {
            orderService_->placeOrder(draft("400.00", "400.00"), {line("prod-b", 4, "100.00")});
            ++placed;
        } catch (const domain::InsufficientStockException&) {
            ++rejected;
        }
    };

    std::thread t1(attempt);
    std::thread t2(attempt);
    t1.join();
    t2.join();

    EXPECT_EQ(placed.load(), 1);
    EXPECT_EQ(rejected.load(), 1);
    EXPECT_EQ(store_->product("prod-b").quantity, 1);
}

// ============================================================================
// CANCEL ORDER TESTS
// ============================================================================

TEST_F(OrderServiceTest, CancelOrder_RestoresStockOnce) {
    auto order = orderService_->placeOrder(draft("300.00", "300.00"), {line("prod-a", 3, "100.00")});
    EXPECT_EQ(store_->product("prod-a").quantity, 7);

    EXPECT_TRUE(orderService_->cancelOrder(order.id));
    EXPECT_EQ(store_->product("prod-a").quantity, 10);

    auto cancelled = orderService_->getOrder(order.id);
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(cancelled->status, domain::OrderStatus::CANCELLED);
    EXPECT_TRUE(cancelled->isInventoryRestored());

    EXPECT_FALSE(orderService_->cancelOrder(order.id));
    EXPECT_EQ(store_->product("prod-a").quantity, 10);
}

TEST_F(OrderServiceTest, CancelOrder_NotifiesCustomer) {
    auto order = orderService_->placeOrder(draft("100.00", "100.00"), {line("prod-a", 1, "100.00")});

    orderService_->cancelOrder(order.id);

    auto notifications = notificationRepo_->all();
    ASSERT_EQ(notifications.size(), 1u);
    EXPECT_EQ(notifications[0].userId, "customer-1");
    EXPECT_EQ(notifications[0].title, "Commande annulée");
    EXPECT_EQ(notifications[0].message, "Votre commande #" + order.orderNumber + " a été annulée.");
}

TEST_F(OrderServiceTest, CancelOrder_DeliveredRejected) {
    auto order = orderService_->placeOrder(draft("100.00", "100.00"), {line("prod-a", 1, "100.00")});
    {
        auto txn = store_->begin();
        txn->updateOrderStatus(order.id, domain::OrderStatus::DELIVERED);
        txn->commit();
    }

    EXPECT_THROW(orderService_->cancelOrder(order.id), domain::InvalidOrderException);
    EXPECT_EQ(store_->product("prod-a").quantity, 9);
}

TEST_F(OrderServiceTest, CancelOrder_UnknownOrder) {
    EXPECT_THROW(orderService_->cancelOrder("order-missing"), domain::OrderNotFoundException);
}

TEST_F(OrderServiceTest, GetOrder_Unknown_ReturnsNullopt) {
    EXPECT_FALSE(orderService_->getOrder("order-missing").has_value());
    EXPECT_TRUE(orderService_->getOrderItems("order-missing").empty());
}
