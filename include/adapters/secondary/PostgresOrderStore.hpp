// include/adapters/secondary/PostgresOrderStore.hpp
#pragma once

#include "ports/output/IOrderStore.hpp"
#include "settings/DbSettings.hpp"
#include "domain/Money.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace marketplace::adapters::secondary {

/**
 * @brief Чтение строк products/vendors/orders/order_items в доменные типы
 *
 * Деньги читаются как NUMERIC::text, чтобы не терять точность.
 * Временные метки как EXTRACT(EPOCH ...)::BIGINT.
 */
class PostgresRows {
public:
    static constexpr const char* ORDER_COLUMNS =
        "id, order_number, request_id, vendor_id, customer_id, status, "
        "subtotal::text AS subtotal, delivery_fee::text AS delivery_fee, "
        "tax_amount::text AS tax_amount, total_amount::text AS total_amount, "
        "commission_rate::text AS commission_rate, commission_amount::text AS commission_amount, "
        "vendor_earnings::text AS vendor_earnings, platform_revenue::text AS platform_revenue, "
        "currency, payment_method, payment_status, delivery_address::text AS delivery_address, "
        "delivery_instructions, notes, "
        "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at, "
        "EXTRACT(EPOCH FROM updated_at)::BIGINT AS updated_at, "
        "EXTRACT(EPOCH FROM inventory_restored_at)::BIGINT AS inventory_restored_at ";

    // Валюта позиции берётся из заказа
    static constexpr const char* ITEM_SELECT =
        "oi.id, oi.order_id, oi.product_id, oi.quantity, "
        "oi.unit_price::text AS unit_price, oi.total_price::text AS total_price, "
        "o.currency AS currency "
        "FROM order_items oi JOIN orders o ON o.id = oi.order_id ";

    static domain::Product rowToProduct(const pqxx::row& row) {
        domain::Product product;
        product.id = row["id"].as<std::string>();
        product.vendorId = row["vendor_id"].as<std::string>();
        product.name = row["name"].as<std::string>();
        product.quantity = row["quantity"].as<int64_t>();
        product.trackQuantity = row["track_quantity"].as<bool>();
        return product;
    }

    static domain::Vendor rowToVendor(const pqxx::row& row) {
        domain::Vendor vendor;
        vendor.id = row["id"].as<std::string>();
        vendor.userId = row["user_id"].as<std::string>();
        vendor.businessName = row["business_name"].as<std::string>();
        vendor.commissionRate = optionalString(row["commission_rate"]);
        return vendor;
    }

    static domain::Order rowToOrder(const pqxx::row& row) {
        domain::Order order;
        order.id = row["id"].as<std::string>();
        order.orderNumber = row["order_number"].as<std::string>();
        order.requestId = optionalString(row["request_id"]);
        order.vendorId = row["vendor_id"].as<std::string>();
        order.customerId = row["customer_id"].as<std::string>();
        order.status = domain::parseOrderStatus(row["status"].as<std::string>());
        order.currency = row["currency"].as<std::string>();

        order.subtotal = domain::Money::fromString(row["subtotal"].as<std::string>(), order.currency);
        order.deliveryFee = domain::Money::fromString(row["delivery_fee"].as<std::string>(), order.currency);
        order.taxAmount = domain::Money::fromString(row["tax_amount"].as<std::string>(), order.currency);
        order.totalAmount = domain::Money::fromString(row["total_amount"].as<std::string>(), order.currency);

        order.commission.rate = decimalOrZero(row["commission_rate"]);
        order.commission.commissionAmount = decimalOrZero(row["commission_amount"]);
        order.commission.vendorEarnings = decimalOrZero(row["vendor_earnings"]);
        order.commission.platformRevenue = decimalOrZero(row["platform_revenue"]);

        order.paymentMethod = optionalString(row["payment_method"]);
        order.paymentStatus = row["payment_status"].as<std::string>();
        order.deliveryInstructions = optionalString(row["delivery_instructions"]);
        order.notes = optionalString(row["notes"]);

        if (!row["delivery_address"].is_null()) {
            order.deliveryAddress = addressFromJson(
                nlohmann::json::parse(row["delivery_address"].as<std::string>()));
        }

        order.createdAt = domain::Timestamp::fromEpochSeconds(row["created_at"].as<int64_t>());
        order.updatedAt = domain::Timestamp::fromEpochSeconds(row["updated_at"].as<int64_t>());
        if (!row["inventory_restored_at"].is_null()) {
            order.inventoryRestoredAt =
                domain::Timestamp::fromEpochSeconds(row["inventory_restored_at"].as<int64_t>());
        }
        return order;
    }

    static domain::OrderItem rowToItem(const pqxx::row& row) {
        const auto currency = row["currency"].as<std::string>();
        domain::OrderItem item;
        item.id = row["id"].as<std::string>();
        item.orderId = row["order_id"].as<std::string>();
        item.productId = row["product_id"].as<std::string>();
        item.quantity = row["quantity"].as<int64_t>();
        item.unitPrice = domain::Money::fromString(row["unit_price"].as<std::string>(), currency);
        item.totalPrice = domain::Money::fromString(row["total_price"].as<std::string>(), currency);
        return item;
    }

    static nlohmann::json addressToJson(const domain::DeliveryAddress& address) {
        nlohmann::json json;
        json["street"] = address.street;
        json["city"] = address.city;
        json["district"] = address.district;
        json["phone"] = address.phone;
        if (address.latitude) json["latitude"] = *address.latitude;
        if (address.longitude) json["longitude"] = *address.longitude;
        return json;
    }

    static domain::DeliveryAddress addressFromJson(const nlohmann::json& json) {
        domain::DeliveryAddress address;
        address.street = json.value("street", "");
        address.city = json.value("city", "");
        address.district = json.value("district", "");
        address.phone = json.value("phone", "");
        if (json.contains("latitude") && json["latitude"].is_number()) {
            address.latitude = json["latitude"].get<double>();
        }
        if (json.contains("longitude") && json["longitude"].is_number()) {
            address.longitude = json["longitude"].get<double>();
        }
        return address;
    }

private:
    static std::optional<std::string> optionalString(const pqxx::field& field) {
        if (field.is_null()) {
            return std::nullopt;
        }
        return field.as<std::string>();
    }

    static domain::Decimal decimalOrZero(const pqxx::field& field) {
        if (field.is_null()) {
            return domain::Decimal(0);
        }
        return domain::Money::parseDecimal(field.as<std::string>()).value_or(domain::Decimal(0));
    }
};

/**
 * @brief Транзакция поверх pqxx::work
 *
 * Владеет собственным соединением. Деструктор pqxx::work без commit()
 * делает ROLLBACK, поэтому любое исключение из сервиса откатывает всё.
 */
class PostgresStoreTransaction : public ports::output::IStoreTransaction {
public:
    explicit PostgresStoreTransaction(const std::string& connectionString)
        : conn_(connectionString)
        , txn_(conn_)
    {}

    ~PostgresStoreTransaction() override {
        if (!committed_) {
            std::cout << "[PostgresOrderStore] Transaction rolled back" << std::endl;
        }
    }

    std::vector<domain::Product> lockProducts(const std::vector<std::string>& productIds) override {
        std::vector<std::string> sorted(productIds);
        std::sort(sorted.begin(), sorted.end());
        sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

        // По одной строке в порядке возрастания id: одинаковый порядок блокировок у всех транзакций
        std::vector<domain::Product> products;
        for (const auto& productId : sorted) {
            auto result = txn_.exec_params(
                "SELECT id, vendor_id, name, quantity, track_quantity "
                "FROM products WHERE id = $1 FOR UPDATE",
                productId
            );
            if (!result.empty()) {
                products.push_back(PostgresRows::rowToProduct(result[0]));
            }
        }
        return products;
    }

    std::optional<domain::Vendor> findVendor(const std::string& vendorId) override {
        auto result = txn_.exec_params(
            "SELECT id, user_id, business_name, commission_rate::text AS commission_rate "
            "FROM vendors WHERE id = $1",
            vendorId
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return PostgresRows::rowToVendor(result[0]);
    }

    int64_t nextOrderSequence() override {
        auto result = txn_.exec("SELECT nextval('order_number_seq')");
        return result[0][0].as<int64_t>();
    }

    domain::Order insertOrder(const domain::Order& order) override {
        std::optional<std::string> address;
        if (order.deliveryAddress) {
            address = PostgresRows::addressToJson(*order.deliveryAddress).dump();
        }

        auto result = txn_.exec_params(
            std::string("INSERT INTO orders "
            "(order_number, request_id, vendor_id, customer_id, status, subtotal, delivery_fee, tax_amount, "
            " total_amount, commission_rate, commission_amount, vendor_earnings, platform_revenue, "
            " currency, payment_method, payment_status, delivery_address, delivery_instructions, notes) "
            "VALUES ($1, $2, $3, $4, $5, $6::numeric, $7::numeric, $8::numeric, $9::numeric, "
            "        $10::numeric, $11::numeric, $12::numeric, $13::numeric, "
            "        $14, $15, $16, $17::jsonb, $18, $19) "
            "RETURNING ") + PostgresRows::ORDER_COLUMNS,
            order.orderNumber,
            order.requestId,
            order.vendorId,
            order.customerId,
            domain::toString(order.status),
            order.subtotal.toString(),
            order.deliveryFee.toString(),
            order.taxAmount.toString(),
            order.totalAmount.toString(),
            order.commission.rateFixed(),
            order.commission.commissionAmountFixed(),
            order.commission.vendorEarningsFixed(),
            order.commission.platformRevenueFixed(),
            order.currency,
            order.paymentMethod,
            order.paymentStatus,
            address,
            order.deliveryInstructions,
            order.notes
        );
        return PostgresRows::rowToOrder(result[0]);
    }

    void insertOrderItems(const std::vector<domain::OrderItem>& items) override {
        for (const auto& item : items) {
            txn_.exec_params(
                "INSERT INTO order_items (order_id, product_id, quantity, unit_price, total_price) "
                "VALUES ($1, $2, $3, $4::numeric, $5::numeric)",
                item.orderId,
                item.productId,
                item.quantity,
                item.unitPrice.toString(),
                item.totalPrice.toString()
            );
        }
    }

    std::optional<int64_t> decrementStock(const std::string& productId, int64_t quantity) override {
        // Условное списание: 0 строк значит остатка не хватило
        auto result = txn_.exec_params(
            "UPDATE products SET quantity = quantity - $2, updated_at = NOW() "
            "WHERE id = $1 AND quantity >= $2 "
            "RETURNING quantity",
            productId,
            quantity
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return result[0]["quantity"].as<int64_t>();
    }

    int64_t incrementStock(const std::string& productId, int64_t quantity) override {
        auto result = txn_.exec_params(
            "UPDATE products SET quantity = quantity + $2, updated_at = NOW() "
            "WHERE id = $1 RETURNING quantity",
            productId,
            quantity
        );
        if (result.empty()) {
            throw std::runtime_error("Product " + productId + " disappeared during stock increment");
        }
        return result[0]["quantity"].as<int64_t>();
    }

    void setStock(const std::string& productId, int64_t quantity) override {
        txn_.exec_params(
            "UPDATE products SET quantity = $2, updated_at = NOW() WHERE id = $1",
            productId,
            quantity
        );
    }

    std::optional<domain::Order> findOrderByRequestId(const std::string& requestId) override {
        auto result = txn_.exec_params(
            std::string("SELECT ") + PostgresRows::ORDER_COLUMNS +
            "FROM orders WHERE request_id = $1",
            requestId
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return PostgresRows::rowToOrder(result[0]);
    }

    std::optional<domain::Order> lockOrder(const std::string& orderId) override {
        auto result = txn_.exec_params(
            std::string("SELECT ") + PostgresRows::ORDER_COLUMNS +
            "FROM orders WHERE id = $1 FOR UPDATE",
            orderId
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return PostgresRows::rowToOrder(result[0]);
    }

    std::vector<domain::OrderItem> findOrderItems(const std::string& orderId) override {
        auto result = txn_.exec_params(
            std::string("SELECT ") + PostgresRows::ITEM_SELECT +
            "WHERE oi.order_id = $1 ORDER BY oi.product_id",
            orderId
        );
        std::vector<domain::OrderItem> items;
        for (const auto& row : result) {
            items.push_back(PostgresRows::rowToItem(row));
        }
        return items;
    }

    void updateOrderStatus(const std::string& orderId, domain::OrderStatus status) override {
        txn_.exec_params(
            "UPDATE orders SET status = $2, updated_at = NOW() WHERE id = $1",
            orderId,
            domain::toString(status)
        );
    }

    void markInventoryRestored(const std::string& orderId) override {
        txn_.exec_params(
            "UPDATE orders SET inventory_restored_at = NOW(), updated_at = NOW() WHERE id = $1",
            orderId
        );
    }

    void commit() override {
        txn_.commit();
        committed_ = true;
    }

private:
    pqxx::connection conn_;
    pqxx::work txn_;
    bool committed_ = false;
};

/**
 * @brief PostgreSQL хранилище заказов
 *
 * Таблицы:
 * - products (quantity >= 0, track_quantity)
 * - vendors (commission_rate DECIMAL(5,2), NULL = ставка по умолчанию)
 * - orders (order_number UNIQUE, request_id UNIQUE, снимок комиссии, inventory_restored_at)
 * - order_items
 * - последовательность order_number_seq
 */
class PostgresOrderStore : public ports::output::IOrderStore {
public:
    explicit PostgresOrderStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::unique_ptr<ports::output::IStoreTransaction> begin() override {
        return std::make_unique<PostgresStoreTransaction>(settings_->getConnectionString());
    }

    std::optional<domain::Order> findOrder(const std::string& orderId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string("SELECT ") + PostgresRows::ORDER_COLUMNS + "FROM orders WHERE id = $1",
                orderId
            );
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return PostgresRows::rowToOrder(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderStore] findOrder error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::OrderItem> findOrderItems(const std::string& orderId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string("SELECT ") + PostgresRows::ITEM_SELECT +
                "WHERE oi.order_id = $1 ORDER BY oi.product_id",
                orderId
            );
            txn.commit();

            std::vector<domain::OrderItem> items;
            for (const auto& row : result) {
                items.push_back(PostgresRows::rowToItem(row));
            }
            return items;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderStore] findOrderItems error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Product> findProduct(const std::string& productId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, vendor_id, name, quantity, track_quantity FROM products WHERE id = $1",
                productId
            );
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return PostgresRows::rowToProduct(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderStore] findProduct error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Vendor> findVendor(const std::string& vendorId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, user_id, business_name, commission_rate::text AS commission_rate "
                "FROM vendors WHERE id = $1",
                vendorId
            );
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return PostgresRows::rowToVendor(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderStore] findVendor error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS vendors (
                    id VARCHAR(64) PRIMARY KEY DEFAULT gen_random_uuid()::text,
                    user_id VARCHAR(64) NOT NULL,
                    business_name VARCHAR(255) NOT NULL,
                    commission_rate DECIMAL(5, 2),
                    created_at TIMESTAMP DEFAULT NOW(),
                    updated_at TIMESTAMP DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS products (
                    id VARCHAR(64) PRIMARY KEY DEFAULT gen_random_uuid()::text,
                    vendor_id VARCHAR(64) NOT NULL REFERENCES vendors(id),
                    name VARCHAR(255) NOT NULL,
                    quantity BIGINT NOT NULL DEFAULT 0 CHECK (quantity >= 0),
                    track_quantity BOOLEAN NOT NULL DEFAULT TRUE,
                    created_at TIMESTAMP DEFAULT NOW(),
                    updated_at TIMESTAMP DEFAULT NOW()
                )
            )");

            txn.exec("CREATE SEQUENCE IF NOT EXISTS order_number_seq");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS orders (
                    id VARCHAR(64) PRIMARY KEY DEFAULT gen_random_uuid()::text,
                    order_number VARCHAR(32) NOT NULL UNIQUE,
                    request_id VARCHAR(128) UNIQUE,
                    vendor_id VARCHAR(64) NOT NULL REFERENCES vendors(id),
                    customer_id VARCHAR(64) NOT NULL,
                    status VARCHAR(32) NOT NULL DEFAULT 'pending',
                    subtotal DECIMAL(12, 2) NOT NULL,
                    delivery_fee DECIMAL(12, 2) NOT NULL DEFAULT 0,
                    tax_amount DECIMAL(12, 2) NOT NULL DEFAULT 0,
                    total_amount DECIMAL(12, 2) NOT NULL,
                    commission_rate DECIMAL(5, 2),
                    commission_amount DECIMAL(12, 2),
                    vendor_earnings DECIMAL(12, 2),
                    platform_revenue DECIMAL(12, 2),
                    currency VARCHAR(3) NOT NULL DEFAULT 'XOF',
                    payment_method VARCHAR(32),
                    payment_status VARCHAR(32) NOT NULL DEFAULT 'pending',
                    delivery_address JSONB,
                    delivery_instructions TEXT,
                    notes TEXT,
                    inventory_restored_at TIMESTAMP,
                    created_at TIMESTAMP NOT NULL DEFAULT NOW(),
                    updated_at TIMESTAMP NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec("ALTER TABLE orders ADD COLUMN IF NOT EXISTS request_id VARCHAR(128) UNIQUE");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS order_items (
                    id VARCHAR(64) PRIMARY KEY DEFAULT gen_random_uuid()::text,
                    order_id VARCHAR(64) NOT NULL REFERENCES orders(id) ON DELETE CASCADE,
                    product_id VARCHAR(64) NOT NULL REFERENCES products(id),
                    quantity BIGINT NOT NULL CHECK (quantity > 0),
                    unit_price DECIMAL(12, 2) NOT NULL,
                    total_price DECIMAL(12, 2) NOT NULL,
                    created_at TIMESTAMP DEFAULT NOW()
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_order_items_order_id ON order_items(order_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_orders_customer_id ON orders(customer_id)");

            txn.commit();
            std::cout << "[PostgresOrderStore] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderStore] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace marketplace::adapters::secondary
