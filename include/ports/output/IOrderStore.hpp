// include/ports/output/IOrderStore.hpp
#pragma once

#include "domain/Order.hpp"
#include "domain/OrderItem.hpp"
#include "domain/Product.hpp"
#include "domain/Vendor.hpp"
#include "domain/enums/OrderStatus.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace marketplace::ports::output {

/**
 * @brief Транзакция реляционного хранилища (unit of work)
 *
 * Все изменения видны другим только после commit().
 * Объект, уничтоженный без commit(), откатывает транзакцию (как pqxx::work).
 *
 * Дисциплина блокировок для всех, кто меняет products.quantity:
 * строки товаров блокируются через lockProducts() в порядке возрастания id
 * до любой проверки или изменения остатка.
 *
 * @example
 * ```cpp
 * auto txn = store->begin();
 * auto products = txn->lockProducts({"p-1", "p-2"});
 * auto after = txn->decrementStock("p-1", 3);
 * if (!after) {
 *     return;  // деструктор откатит транзакцию
 * }
 * txn->commit();
 * ```
 */
class IStoreTransaction {
public:
    virtual ~IStoreTransaction() = default;

    /**
     * @brief SELECT ... FOR UPDATE по каждому товару, id по возрастанию
     * @return Найденные товары (отсутствующих в результате нет)
     */
    virtual std::vector<domain::Product> lockProducts(const std::vector<std::string>& productIds) = 0;

    virtual std::optional<domain::Vendor> findVendor(const std::string& vendorId) = 0;

    /**
     * @brief Следующее значение последовательности номеров заказов
     */
    virtual int64_t nextOrderSequence() = 0;

    /**
     * @brief Вставить заказ
     * @return Заказ с присвоенными id и временными метками
     */
    virtual domain::Order insertOrder(const domain::Order& order) = 0;

    virtual void insertOrderItems(const std::vector<domain::OrderItem>& items) = 0;

    /**
     * @brief quantity = quantity - N WHERE quantity >= N
     * @return Новый остаток, nullopt если остатка не хватило (0 затронутых строк)
     */
    virtual std::optional<int64_t> decrementStock(const std::string& productId, int64_t quantity) = 0;

    /**
     * @brief quantity = quantity + N
     * @return Новый остаток
     */
    virtual int64_t incrementStock(const std::string& productId, int64_t quantity) = 0;

    /**
     * @brief Ручная установка остатка
     */
    virtual void setStock(const std::string& productId, int64_t quantity) = 0;

    /**
     * @brief Заказ, ранее созданный командой с этим request_id
     */
    virtual std::optional<domain::Order> findOrderByRequestId(const std::string& requestId) = 0;

    /**
     * @brief SELECT ... FOR UPDATE по заказу
     */
    virtual std::optional<domain::Order> lockOrder(const std::string& orderId) = 0;

    virtual std::vector<domain::OrderItem> findOrderItems(const std::string& orderId) = 0;

    virtual void updateOrderStatus(const std::string& orderId, domain::OrderStatus status) = 0;

    /**
     * @brief Отметить, что остатки по заказу возвращены (inventory_restored_at = NOW())
     */
    virtual void markInventoryRestored(const std::string& orderId) = 0;

    virtual void commit() = 0;
};

/**
 * @brief Транзакционное хранилище заказов, товаров и продавцов
 */
class IOrderStore {
public:
    virtual ~IOrderStore() = default;

    /**
     * @brief Начать транзакцию (минимум read committed)
     */
    virtual std::unique_ptr<IStoreTransaction> begin() = 0;

    virtual std::optional<domain::Order> findOrder(const std::string& orderId) = 0;

    virtual std::vector<domain::OrderItem> findOrderItems(const std::string& orderId) = 0;

    virtual std::optional<domain::Product> findProduct(const std::string& productId) = 0;

    virtual std::optional<domain::Vendor> findVendor(const std::string& vendorId) = 0;
};

} // namespace marketplace::ports::output
