// include/domain/exceptions/OrderException.hpp
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace marketplace::domain {

/**
 * @brief Базовое исключение движка заказов
 */
class OrderException : public std::runtime_error {
public:
    explicit OrderException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Ошибки валидации: устаревшая корзина или некорректный запрос
 *
 * Показываются клиенту, заказ целиком отклоняется.
 */
class OrderValidationException : public OrderException {
public:
    explicit OrderValidationException(const std::string& message)
        : OrderException(message) {}
};

/**
 * @brief Ошибки целостности данных
 *
 * Логируются как error и отдаются наружу как внутренняя ошибка сервера.
 */
class OrderIntegrityException : public OrderException {
public:
    explicit OrderIntegrityException(const std::string& message)
        : OrderException(message) {}
};

class ProductNotFoundException : public OrderValidationException {
public:
    explicit ProductNotFoundException(const std::string& productId)
        : OrderValidationException("Product " + productId + " not found")
        , productId_(productId) {}

    const std::string& productId() const { return productId_; }

private:
    std::string productId_;
};

class InsufficientStockException : public OrderValidationException {
public:
    InsufficientStockException(const std::string& productId, const std::string& productName,
                               int64_t available, int64_t requested)
        : OrderValidationException("Insufficient stock for \"" + productName + "\". Available: " +
                                   std::to_string(available) + ", Requested: " +
                                   std::to_string(requested))
        , productId_(productId)
        , productName_(productName)
        , available_(available)
        , requested_(requested) {}

    const std::string& productId() const { return productId_; }
    const std::string& productName() const { return productName_; }
    int64_t available() const { return available_; }
    int64_t requested() const { return requested_; }

private:
    std::string productId_;
    std::string productName_;
    int64_t available_;
    int64_t requested_;
};

class InvalidOrderException : public OrderValidationException {
public:
    explicit InvalidOrderException(const std::string& message)
        : OrderValidationException(message) {}
};

class OrderNotFoundException : public OrderValidationException {
public:
    explicit OrderNotFoundException(const std::string& orderId)
        : OrderValidationException("Order " + orderId + " not found")
        , orderId_(orderId) {}

    const std::string& orderId() const { return orderId_; }

private:
    std::string orderId_;
};

class VendorNotFoundException : public OrderIntegrityException {
public:
    explicit VendorNotFoundException(const std::string& vendorId)
        : OrderIntegrityException("Vendor " + vendorId + " not found")
        , vendorId_(vendorId) {}

    const std::string& vendorId() const { return vendorId_; }

private:
    std::string vendorId_;
};

class InvalidCommissionRateException : public OrderIntegrityException {
public:
    explicit InvalidCommissionRateException(const std::string& rate)
        : OrderIntegrityException("Commission rate out of range: " + rate) {}
};

} // namespace marketplace::domain
