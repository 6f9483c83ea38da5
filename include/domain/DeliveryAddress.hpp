#pragma once

#include <optional>
#include <string>

namespace marketplace::domain {

/**
 * @brief Адрес доставки (хранится в orders.delivery_address как JSONB)
 */
struct DeliveryAddress {
    std::string street;
    std::string city;
    std::string district;
    std::string phone;
    std::optional<double> latitude;
    std::optional<double> longitude;
};

} // namespace marketplace::domain
