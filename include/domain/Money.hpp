// include/domain/Money.hpp
#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace marketplace::domain {

/**
 * @brief Десятичное число произвольной точности (50 значащих цифр)
 *
 * Все денежные вычисления выполняются только через этот тип,
 * double для денег не используется.
 */
using Decimal = boost::multiprecision::number<
    boost::multiprecision::cpp_dec_float<50>,
    boost::multiprecision::et_off>;

/**
 * @brief Денежное значение с валютой
 *
 * Хранит сумму в основных единицах (XOF, CFA) как Decimal.
 * Статические методы реализуют безопасную арифметику:
 * округление всегда half-up, на некорректном входе возвращается 0
 * и пишется сообщение в лог, исключения не выбрасываются.
 *
 * @example
 * ```cpp
 * Money::toMinorUnit("1234.565");              // 123457
 * Money::calculatePercentage(Decimal(3000), 5); // 150
 * Money::roundMoney(Decimal("2.675"));          // 2.68
 * ```
 */
class Money {
public:
    Decimal amount = 0;
    std::string currency = "XOF";

    Money() = default;

    explicit Money(const Decimal& a, const std::string& cur = "XOF")
        : amount(a), currency(cur) {}

    /**
     * @brief Создать из строки (формат колонки DECIMAL)
     *
     * Некорректная строка даёт 0 (с записью в лог).
     */
    static Money fromString(const std::string& value, const std::string& cur = "XOF");

    static Money fromMinorUnit(int64_t minorAmount, const std::string& cur = "XOF");

    /**
     * @brief Строка с двумя знаками после запятой ("150.00")
     */
    std::string toString() const { return toFixed(amount); }

    int64_t toMinor() const { return toMinorUnit(amount); }

    Money operator+(const Money& other) const { return Money(amount + other.amount, currency); }
    Money operator-(const Money& other) const { return Money(amount - other.amount, currency); }
    Money operator*(int64_t multiplier) const { return Money(amount * multiplier, currency); }

    bool operator<(const Money& other) const { return amount < other.amount; }
    bool operator>(const Money& other) const { return amount > other.amount; }
    bool operator<=(const Money& other) const { return amount <= other.amount; }
    bool operator>=(const Money& other) const { return amount >= other.amount; }

    bool operator==(const Money& other) const {
        return amount == other.amount && currency == other.currency;
    }

    bool operator!=(const Money& other) const { return !(*this == other); }

    // =========================================================================
    // Безопасная денежная арифметика
    // =========================================================================

    /**
     * @brief Разобрать десятичную строку
     * @return nullopt для пустой строки, мусора, NaN и бесконечности
     */
    static std::optional<Decimal> parseDecimal(const std::string& value);

    /**
     * @brief Основные единицы → минорные (×100, half-up)
     */
    static int64_t toMinorUnit(const std::string& amount);
    static int64_t toMinorUnit(const Decimal& amount);
    static int64_t toMinorUnit(double amount);

    /**
     * @brief Минорные единицы → основные (÷100)
     */
    static Decimal toMajorUnit(int64_t minorAmount);

    /**
     * @brief amount × rate, где rate это доля (0.05), а не процент
     */
    static Decimal calculateCommission(const Decimal& amount, const Decimal& rate);
    static Decimal calculateCommission(const std::string& amount, const std::string& rate);

    /**
     * @brief value × percentage / 100
     */
    static Decimal calculatePercentage(const Decimal& value, const Decimal& percentage);
    static Decimal calculatePercentage(const std::string& value, const std::string& percentage);

    /**
     * @brief Сумма с пропуском пустых и некорректных значений
     */
    static Decimal sumAmounts(const std::vector<std::optional<std::string>>& amounts);
    static Decimal sumAmounts(const std::vector<Decimal>& amounts);

    /**
     * @brief Округление до 2 знаков, half-up
     */
    static Decimal roundMoney(const Decimal& amount);
    static Decimal roundMoney(const std::string& amount);

    /**
     * @brief Округлённая строка с 2 знаками ("2850.00")
     */
    static std::string toFixed(const Decimal& amount);

    /**
     * @brief Форматирование для отображения: "1,234.56 CFA"
     */
    static std::string formatMoney(const std::string& amount, const std::string& currency = "XOF");

    /**
     * @brief Конечное неотрицательное число
     */
    static bool isValidMoneyAmount(const std::string& amount);

    /**
     * @brief Разбор пользовательского ввода
     *
     * Убирает запятые, пробелы и суффиксы CFA/XOF.
     * @return nullopt для пустого, некорректного или отрицательного значения
     */
    static std::optional<Decimal> parseMoneyInput(const std::string& input);

    static Decimal fromDouble(double value);

private:
    static Decimal roundHalfUp(const Decimal& value, int places);
    static bool isFinite(const Decimal& value);
};

} // namespace marketplace::domain
