/**
 * @file units.hpp
 * @brief Строго типизированные единицы глубины
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Все глубины после нормализации хранятся в футах.
 * Включает литералы для удобства: 10.0_ft, 3.0_mtr
 */

#pragma once

#include <cmath>
#include <compare>
#include <string_view>

namespace strata::model {

/**
 * @brief Единица глубины исходного документа
 */
enum class DepthUnit {
    Feet,     ///< ft, feet, foot, '
    Meters    ///< m, meter, meters, metre, metres
};

/// Количество футов в одном метре
constexpr double kFeetPerMeter = 3.28084;

/**
 * @brief Глубина в футах
 */
struct Feet {
    double value;

    constexpr explicit Feet(double v = 0.0) noexcept : value(v) {}

    // Арифметические операции
    constexpr Feet operator+(Feet other) const noexcept {
        return Feet{value + other.value};
    }

    constexpr Feet operator-(Feet other) const noexcept {
        return Feet{value - other.value};
    }

    constexpr Feet operator*(double scalar) const noexcept {
        return Feet{value * scalar};
    }

    constexpr Feet operator/(double scalar) const noexcept {
        return Feet{value / scalar};
    }

    constexpr double operator/(Feet other) const noexcept {
        return value / other.value;
    }

    constexpr Feet& operator+=(Feet other) noexcept {
        value += other.value;
        return *this;
    }

    constexpr Feet operator-() const noexcept {
        return Feet{-value};
    }

    constexpr auto operator<=>(const Feet& other) const noexcept = default;
};

/**
 * @brief Перевод значения в футы
 */
[[nodiscard]] constexpr Feet toFeet(double value, DepthUnit unit) noexcept {
    return unit == DepthUnit::Meters ? Feet{value * kFeetPerMeter} : Feet{value};
}

/**
 * @brief Каноническое имя единицы ("feet" / "meters")
 */
[[nodiscard]] constexpr std::string_view unitName(DepthUnit unit) noexcept {
    return unit == DepthUnit::Meters ? "meters" : "feet";
}

/**
 * @brief Округление до заданного числа знаков после запятой
 */
[[nodiscard]] inline double roundTo(double value, int decimals) noexcept {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

// Литералы для удобства
namespace literals {

constexpr Feet operator""_ft(long double v) noexcept {
    return Feet{static_cast<double>(v)};
}

constexpr Feet operator""_ft(unsigned long long v) noexcept {
    return Feet{static_cast<double>(v)};
}

constexpr Feet operator""_mtr(long double v) noexcept {
    return toFeet(static_cast<double>(v), DepthUnit::Meters);
}

} // namespace literals

} // namespace strata::model
