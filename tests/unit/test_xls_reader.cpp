/**
 * @file test_xls_reader.cpp
 * @brief Юнит-тесты цвета заливки ячеек .xls
 */

#include <doctest/doctest.h>
#include "io/xls_reader.hpp"

using namespace strata::io;

namespace {

constexpr uint32_t kSolidPattern = 1u << 26;

} // namespace

TEST_CASE("XF without a fill pattern has no color") {
    CHECK_FALSE(xlsFillColor(0, 13).has_value());
    // Цвета линий рамки заливкой не считаются
    CHECK_FALSE(xlsFillColor(0x0000FFFF, 13).has_value());
}

TEST_CASE("solid fill resolves through the default palette") {
    CHECK(*xlsFillColor(kSolidPattern, 13) == "#FFFF00");
    CHECK(*xlsFillColor(kSolidPattern, 60) == "#993300");
    CHECK(*xlsFillColor(kSolidPattern, 8) == "#000000");
    // Индексы 0-7 повторяют 8-15
    CHECK(*xlsFillColor(kSolidPattern, 2) == "#FF0000");
    // Цвет фона узора (биты 7-13) не влияет
    CHECK(*xlsFillColor(kSolidPattern, static_cast<uint16_t>((65 << 7) | 13)) == "#FFFF00");
}

TEST_CASE("system color indices are not fills") {
    CHECK_FALSE(xlsFillColor(kSolidPattern, 64).has_value());
    CHECK_FALSE(xlsFillColor(kSolidPattern, 65).has_value());
}
