// Copyright 2026 The libh7spi Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstdint>

/**
 * @brief STM32H7 master-mode SPI driver
 *
 */
namespace h7spi {
/// Standard type for bytes in libh7spi.
using byte = std::uint8_t;

// Shortened versions of the standard integers. Integer names adopted from the
// Rust and Zig.
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using uptr = std::uintptr_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

/// Type for frequency represented in hertz. We use u32 because sub 1-hertz
/// frequencies are never used for bus clocks and the divisor selection works
/// on integer ratios, so no need to pay for floating point operations on
/// frequency values.
using hertz = u32;

/// Type for time durations represented in seconds.
using seconds = float;

/**
 * @brief Literal suffixes for frequency and time values
 *
 */
namespace literals {
[[nodiscard]] consteval hertz operator""_Hz(unsigned long long p_value)
{
  return static_cast<hertz>(p_value);
}

[[nodiscard]] consteval hertz operator""_kHz(unsigned long long p_value)
{
  return static_cast<hertz>(p_value * 1'000ULL);
}

[[nodiscard]] consteval hertz operator""_MHz(unsigned long long p_value)
{
  return static_cast<hertz>(p_value * 1'000'000ULL);
}

[[nodiscard]] consteval seconds operator""_s(long double p_value)
{
  return static_cast<seconds>(p_value);
}

[[nodiscard]] consteval seconds operator""_us(unsigned long long p_value)
{
  return static_cast<seconds>(static_cast<double>(p_value) / 1'000'000.0);
}

[[nodiscard]] consteval seconds operator""_ns(unsigned long long p_value)
{
  return static_cast<seconds>(static_cast<double>(p_value) / 1'000'000'000.0);
}
}  // namespace literals

using namespace literals;
}  // namespace h7spi
