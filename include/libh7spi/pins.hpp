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

#include <algorithm>
#include <array>
#include <optional>
#include <span>
#include <type_traits>

#include "units.hpp"

namespace h7spi {
/// GPIO port letter of a pin
enum class gpio_port : u8
{
  a,
  b,
  c,
  d,
  e,
  f,
  g,
  h,
  i,
  j,
  k,
  /// Used by the filler pin identity
  none = 0xFF,
};

/// Electrical role a pin plays for an SPI peripheral
enum class pin_role : u8
{
  sck,
  miso,
  mosi,
};

/**
 * @brief Identity of a pin that was configured by the GPIO subsystem for an
 * alternate function.
 *
 * The GPIO subsystem hands out pins already muxed to their alternate
 * function. This driver only needs to know which pin it is and which
 * alternate function it was muxed to in order to prove that the pin can serve
 * a role of the targeted SPI instance.
 *
 * This is a structural type and can be used as a template argument.
 */
struct pin_id
{
  gpio_port port = gpio_port::none;
  u8 pin = 0;
  /// Alternate function number (AFx) the pin is muxed to
  u8 function = 0;

  constexpr bool operator==(pin_id const&) const = default;
};

/// Filler pin identity, valid for every role of every instance
inline constexpr pin_id no_pin{};
/// Filler for when the SCK pin is unnecessary
inline constexpr pin_id no_sck = no_pin;
/// Filler for when the MISO pin is unnecessary
inline constexpr pin_id no_miso = no_pin;
/// Filler for when the MOSI pin is unnecessary
inline constexpr pin_id no_mosi = no_pin;

/**
 * @brief The pins supplied to an SPI driver
 *
 * Use the filler identities for pins that are not required.
 */
struct pin_assignment
{
  pin_id sck = no_sck;
  pin_id miso = no_miso;
  pin_id mosi = no_mosi;

  constexpr bool operator==(pin_assignment const&) const = default;
};

/// An admissible (role, pin) pair of an instance
struct pin_capability
{
  pin_role role;
  pin_id pin;
};

namespace detail {
constexpr pin_capability cap(pin_role p_role,
                             gpio_port p_port,
                             u8 p_pin,
                             u8 p_function)
{
  return { .role = p_role,
           .pin = { .port = p_port, .pin = p_pin, .function = p_function } };
}

using enum pin_role;
using enum gpio_port;

// clang-format off
inline constexpr std::array spi1_pins{
  cap(sck,  a, 5, 5),  cap(sck,  b, 3, 5),  cap(sck,  g, 11, 5),
  cap(miso, a, 6, 5),  cap(miso, b, 4, 5),  cap(miso, g, 9, 5),
  cap(mosi, a, 7, 5),  cap(mosi, b, 5, 5),  cap(mosi, d, 7, 5),
};

inline constexpr std::array spi2_pins{
  cap(sck,  a, 9, 5),  cap(sck,  a, 12, 5), cap(sck,  b, 10, 5),
  cap(sck,  b, 13, 5), cap(sck,  d, 3, 5),  cap(sck,  i, 1, 5),
  cap(miso, b, 14, 5), cap(miso, c, 2, 5),  cap(miso, i, 2, 5),
  cap(mosi, b, 15, 5), cap(mosi, c, 1, 5),  cap(mosi, c, 3, 5),
  cap(mosi, i, 3, 5),
};

inline constexpr std::array spi3_pins{
  cap(sck,  b, 3, 6),  cap(sck,  c, 10, 6),
  cap(miso, b, 4, 6),  cap(miso, c, 11, 6),
  cap(mosi, b, 2, 7),  cap(mosi, b, 5, 7),  cap(mosi, c, 12, 6),
  cap(mosi, d, 6, 5),
};

inline constexpr std::array spi4_pins{
  cap(sck,  e, 2, 5),  cap(sck,  e, 12, 5),
  cap(miso, e, 5, 5),  cap(miso, e, 13, 5),
  cap(mosi, e, 6, 5),  cap(mosi, e, 14, 5),
};

inline constexpr std::array spi5_pins{
  cap(sck,  f, 7, 5),  cap(sck,  h, 6, 5),  cap(sck,  k, 0, 5),
  cap(miso, f, 8, 5),  cap(miso, h, 7, 5),  cap(miso, j, 11, 5),
  cap(mosi, f, 9, 5),  cap(mosi, f, 11, 5), cap(mosi, j, 10, 5),
};

inline constexpr std::array spi6_pins{
  cap(sck,  a, 5, 8),  cap(sck,  b, 3, 8),  cap(sck,  g, 13, 5),
  cap(miso, a, 6, 8),  cap(miso, b, 4, 8),  cap(miso, g, 12, 5),
  cap(mosi, a, 7, 8),  cap(mosi, b, 5, 8),  cap(mosi, g, 14, 5),
};
// clang-format on
}  // namespace detail

/**
 * @brief Returns the admissible (role, pin) pairs of an SPI instance
 *
 * @param p_bus - SPI instance number, 1 to 6
 * @return std::span<pin_capability const> - capability table of the
 * instance. Empty if the instance does not exist.
 */
constexpr std::span<pin_capability const> pin_capabilities(u64 p_bus)
{
  switch (p_bus) {
    case 1:
      return detail::spi1_pins;
    case 2:
      return detail::spi2_pins;
    case 3:
      return detail::spi3_pins;
    case 4:
      return detail::spi4_pins;
    case 5:
      return detail::spi5_pins;
    case 6:
      return detail::spi6_pins;
    default:
      return {};
  }
}

/**
 * @brief Determine if a pin can serve a role for an SPI instance
 *
 * The filler identity is always valid.
 *
 * @param p_bus - SPI instance number, 1 to 6
 * @param p_role - role the pin is meant to serve
 * @param p_pin - identity of the pin
 * @return true - if the pin may be assigned this role
 */
constexpr bool is_valid_pin(u64 p_bus, pin_role p_role, pin_id p_pin)
{
  if (p_pin == no_pin) {
    return true;
  }

  return std::ranges::any_of(
    pin_capabilities(p_bus), [p_role, p_pin](pin_capability const& p_entry) {
      return p_entry.role == p_role && p_entry.pin == p_pin;
    });
}

/**
 * @brief Find the first role of an assignment that is not admissible
 *
 * Roles are checked in the order SCK, MISO, MOSI.
 *
 * @param p_bus - SPI instance number, 1 to 6
 * @param p_pins - pins to check
 * @return std::optional<pin_role> - first rejected role, or std::nullopt if
 * the whole assignment is valid.
 */
constexpr std::optional<pin_role> first_invalid_role(u64 p_bus,
                                                     pin_assignment p_pins)
{
  if (not is_valid_pin(p_bus, pin_role::sck, p_pins.sck)) {
    return pin_role::sck;
  }
  if (not is_valid_pin(p_bus, pin_role::miso, p_pins.miso)) {
    return pin_role::miso;
  }
  if (not is_valid_pin(p_bus, pin_role::mosi, p_pins.mosi)) {
    return pin_role::mosi;
  }
  return std::nullopt;
}

/**
 * @brief Check a pin assignment against an SPI instance
 *
 * @param p_bus - SPI instance number, 1 to 6
 * @param p_pins - pins to check
 * @param p_instance - address of the driver performing the check, reported in
 * the exception.
 * @throws h7spi::invalid_pin_assignment - if any of the pins cannot serve its
 * role on the instance.
 */
void validate_pins(u64 p_bus,
                   pin_assignment const& p_pins,
                   void const* p_instance = nullptr);

/**
 * @brief Compile time pin assignment
 *
 * Carries the pins in its type so that drivers can reject an invalid
 * assignment with a static_assert.
 *
 * @tparam sck - SCK pin identity
 * @tparam miso - MISO pin identity
 * @tparam mosi - MOSI pin identity
 */
template<pin_id sck, pin_id miso, pin_id mosi>
struct pins_t
{
  static constexpr pin_assignment value{ .sck = sck,
                                         .miso = miso,
                                         .mosi = mosi };

  /**
   * @brief Determine if this assignment is admissible for an instance
   *
   * @param p_bus - SPI instance number
   * @return true - if every pin can serve its role
   */
  static constexpr bool valid_for(u64 p_bus)
  {
    return not first_invalid_role(p_bus, value).has_value();
  }
};

/**
 * @brief Concept for a compile time pin assignment
 *
 * @tparam T - pins type
 */
template<typename T>
concept pins_param =
  std::is_same_v<pins_t<T::value.sck, T::value.miso, T::value.mosi>, T>;

/**
 * @brief pins_t creation object
 *
 * USAGE:
 *
 *      constexpr h7spi::pin_id pa5{ .port = h7spi::gpio_port::a,
 *                                   .pin = 5,
 *                                   .function = 5 };
 *      h7spi::spi_master<h7spi::u8> spi(h7spi::bus<1>,
 *                                       h7spi::pins<pa5, h7spi::no_miso, ...>,
 *                                       ...);
 *
 * @tparam sck - SCK pin identity
 * @tparam miso - MISO pin identity
 * @tparam mosi - MOSI pin identity
 */
template<pin_id sck = no_sck, pin_id miso = no_miso, pin_id mosi = no_mosi>
inline constexpr pins_t<sck, miso, mosi> pins{};
}  // namespace h7spi
