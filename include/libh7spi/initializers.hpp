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

#include <type_traits>

#include "units.hpp"

namespace h7spi {

/**
 * @brief Initializer base type
 *
 * Initializers are compile time constructed objects with numeric values. These
 * numeric values are sanity checked at compile time by the function.
 *
 * @tparam value - constant value of the selector
 */
template<u64 value>
struct selector_t
{
  /// Compile time storage for the value
  static constexpr auto val = value;

  /**
   * @brief Extracts the value of the initializer object
   *
   * @return constexpr u64 - value of the selector
   */
  constexpr u64 operator()() const
  {
    return value;
  }
};

/**
 * @brief A parameter type that represents a "bus"
 *
 * Used to select the SPI instance, 1 to 6 for SPI1 to SPI6.
 *
 * @tparam value - bus number
 */
template<u64 value>
struct bus_t : selector_t<value>
{};

/**
 * @brief Concept for a bus type parameter
 *
 * USAGE:
 *
 *     void accept_bus(h7spi::bus_param auto p_bus);
 *
 * @tparam T - bus type
 */
template<typename T>
concept bus_param = std::is_same_v<bus_t<T::val>, T>;

/**
 * @brief bus_t creation object
 *
 * USAGE:
 *
 *      auto handle = h7spi::peripheral_handle(h7spi::bus<3>);
 *
 * @tparam value - bus number
 */
template<u64 value>
inline constexpr bus_t<value> bus{};

/// This tag indicates to the reader that the function or constructor used will
/// perform some runtime sanity checks on its inputs and may return an error or
/// throw an exception if the inputs are not valid.
struct runtime
{};

/// This tag indicates to the reader that the function or constructor is an
/// unsafe operation that cannot be checked at runtime. It is the responsibility
/// of the caller to ensure that the inputs provided are valid.
struct unsafe
{};
}  // namespace h7spi
