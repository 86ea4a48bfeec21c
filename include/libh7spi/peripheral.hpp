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

#include <array>

#include "initializers.hpp"
#include "registers.hpp"
#include "units.hpp"

namespace h7spi {
/// RCC registers holding the bus clock enable bits of the SPI peripherals
enum class rcc_enable_register : u8
{
  apb1lenr,
  apb2enr,
  apb4enr,
};

/// Location of the bus clock enable bit of a peripheral
struct peripheral_enable
{
  rcc_enable_register reg;
  u8 bit;

  constexpr bool operator==(peripheral_enable const&) const = default;
};

/**
 * @brief Groups of SPI peripherals that share a kernel clock selector field
 *
 */
enum class kernel_clock_group : u8
{
  /// SPI1, SPI2, SPI3: RCC_D2CCIP1R.SPI123SEL
  spi123,
  /// SPI4, SPI5: RCC_D2CCIP1R.SPI45SEL
  spi45,
  /// SPI6: RCC_D3CCIPR.SPI6SEL
  spi6,
};

/// Everything that differs between SPI instances
struct peripheral_info
{
  u8 bus;
  uptr address;
  peripheral_enable enable;
  kernel_clock_group clock_group;
};

inline constexpr u8 peripheral_count = 6;

// clang-format off
inline constexpr std::array<peripheral_info, peripheral_count> peripherals{ {
  { 1, 0x4001'3000, { rcc_enable_register::apb2enr,  12 }, kernel_clock_group::spi123 },
  { 2, 0x4000'3800, { rcc_enable_register::apb1lenr, 14 }, kernel_clock_group::spi123 },
  { 3, 0x4000'3C00, { rcc_enable_register::apb1lenr, 15 }, kernel_clock_group::spi123 },
  { 4, 0x4001'3400, { rcc_enable_register::apb2enr,  13 }, kernel_clock_group::spi45 },
  { 5, 0x4001'5000, { rcc_enable_register::apb2enr,  20 }, kernel_clock_group::spi45 },
  { 6, 0x5800'1400, { rcc_enable_register::apb4enr,   5 }, kernel_clock_group::spi6 },
} };
// clang-format on

/// @return true - if the bus number names an SPI instance
constexpr bool is_valid_bus(u64 p_bus)
{
  return 1 <= p_bus && p_bus <= peripheral_count;
}

/**
 * @brief Exclusive ownership of one SPI peripheral's register block
 *
 * At most one handle exists per SPI instance at a time. The handle is
 * move-only: moving transfers ownership and leaves the source empty.
 * Destroying an owning handle makes the instance available again.
 *
 * Drivers take the handle by value and give it back through their
 * `release()` function.
 */
class peripheral_handle
{
public:
  /**
   * @brief Take ownership of an SPI instance selected at compile time
   *
   * @param p_bus - SPI instance, h7spi::bus<1> to h7spi::bus<6>
   * @throws h7spi::device_or_resource_busy - if the instance is already owned
   */
  explicit peripheral_handle(bus_param auto p_bus)
    : peripheral_handle(runtime{}, p_bus())
  {
    static_assert(is_valid_bus(p_bus()), "Supported SPI buses are 1 to 6");
  }

  /**
   * @brief Take ownership of an SPI instance selected at runtime
   *
   * @param p_bus - SPI instance number, 1 to 6
   * @throws h7spi::argument_out_of_domain - if the bus number is not 1 to 6
   * @throws h7spi::device_or_resource_busy - if the instance is already owned
   */
  peripheral_handle(runtime, u64 p_bus);

  /**
   * @brief Take ownership of an SPI instance whose registers live at an
   * address other than the hardware address.
   *
   * Used for simulated register blocks. Ownership of the instance is still
   * tracked.
   *
   * @param p_bus - SPI instance number, 1 to 6
   * @param p_registers - register block to drive
   * @throws h7spi::argument_out_of_domain - if the bus number is not 1 to 6
   * @throws h7spi::device_or_resource_busy - if the instance is already owned
   */
  peripheral_handle(unsafe, u64 p_bus, spi_reg_t* p_registers);

  peripheral_handle(peripheral_handle const&) = delete;
  peripheral_handle& operator=(peripheral_handle const&) = delete;
  peripheral_handle(peripheral_handle&& p_other) noexcept;
  peripheral_handle& operator=(peripheral_handle&& p_other) noexcept;
  ~peripheral_handle();

  /// @return true - if this handle currently owns an instance
  [[nodiscard]] bool owns() const
  {
    return m_reg != nullptr;
  }

  /// @return spi_reg_t* - register block, nullptr if this handle is empty
  [[nodiscard]] spi_reg_t* registers() const
  {
    return m_reg;
  }

  /// @return u8 - SPI instance number, 0 if this handle is empty
  [[nodiscard]] u8 bus() const
  {
    return m_bus;
  }

  /**
   * @brief Instance table entry of the owned peripheral
   *
   * Must only be called on a handle that owns an instance.
   *
   * @return peripheral_info const& - table entry
   */
  [[nodiscard]] peripheral_info const& info() const
  {
    return peripherals[m_bus - 1U];
  }

  /**
   * @brief Determine if an instance is currently owned by a handle
   *
   * @param p_bus - SPI instance number, 1 to 6
   * @return true - if a live handle owns the instance
   */
  static bool is_owned(u64 p_bus);

private:
  void reset() noexcept;

  spi_reg_t* m_reg = nullptr;
  u8 m_bus = 0;
};
}  // namespace h7spi
