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
#include <optional>
#include <vector>

#include <libh7spi/clock.hpp>
#include <libh7spi/peripheral.hpp>
#include <libh7spi/pins.hpp>
#include <libh7spi/registers.hpp>
#include <libh7spi/units.hpp>

namespace h7spi {
/**
 * @brief Clock tree with settable selectors and source frequencies
 *
 * Every source is stopped and every selector is 0 on construction.
 */
class fake_clock_tree : public clock_tree
{
public:
  void set(clock_source p_source, std::optional<hertz> p_frequency)
  {
    m_frequencies[static_cast<u8>(p_source)] = p_frequency;
  }

  void select(kernel_clock_group p_group, u32 p_selector)
  {
    m_selectors[static_cast<u8>(p_group)] = p_selector;
  }

  std::array<std::optional<hertz>, 12> m_frequencies{};
  std::array<u32, 3> m_selectors{};
  std::vector<peripheral_enable> m_enabled{};

  ~fake_clock_tree() override = default;

private:
  std::optional<hertz> driver_frequency(clock_source p_source) override
  {
    return m_frequencies[static_cast<u8>(p_source)];
  }

  u32 driver_kernel_clock_selector(kernel_clock_group p_group) override
  {
    return m_selectors[static_cast<u8>(p_group)];
  }

  void driver_enable(peripheral_enable const& p_enable) override
  {
    m_enabled.push_back(p_enable);
  }
};

/// Reset value of CFG1 from the reference manual
inline constexpr u32 cfg1_reset_value = 0x0007'0007;

/**
 * @brief RAM backed register block that starts at its reset values
 *
 */
struct simulated_spi
{
  simulated_spi()
  {
    registers.cfg1 = cfg1_reset_value;
  }

  /// Take ownership of the simulated block as an SPI instance
  peripheral_handle handle(u64 p_bus = 1)
  {
    return { unsafe{}, p_bus, &registers };
  }

  spi_reg_t registers{};
};

// Pins used across the tests
inline constexpr pin_id pa5_af5{ .port = gpio_port::a, .pin = 5, .function = 5 };
inline constexpr pin_id pa6_af5{ .port = gpio_port::a, .pin = 6, .function = 5 };
inline constexpr pin_id pa7_af5{ .port = gpio_port::a, .pin = 7, .function = 5 };
inline constexpr pin_id pa5_af8{ .port = gpio_port::a, .pin = 5, .function = 8 };
inline constexpr pin_id pg13_af5{ .port = gpio_port::g,
                                  .pin = 13,
                                  .function = 5 };
}  // namespace h7spi
