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

#include <optional>

#include "config.hpp"
#include "peripheral.hpp"
#include "units.hpp"

namespace h7spi {
/**
 * @brief Origin of a kernel clock that can feed an SPI peripheral
 *
 */
enum class clock_source : u8
{
  pll1_q,
  pll2_p,
  pll3_p,
  /// External I2S clock input pin
  i2s_ckin,
  /// per_ck, the peripheral clock mux output
  per,
  /// APB2 clock, rcc_pclk2
  pclk2,
  pll2_q,
  pll3_q,
  hsi_ker,
  csi_ker,
  hse,
  /// APB4 clock, rcc_pclk4
  pclk4,
};

/**
 * @brief Clock tree oracle consumed by the SPI driver
 *
 * The clock tree subsystem owns the RCC. The SPI driver only needs to know
 * which kernel clock is selected for its group, how fast that clock is
 * running and to have the bus clock of its peripheral turned on.
 *
 */
class clock_tree
{
public:
  /**
   * @brief Frequency of a clock source
   *
   * @param p_source - clock source to query
   * @return std::optional<hertz> - frequency of the source, or std::nullopt if
   * the source is not running.
   */
  [[nodiscard]] std::optional<hertz> frequency(clock_source p_source)
  {
    return driver_frequency(p_source);
  }

  /**
   * @brief Raw value of the kernel clock selector field of a group
   *
   * @param p_group - peripheral group
   * @return u32 - value of SPI123SEL, SPI45SEL or SPI6SEL
   */
  [[nodiscard]] u32 kernel_clock_selector(kernel_clock_group p_group)
  {
    return driver_kernel_clock_selector(p_group);
  }

  /**
   * @brief Turn on the bus clock of a peripheral
   *
   * @param p_enable - location of the enable bit
   */
  void enable(peripheral_enable const& p_enable)
  {
    driver_enable(p_enable);
  }

  virtual ~clock_tree() = default;

private:
  virtual std::optional<hertz> driver_frequency(clock_source p_source) = 0;
  virtual u32 driver_kernel_clock_selector(kernel_clock_group p_group) = 0;
  virtual void driver_enable(peripheral_enable const& p_enable) = 0;
};

/**
 * @brief Master baud rate prescaler. Values match the CFG1.MBR field.
 *
 */
enum class divisor : u8
{
  div2 = 0,
  div4,
  div8,
  div16,
  div32,
  div64,
  div128,
  div256,
};

/// @return u32 - the amount the kernel clock is divided by
constexpr u32 divisor_value(divisor p_divisor)
{
  return u32{ 2 } << static_cast<u32>(p_divisor);
}

/// Maximum value of the CFG2.MSSI field
inline constexpr u8 max_cs_delay_cycles = 0xF;

/**
 * @brief Result of resolving the clock settings of an SPI peripheral
 *
 */
struct clock_plan
{
  /// Source feeding the peripheral
  clock_source source;
  /// Frequency of the kernel clock
  hertz kernel_frequency;
  /// Prescaler selected to reach the requested rate
  divisor prescaler;
  /// Number of SCK cycles of idleness between CS assertion and the first
  /// frame
  u8 cs_delay_cycles;

  /// @return hertz - bus clock rate after the prescaler
  constexpr hertz bus_frequency() const
  {
    return kernel_frequency / divisor_value(prescaler);
  }

  constexpr bool operator==(clock_plan const&) const = default;
};

/**
 * @brief Map a kernel clock selector value to its clock source
 *
 * @param p_group - peripheral group the selector belongs to
 * @param p_selector - raw value of the group's selector field
 * @param p_instance - driver performing the lookup, reported in the exception
 * @return clock_source - source selected
 * @throws h7spi::operation_not_supported - if the selector value is reserved
 */
clock_source kernel_clock_source(kernel_clock_group p_group,
                                 u32 p_selector,
                                 void const* p_instance = nullptr);

/**
 * @brief Frequency of the kernel clock currently selected for a group
 *
 * @param p_clocks - clock tree oracle
 * @param p_group - peripheral group
 * @return std::optional<hertz> - kernel frequency, or std::nullopt if the
 * selected source is not running.
 * @throws h7spi::operation_not_supported - if the selector value is reserved
 */
std::optional<hertz> kernel_clock(clock_tree& p_clocks,
                                  kernel_clock_group p_group);

/**
 * @brief Select the prescaler for a requested bit rate
 *
 * The integer ratio `p_kernel / p_requested` is mapped onto the power of two
 * ladder 2 to 256:
 *
 *     ratio    | 1-2 | 3-5 | 6-11 | 12-23 | 24-47 | 48-95 | 96-191 | 192+
 *     divisor  |  2  |  4  |  8   |  16   |  32   |  64   |  128   | 256
 *
 * The ladder rounds to a nearby power of two. When the ratio is itself a
 * power of two the bus rate equals the request. Otherwise the bus rate can
 * exceed the request by up to 1.5 times, for example a ratio of 191 selects
 * div128. Use `clock_plan::bus_frequency()` to learn the actual rate.
 *
 * @param p_kernel - kernel clock frequency
 * @param p_requested - requested bus frequency
 * @param p_instance - driver performing the lookup, reported in the exception
 * @return divisor - prescaler
 * @throws h7spi::argument_out_of_domain - if the requested rate is 0 or above
 * the kernel frequency.
 */
divisor baud_rate_divisor(hertz p_kernel,
                          hertz p_requested,
                          void const* p_instance = nullptr);

/**
 * @brief Convert a chip select delay into SCK cycles
 *
 * A non-zero delay is rounded up by one cycle so that it is never shorter
 * than requested. The result is clamped to the 4-bit MSSI field.
 *
 * @param p_delay - delay in seconds
 * @param p_frequency - bus frequency the delay is counted in
 * @return u8 - cycle count, 0 to 15
 */
u8 cs_delay_cycles(seconds p_delay, hertz p_frequency);

/**
 * @brief Resolve the clock settings of an SPI peripheral
 *
 * @param p_clocks - clock tree oracle
 * @param p_group - peripheral group
 * @param p_requested - requested bus frequency
 * @param p_config - configuration providing the chip select delay
 * @param p_instance - driver being configured, reported in the exception
 * @return clock_plan - resolved settings
 * @throws h7spi::clock_not_running - if the selected kernel clock is off
 * @throws h7spi::operation_not_supported - if the selector value is reserved
 * @throws h7spi::argument_out_of_domain - if the requested rate is 0 or above
 * the kernel frequency.
 */
clock_plan resolve_clock(clock_tree& p_clocks,
                         kernel_clock_group p_group,
                         hertz p_requested,
                         spi_config const& p_config,
                         void const* p_instance = nullptr);
}  // namespace h7spi
