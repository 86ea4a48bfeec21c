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

#include <limits>

#include "error.hpp"
#include "units.hpp"

namespace h7spi {
/**
 * @brief Mode settings which control when data is sampled and shifted out
 *
 */
enum class mode : u8
{
  /**
   * @brief spi mode 0
   *
   * - Data is shifted out on: falling SCLK, and when CS activates
   * - Data is sampled on: rising SCLK
   * - CPOL (clock polarity): 0
   * - CPHA (clock phase): 0
   */
  m0,

  /**
   * @brief spi mode 1
   *
   * - Data is shifted out on: rising SCLK
   * - Data is sampled on: falling SCLK
   * - CPOL (clock polarity): 0
   * - CPHA (clock phase): 1
   */
  m1,

  /**
   * @brief spi mode 2
   *
   * - Data is shifted out on: rising SCLK, and when CS activates
   * - Data is sampled on: falling SCLK
   * - CPOL (clock polarity): 1
   * - CPHA (clock phase): 0
   */
  m2,

  /**
   * @brief spi mode 3
   *
   * - Data is shifted out on: falling SCLK
   * - Data is sampled on: rising SCLK
   * - CPOL (clock polarity): 1
   * - CPHA (clock phase): 1
   */
  m3,
};

/// @return true - if the clock idles high in this mode (CPOL = 1)
constexpr bool clock_idles_high(mode p_mode)
{
  return p_mode == mode::m2 || p_mode == mode::m3;
}

/// @return true - if data is captured on the second clock transition
/// (CPHA = 1)
constexpr bool data_valid_on_trailing_edge(mode p_mode)
{
  return p_mode == mode::m1 || p_mode == mode::m3;
}

/// Direction of data on the bus. Values match the CFG2.COMM field.
enum class communication_mode : u8
{
  full_duplex = 0,
  transmitter = 1,
  receiver = 2,
  half_duplex = 3,
};

/**
 * @brief Configuration of an SPI peripheral
 *
 * Built with chained calls, each returning a modified copy:
 *
 *      auto const config = h7spi::spi_config(h7spi::mode::m0)
 *                            .frame_size(16)
 *                            .manage_cs()
 *                            .cs_delay(1_us);
 *
 * The configuration is consumed once when the driver is constructed. To
 * change it, release the peripheral and construct a new driver.
 */
class spi_config
{
public:
  static constexpr u8 min_frame_size = 4;
  static constexpr u8 max_frame_size = 32;
  /// Largest value of the 16-bit TSIZE field
  static constexpr u32 max_transfer_size = 0xFFFF;

  /**
   * @brief Create a default configuration for the SPI interface.
   *
   * Defaults are 8-bit frames, full duplex, software chip select management,
   * no chip select delay and no MISO/MOSI swap.
   *
   * @param p_mode - The SPI mode to configure.
   */
  constexpr spi_config(mode p_mode = mode::m0)  // NOLINT: implicit on purpose
    : m_mode(p_mode)
  {
  }

  /**
   * @brief Specify that the SPI MISO/MOSI lines are swapped.
   *
   * The peripheral treats the pin provided in the MISO position as the MOSI
   * pin and the pin provided in the MOSI position as the MISO pin.
   */
  [[nodiscard]] constexpr spi_config swap_mosi_miso() const
  {
    auto copy = *this;
    copy.m_swap_miso_mosi = true;
    return copy;
  }

  /**
   * @brief Specify a delay between CS assertion and the beginning of the SPI
   * transaction.
   *
   * The delay is programmed as a number of SCK cycles, so the actual delay
   * may be longer, but never shorter, than requested, up to the 15 cycle
   * limit of the hardware.
   *
   * @param p_delay - delay in seconds
   * @throws h7spi::argument_out_of_domain - if the delay is negative or not a
   * finite number.
   */
  [[nodiscard]] constexpr spi_config cs_delay(seconds p_delay) const
  {
    if (not(p_delay >= 0.0f &&
            p_delay <= std::numeric_limits<seconds>::max())) {
      safe_throw(argument_out_of_domain(nullptr));
    }
    auto copy = *this;
    copy.m_cs_delay = p_delay;
    return copy;
  }

  /**
   * @brief Specify the number of bits in each word
   *
   * @param p_frame_size - bits per word, 4 to 32
   * @throws h7spi::argument_out_of_domain - if the frame size is outside of 4
   * to 32 bits.
   */
  [[nodiscard]] constexpr spi_config frame_size(u32 p_frame_size) const
  {
    if (p_frame_size < min_frame_size || p_frame_size > max_frame_size) {
      safe_throw(argument_out_of_domain(nullptr));
    }
    auto copy = *this;
    copy.m_frame_size = static_cast<u8>(p_frame_size);
    return copy;
  }

  /// CS pin is automatically managed by the SPI peripheral
  [[nodiscard]] constexpr spi_config manage_cs() const
  {
    auto copy = *this;
    copy.m_managed_cs = true;
    return copy;
  }

  [[nodiscard]] constexpr spi_config communication_mode(
    h7spi::communication_mode p_mode) const
  {
    auto copy = *this;
    copy.m_communication_mode = p_mode;
    return copy;
  }

  /**
   * @brief Specify the number of words in each transaction
   *
   * @param p_words - words per transaction, 0 for an unbounded transaction
   * @throws h7spi::argument_out_of_domain - if the count does not fit in 16
   * bits.
   */
  [[nodiscard]] constexpr spi_config transfer_size(u32 p_words) const
  {
    if (p_words > max_transfer_size) {
      safe_throw(argument_out_of_domain(nullptr));
    }
    auto copy = *this;
    copy.m_transfer_size = static_cast<u16>(p_words);
    return copy;
  }

  constexpr mode bus_mode() const
  {
    return m_mode;
  }

  constexpr bool miso_mosi_swapped() const
  {
    return m_swap_miso_mosi;
  }

  constexpr seconds cs_delay() const
  {
    return m_cs_delay;
  }

  constexpr u8 frame_size() const
  {
    return m_frame_size;
  }

  constexpr bool managed_cs() const
  {
    return m_managed_cs;
  }

  constexpr h7spi::communication_mode communication_mode() const
  {
    return m_communication_mode;
  }

  constexpr u16 transfer_size() const
  {
    return m_transfer_size;
  }

  /**
   * @brief Enables default comparison
   *
   */
  constexpr bool operator==(spi_config const&) const = default;

private:
  mode m_mode;
  bool m_swap_miso_mosi = false;
  seconds m_cs_delay = 0.0f;
  u8 m_frame_size = 8;
  bool m_managed_cs = false;
  h7spi::communication_mode m_communication_mode =
    h7spi::communication_mode::full_duplex;
  u16 m_transfer_size = 0;
};
}  // namespace h7spi
