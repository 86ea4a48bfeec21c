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

#include <concepts>
#include <cstddef>

#include "units.hpp"

namespace h7spi {
/**
 * @brief Memory map of one SPI peripheral register block
 *
 * Layout is taken from the STM32H7 reference manual (RM0433, section SPI
 * registers).
 */
struct spi_reg_t
{
  /// Offset: 0x000 Control register 1
  u32 volatile cr1;
  /// Offset: 0x004 Control register 2
  u32 volatile cr2;
  /// Offset: 0x008 Configuration register 1
  u32 volatile cfg1;
  /// Offset: 0x00C Configuration register 2
  u32 volatile cfg2;
  /// Offset: 0x010 Interrupt enable register
  u32 volatile ier;
  /// Offset: 0x014 Status register
  u32 volatile sr;
  /// Offset: 0x018 Interrupt/status flags clear register
  u32 volatile ifcr;
  u32 volatile reserved0;
  /// Offset: 0x020 Transmit data register
  u32 volatile txdr;
  u32 volatile reserved1[3];
  /// Offset: 0x030 Receive data register
  u32 volatile rxdr;
  u32 volatile reserved2[3];
  /// Offset: 0x040 Polynomial register
  u32 volatile crcpoly;
  /// Offset: 0x044 Transmitter CRC register
  u32 volatile txcrc;
  /// Offset: 0x048 Receiver CRC register
  u32 volatile rxcrc;
  /// Offset: 0x04C Underrun data register
  u32 volatile udrdr;
  /// Offset: 0x050 I2S configuration register
  u32 volatile i2scfgr;
};

static_assert(offsetof(spi_reg_t, sr) == 0x14);
static_assert(offsetof(spi_reg_t, txdr) == 0x20);
static_assert(offsetof(spi_reg_t, rxdr) == 0x30);
static_assert(offsetof(spi_reg_t, i2scfgr) == 0x50);

/**
 * @brief A contiguous run of bits within a 32-bit register
 *
 */
struct bit_mask
{
  u32 position;
  u32 width;

  /**
   * @brief Create a mask spanning bits low to high (inclusive)
   *
   * @param p_low - lowest bit of the field
   * @param p_high - highest bit of the field
   * @return consteval bit_mask - the field mask
   */
  static consteval bit_mask from(u32 p_low, u32 p_high)
  {
    return { .position = p_low, .width = 1 + (p_high - p_low) };
  }

  /**
   * @brief Create a mask for a single bit
   *
   * @param p_bit - bit position
   * @return consteval bit_mask - the single bit mask
   */
  static consteval bit_mask from(u32 p_bit)
  {
    return { .position = p_bit, .width = 1 };
  }

  /// @return u32 - mask of `width` ones, not shifted to its position
  constexpr u32 origin() const
  {
    if (width >= 32) {
      return 0xFFFF'FFFF;
    }
    return (u32{ 1 } << width) - 1U;
  }

  /// @return u32 - mask of `width` ones shifted to its position
  constexpr u32 value() const
  {
    return origin() << position;
  }
};

/**
 * @brief Return a register value with a field replaced
 *
 * Bits of `p_field_value` that do not fit in the field are dropped.
 *
 * @param p_register - current register value
 * @param p_mask - field to replace
 * @param p_field_value - new value of the field, not shifted
 * @return constexpr u32 - the updated register value
 */
constexpr u32 insert(u32 p_register, bit_mask p_mask, u32 p_field_value)
{
  auto const cleared = p_register & ~p_mask.value();
  return cleared | ((p_field_value & p_mask.origin()) << p_mask.position);
}

/// @return u32 - the value of a field within a register value
constexpr u32 extract(u32 p_register, bit_mask p_mask)
{
  return (p_register >> p_mask.position) & p_mask.origin();
}

/// @return true - if any bit of the mask is set in the register value
constexpr bool is_set(u32 p_register, bit_mask p_mask)
{
  return (p_register & p_mask.value()) != 0;
}

/// Bit fields of Control register 1
namespace cr1 {
/// Serial peripheral enable
inline constexpr auto spe = bit_mask::from(0);
/// Master transfer start
inline constexpr auto cstart = bit_mask::from(9);
/// Internal slave select level used when SSM is set
inline constexpr auto ssi = bit_mask::from(12);
}  // namespace cr1

/// Bit fields of Control register 2
namespace cr2 {
/// Number of data words in the current transaction, 0 for endless
inline constexpr auto tsize = bit_mask::from(0, 15);
}  // namespace cr2

/// Bit fields of Configuration register 1
namespace cfg1 {
/// Number of bits in a data frame minus one
inline constexpr auto dsize = bit_mask::from(0, 4);
/// Master baud rate prescaler
inline constexpr auto mbr = bit_mask::from(28, 30);
}  // namespace cfg1

/// Bit fields of Configuration register 2
namespace cfg2 {
/// Master SS idleness, in SCK cycles
inline constexpr auto mssi = bit_mask::from(0, 3);
/// Swap functionality of MISO and MOSI pins
inline constexpr auto ioswp = bit_mask::from(15);
/// Communication direction
inline constexpr auto comm = bit_mask::from(17, 18);
/// Master configuration
inline constexpr auto master = bit_mask::from(22);
/// Data frame format, 0 is MSB first
inline constexpr auto lsbfrst = bit_mask::from(23);
/// Clock phase
inline constexpr auto cpha = bit_mask::from(24);
/// Clock polarity
inline constexpr auto cpol = bit_mask::from(25);
/// Software management of the SS signal
inline constexpr auto ssm = bit_mask::from(26);
/// SS output enable
inline constexpr auto ssoe = bit_mask::from(29);
}  // namespace cfg2

/// Bit fields of the Status register
namespace sr {
/// Rx-packet available
inline constexpr auto rxp = bit_mask::from(0);
/// Tx-packet space available
inline constexpr auto txp = bit_mask::from(1);
/// End of transfer
inline constexpr auto eot = bit_mask::from(3);
/// Underrun
inline constexpr auto udr = bit_mask::from(5);
/// Overrun
inline constexpr auto ovr = bit_mask::from(6);
/// CRC error
inline constexpr auto crce = bit_mask::from(7);
/// Mode fault
inline constexpr auto modf = bit_mask::from(9);
}  // namespace sr

/// Bit fields of the Interrupt enable register
namespace ier {
inline constexpr auto rxpie = bit_mask::from(0);
inline constexpr auto txpie = bit_mask::from(1);
inline constexpr auto eotie = bit_mask::from(3);
inline constexpr auto udrie = bit_mask::from(5);
inline constexpr auto ovrie = bit_mask::from(6);
inline constexpr auto crceie = bit_mask::from(7);
inline constexpr auto modfie = bit_mask::from(9);
}  // namespace ier

/// Register access widths supported by the SPI data registers
template<typename T>
concept mmio_width =
  std::same_as<T, u8> || std::same_as<T, u16> || std::same_as<T, u32>;

/**
 * @brief Read a memory mapped register with a single access of exactly
 * `sizeof(T)` bytes.
 *
 * The access is volatile and is not merged, split or reordered with respect
 * to other volatile accesses. The SPI data registers pop one frame from the
 * RX FIFO per read, so the access width selects how many frames are
 * consumed: it must match the frame size of the peripheral.
 *
 * @tparam T - access width, u8, u16 or u32
 * @param p_address - address of the register
 * @return T - value read
 */
template<mmio_width T>
[[nodiscard]] inline T mmio_read(uptr p_address)
{
  return *reinterpret_cast<T const volatile*>(p_address);
}

/**
 * @brief Write a memory mapped register with a single access of exactly
 * `sizeof(T)` bytes.
 *
 * The write is complete, as far as program order is concerned, before any
 * following volatile access is issued. The SPI data registers push one frame
 * into the TX FIFO per write of the frame's width.
 *
 * @tparam T - access width, u8, u16 or u32
 * @param p_address - address of the register
 * @param p_value - value to write
 */
template<mmio_width T>
inline void mmio_write(uptr p_address, T p_value)
{
  *reinterpret_cast<T volatile*>(p_address) = p_value;
}
}  // namespace h7spi
