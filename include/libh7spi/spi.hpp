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
#include <utility>

#include "clock.hpp"
#include "config.hpp"
#include "error.hpp"
#include "initializers.hpp"
#include "peripheral.hpp"
#include "pins.hpp"
#include "registers.hpp"
#include "units.hpp"

namespace h7spi {
/**
 * @brief Interrupt events
 *
 */
enum class event : u8
{
  /// New data has been received (RXP)
  receive_ready,
  /// Data can be sent (TXP)
  transmit_ready,
  /// An error occurred: underrun, overrun, CRC error or mode fault. The four
  /// sources are always enabled and disabled together.
  error,
  /// A transaction has completed (EOT)
  transaction_complete,
};

/**
 * @brief Width in bytes of the data register access for a frame size
 *
 * @param p_frame_size - bits per frame
 * @return u8 - 1 for 4 to 8 bits, 2 for 9 to 16 bits, 4 for 17 to 32 bits
 */
constexpr u8 word_size_for(u8 p_frame_size)
{
  if (p_frame_size <= 8) {
    return 1;
  }
  if (p_frame_size <= 16) {
    return 2;
  }
  return 4;
}

namespace detail {
/**
 * @brief Check the configuration and resolve the clock settings for a
 * peripheral, without touching its registers.
 *
 * @throws h7spi::operation_not_supported - if the word size does not match
 * the frame size, or the kernel clock selector value is reserved.
 * @throws h7spi::clock_not_running - if the selected kernel clock is off
 * @throws h7spi::argument_out_of_domain - if the frequency is 0 or above the
 * kernel clock.
 */
clock_plan plan_peripheral(peripheral_handle const& p_handle,
                           u8 p_word_size,
                           spi_config const& p_config,
                           hertz p_frequency,
                           clock_tree& p_clocks,
                           void const* p_instance);

/**
 * @brief Enable the bus clock of the peripheral, write its configuration and
 * enable it.
 *
 */
void program_peripheral(peripheral_handle const& p_handle,
                        spi_config const& p_config,
                        clock_plan const& p_plan,
                        clock_tree& p_clocks);

/**
 * @brief Throw the highest priority error flagged in a status value
 *
 * Priority is overrun, then mode fault, then CRC error.
 *
 * @param p_status - value of the SR register
 * @param p_instance - driver reporting the error
 */
void throw_on_error(u32 p_status, void const* p_instance);

/// Set or clear the interrupt enable bits of an event
void set_interrupt(spi_reg_t& p_reg, event p_event, bool p_enable);

/// Request the start of a master transaction
void start_transaction(spi_reg_t& p_reg);
}  // namespace detail

/**
 * @brief Master mode SPI driver for the STM32H7 SPI peripherals
 *
 * The driver takes ownership of the peripheral's register block, programs it
 * once on construction and then exchanges words through the non-blocking
 * `try_send()` and `try_receive()` functions. Blocking transfers are built on
 * top of these with `h7spi::write()` and `h7spi::transfer()`.
 *
 * The word type selects the access width of the data registers and must be
 * the smallest of u8, u16 or u32 that holds the configured frame size.
 *
 * The driver is not synchronized. If interrupts are enabled with `listen()`,
 * the interrupt handler and the thread polling the driver must not access
 * the driver at the same time. The recommended usage is to use the interrupt
 * only to wake the thread that owns the driver.
 *
 * @tparam word_t - u8, u16 or u32
 */
template<mmio_width word_t>
class spi_master
{
public:
  static constexpr u8 word_size = sizeof(word_t);

  /**
   * @brief Construct a driver with pins checked at compile time
   *
   * USAGE:
   *
   *      h7spi::spi_master<h7spi::u8> spi(
   *        h7spi::bus<1>,
   *        h7spi::pins<pa5_af5, pa6_af5, pa7_af5>,
   *        h7spi::peripheral_handle(h7spi::bus<1>),
   *        h7spi::mode::m0,
   *        1_MHz,
   *        clocks);
   *
   * @param p_bus - SPI instance the pins are checked against
   * @param p_pins - pin assignment, rejected at compile time if invalid
   * @param p_handle - ownership of the peripheral, must be for `p_bus`
   * @param p_config - configuration of the peripheral
   * @param p_frequency - requested bus frequency
   * @param p_clocks - clock tree oracle
   * @throws h7spi::argument_out_of_domain - if the handle is not for `p_bus`
   */
  spi_master(bus_param auto p_bus,
             pins_param auto p_pins,
             peripheral_handle p_handle,
             spi_config const& p_config,
             hertz p_frequency,
             clock_tree& p_clocks)
    : m_handle(std::move(p_handle))
    , m_config(p_config)
  {
    static_assert(is_valid_bus(p_bus()), "Supported SPI buses are 1 to 6");
    static_assert(p_pins.valid_for(p_bus()),
                  "Pin assignment is not valid for this SPI bus");

    if (m_handle.bus() != p_bus()) {
      safe_throw(argument_out_of_domain(this));
    }
    initialize(p_frequency, p_clocks);
  }

  /**
   * @brief Construct a driver with pins checked at runtime
   *
   * @param p_handle - ownership of the peripheral
   * @param p_pins - pin assignment, checked before any register is written
   * @param p_config - configuration of the peripheral
   * @param p_frequency - requested bus frequency
   * @param p_clocks - clock tree oracle
   * @throws h7spi::invalid_pin_assignment - if a pin cannot serve its role
   * @throws h7spi::operation_not_supported - if `word_t` does not match the
   * frame size
   * @throws h7spi::clock_not_running - if the kernel clock is not running
   * @throws h7spi::argument_out_of_domain - if the frequency is 0 or above the
   * kernel clock.
   */
  spi_master(peripheral_handle p_handle,
             pin_assignment const& p_pins,
             spi_config const& p_config,
             hertz p_frequency,
             clock_tree& p_clocks)
    : m_handle(std::move(p_handle))
    , m_config(p_config)
  {
    validate_pins(m_handle.bus(), p_pins, this);
    initialize(p_frequency, p_clocks);
  }

  /**
   * @brief Construct a driver without checking the pins
   *
   * It is the responsibility of the caller to have muxed valid pins to the
   * peripheral.
   *
   * @param p_handle - ownership of the peripheral
   * @param p_config - configuration of the peripheral
   * @param p_frequency - requested bus frequency
   * @param p_clocks - clock tree oracle
   */
  spi_master(unsafe,
             peripheral_handle p_handle,
             spi_config const& p_config,
             hertz p_frequency,
             clock_tree& p_clocks)
    : m_handle(std::move(p_handle))
    , m_config(p_config)
  {
    initialize(p_frequency, p_clocks);
  }

  spi_master(spi_master const&) = delete;
  spi_master& operator=(spi_master const&) = delete;
  spi_master(spi_master&&) noexcept = default;
  spi_master& operator=(spi_master&&) noexcept = default;
  ~spi_master() = default;

  /**
   * @brief Read one word if one has been received
   *
   * Performs a single read of the status register. Errors take priority over
   * received data.
   *
   * @return std::optional<word_t> - the received word, or std::nullopt if no
   * word is available yet. Call again later.
   * @throws h7spi::overrun - if the overrun flag is set
   * @throws h7spi::mode_fault - if the mode fault flag is set
   * @throws h7spi::crc_error - if the CRC error flag is set
   * @throws h7spi::operation_not_permitted - if the peripheral was released
   */
  std::optional<word_t> try_receive()
  {
    auto& reg = registers();
    u32 const status = reg.sr;

    detail::throw_on_error(status, this);

    if (is_set(status, sr::rxp)) {
      return mmio_read<word_t>(reinterpret_cast<uptr>(&reg.rxdr));
    }
    return std::nullopt;
  }

  /**
   * @brief Write one word if there is space for it
   *
   * Performs a single read of the status register. Errors take priority over
   * transmit space. Each accepted word is followed by exactly one transaction
   * start request.
   *
   * @param p_word - word to send
   * @return true - if the word was accepted
   * @return false - if there is no space yet. Call again later.
   * @throws h7spi::overrun - if the overrun flag is set
   * @throws h7spi::mode_fault - if the mode fault flag is set
   * @throws h7spi::crc_error - if the CRC error flag is set
   * @throws h7spi::operation_not_permitted - if the peripheral was released
   */
  bool try_send(word_t p_word)
  {
    auto& reg = registers();
    u32 const status = reg.sr;

    detail::throw_on_error(status, this);

    if (is_set(status, sr::txp)) {
      mmio_write<word_t>(reinterpret_cast<uptr>(&reg.txdr), p_word);
      detail::start_transaction(reg);
      return true;
    }
    return false;
  }

  /**
   * @brief Enable the interrupt of an event
   *
   * @param p_event - event to enable
   */
  void listen(event p_event)
  {
    detail::set_interrupt(registers(), p_event, true);
  }

  /**
   * @brief Disable the interrupt of an event
   *
   * @param p_event - event to disable
   */
  void unlisten(event p_event)
  {
    detail::set_interrupt(registers(), p_event, false);
  }

  /// @return true - if new data to transmit can be written
  [[nodiscard]] bool is_txp()
  {
    return is_set(registers().sr, sr::txp);
  }

  /// @return true - if new data has been received and can be read
  [[nodiscard]] bool is_rxp()
  {
    return is_set(registers().sr, sr::rxp);
  }

  /// @return true - if the peripheral experienced a mode fault
  [[nodiscard]] bool is_modf()
  {
    return is_set(registers().sr, sr::modf);
  }

  /// @return true - if data was received while the receive register was
  /// already filled
  [[nodiscard]] bool is_ovr()
  {
    return is_set(registers().sr, sr::ovr);
  }

  /**
   * @brief Actual bus clock rate
   *
   * @return hertz - kernel clock divided by the selected prescaler
   */
  [[nodiscard]] hertz clock_rate() const
  {
    return m_plan.bus_frequency();
  }

  /// @return clock_plan const& - clock settings programmed on construction
  [[nodiscard]] clock_plan const& plan() const
  {
    return m_plan;
  }

  /// @return spi_config const& - configuration programmed on construction
  [[nodiscard]] spi_config const& config() const
  {
    return m_config;
  }

  /**
   * @brief Give ownership of the peripheral back to the caller
   *
   * The peripheral is left enabled. Every other function of this driver
   * throws h7spi::operation_not_permitted afterwards.
   *
   * USAGE:
   *
   *      auto handle = std::move(spi).release();
   *
   * @return peripheral_handle - ownership of the peripheral
   */
  [[nodiscard]] peripheral_handle release() &&
  {
    return std::move(m_handle);
  }

private:
  void initialize(hertz p_frequency, clock_tree& p_clocks)
  {
    m_plan = detail::plan_peripheral(
      m_handle, word_size, m_config, p_frequency, p_clocks, this);
    detail::program_peripheral(m_handle, m_config, m_plan, p_clocks);
  }

  spi_reg_t& registers()
  {
    if (not m_handle.owns()) {
      safe_throw(operation_not_permitted(this));
    }
    return *m_handle.registers();
  }

  peripheral_handle m_handle;
  spi_config m_config;
  clock_plan m_plan{};
};
}  // namespace h7spi
