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
#include <system_error>
#include <type_traits>

namespace h7spi {

template<class thrown_t>
void safe_throw(thrown_t&& p_thrown_object)
{
  static_assert(
    std::is_trivially_destructible_v<std::remove_cvref_t<thrown_t>>,
    "safe_throw() only works with trivially destructible thrown types");

  throw p_thrown_object;
}

/**
 * @brief Base exception class for all libh7spi related exceptions
 *
 */
class exception
{
public:
  constexpr exception(std::errc p_error_code, void const* p_instance)
    : m_instance(p_instance)
    , m_error_code(p_error_code)
  {
  }

  /**
   * @brief address of the object that threw an exception
   *
   * If the exception was thrown by a free function, this will be a nullptr.
   * The address allows handlers to compare it against the drivers in scope of
   * the try block and determine which one failed. Use it for lookup only.
   *
   */
  [[nodiscard]] void const* instance() const
  {
    return m_instance;
  }

  /**
   * @brief Convert this exception to the closest C++ error code
   *
   * Useful when a C API expects an error code back or when logging the kind
   * of failure. Prefer catching the derived classes for recovery.
   *
   * @return std::errc - error code represented by the exception
   */
  [[nodiscard]] std::errc error_code() const
  {
    return m_error_code;
  }

private:
  void const* m_instance = nullptr;
  std::errc m_error_code{};
};

static_assert(std::is_trivially_destructible_v<exception>,
              "h7spi::exception MUST be trivially "
              "destructible.");

/**
 * @brief Base class of all errors reported by the SPI hardware during a
 * transfer.
 *
 * Transfer errors are sticky in hardware. The driver reports them on every
 * call to `try_send()` or `try_receive()` until the flag is cleared by the
 * application through the IFCR register, or by disabling and re-enabling the
 * peripheral. Catch this type to handle any hardware error condition,
 * including ones added in the future.
 *
 */
struct transfer_error : public exception
{
  constexpr transfer_error(void const* p_instance)
    : exception(std::errc::io_error, p_instance)
  {
  }
};

/**
 * @brief Raised when the receive register was overwritten before being read
 *
 * # How to recover from this?
 *
 * Clear the OVR flag (IFCR.OVRC) and drop the transaction. Data received
 * since the previous successful read is lost. Reading faster or lowering the
 * clock rate prevents a repeat.
 */
struct overrun : public transfer_error
{
  constexpr overrun(void const* p_instance)
    : transfer_error(p_instance)
  {
  }
};

/**
 * @brief Raised when another controller pulled the slave select line while
 * this peripheral was acting as the bus controller.
 *
 * The hardware clears SPE and drops to slave mode when this happens. The
 * peripheral must be released and constructed again.
 */
struct mode_fault : public transfer_error
{
  constexpr mode_fault(void const* p_instance)
    : transfer_error(p_instance)
  {
  }
};

/// Raised when the hardware CRC check failed
struct crc_error : public transfer_error
{
  constexpr crc_error(void const* p_instance)
    : transfer_error(p_instance)
  {
  }
};

/**
 * @brief Raised when a driver cannot configure itself based on the settings
 * passed to it.
 *
 * Normally, the configuration settings of an application are determined early
 * at boot. If the driver could not achieve them, the application was never
 * valid to begin with. This is considered a bug and NOT RECOVERABLE. Either
 * the code must be modified or the hardware changed to resolve this error.
 *
 */
struct operation_not_supported : public exception
{
  constexpr operation_not_supported(void const* p_instance)
    : exception(std::errc::operation_not_supported, p_instance)
  {
  }
};

/**
 * @brief Raised when the kernel clock selected for a peripheral is not
 * running.
 *
 * The clock tree must enable the selected source, or select a running one,
 * before the SPI driver is constructed.
 */
struct clock_not_running : public operation_not_supported
{
  constexpr clock_not_running(std::uint8_t p_source, void const* p_instance)
    : operation_not_supported(p_instance)
    , source(p_source)
  {
  }

  /// Value of the `h7spi::clock_source` that was selected but not running
  std::uint8_t source;
};

/**
 * @brief Raised when an operation could not be performed because it is no
 * longer permitted to use a resource.
 *
 * This happens when a driver is used after its peripheral handle has been
 * released. Construct a new driver from the handle to continue.
 */
struct operation_not_permitted : public exception
{
  constexpr operation_not_permitted(void const* p_instance)
    : exception(std::errc::operation_not_permitted, p_instance)
  {
  }
};

/**
 * @brief Raised when an input passed to a function is outside the domain of the
 * function.
 *
 * Examples are a frame size outside of 4 to 32 bits, a negative chip select
 * delay, or a requested clock rate of zero or above the kernel clock.
 */
struct argument_out_of_domain : public exception
{
  constexpr argument_out_of_domain(void const* p_instance)
    : exception(std::errc::argument_out_of_domain, p_instance)
  {
  }
};

/**
 * @brief Raised when a pin cannot serve the role it was assigned for the
 * targeted peripheral.
 *
 */
struct invalid_pin_assignment : public exception
{
  constexpr invalid_pin_assignment(std::uint8_t p_role, void const* p_instance)
    : exception(std::errc::invalid_argument, p_instance)
    , role(p_role)
  {
  }

  /// Value of the `h7spi::pin_role` that was rejected
  std::uint8_t role;
};

/**
 * @brief Raised when a peripheral is already owned by another handle
 *
 * # How to recover from this?
 *
 * Destroy or release the existing owner first. Two owners of the same
 * register block is never a valid state.
 */
struct device_or_resource_busy : public exception
{
  constexpr device_or_resource_busy(void const* p_instance)
    : exception(std::errc::device_or_resource_busy, p_instance)
  {
  }
};
}  // namespace h7spi
