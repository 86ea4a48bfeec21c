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

namespace h7spi {
/**
 * @brief An interface for customizing the behavior of drivers when they must
 * wait for I/O to complete.
 *
 * The blocking helpers in `blocking.hpp` call `wait()` every time the SPI
 * peripheral cannot accept or deliver a word yet. Applications use this to
 * decide what the CPU does in the meantime:
 *
 * 1. Block the current thread of execution, if an RTOS or OS is used.
 * 2. Put the system to sleep until the SPI interrupt fires.
 * 3. Perform a small chunk of work.
 * 4. Nothing at all, and poll again. See `polling_io_waiter()`.
 *
 * When the SPI interrupt is used as a wake signal, the interrupt handler calls
 * `resume()` and must not touch the SPI driver itself.
 */
class io_waiter
{
public:
  /**
   * @brief Execute this function when your driver is waiting on something
   *
   * The wait function may return before the awaited condition is met, so the
   * caller must check its condition in a loop.
   *
   * USAGE:
   *
   *      while (not spi.try_send(word)) {
   *          waiter.wait();
   *      }
   *
   */
  void wait()
  {
    driver_wait();
  }

  /**
   * @brief Execute this function within an interrupt service routine to resume
   *        normal operation.
   *
   * This can be called from an interrupt context and MUST NOT THROW. It must
   * only unblock the waiting thread or wake the device.
   *
   */
  void resume() noexcept
  {
    driver_resume();
  }

  virtual ~io_waiter() = default;

private:
  virtual void driver_wait() = 0;
  virtual void driver_resume() noexcept = 0;
};

/**
 * @brief Returns a reference to a statically allocated polling io waiter
 *
 * Polling io waiter is a waiter that does nothing. It simply returns when wait
 * or resume are called, causing the caller to poll the peripheral until it is
 * ready. Non-DMA SPI reaches its maximum throughput this way.
 *
 * @return io_waiter& - reference to statically allocated polling io waiter
 * object.
 */
inline io_waiter& polling_io_waiter()
{
  class polling_io_waiter_t : public io_waiter
  {
    void driver_wait() final
    {
      // Do nothing and allow the outer loop to poll the peripheral again.
      return;
    }
    void driver_resume() noexcept final
    {
      // Since wait didn't do anything, neither does resume.
      return;
    }
  };

  static polling_io_waiter_t waiter;

  return waiter;
}
}  // namespace h7spi
