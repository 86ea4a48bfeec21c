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

#include <array>
#include <optional>
#include <print>
#include <system_error>
#include <utility>

#include <libh7spi/blocking.hpp>
#include <libh7spi/spi.hpp>

using namespace h7spi::literals;

class demo_clock_tree : public h7spi::clock_tree
{
private:
  std::optional<h7spi::hertz> driver_frequency(
    h7spi::clock_source p_source) final
  {
    if (p_source == h7spi::clock_source::pll1_q) {
      return 200_MHz;
    }
    return std::nullopt;
  }

  h7spi::u32 driver_kernel_clock_selector(h7spi::kernel_clock_group) final
  {
    return 0;
  }

  void driver_enable(h7spi::peripheral_enable const& p_enable) final
  {
    std::println("enable bit {} of RCC enable register {}",
                 p_enable.bit,
                 static_cast<int>(p_enable.reg));
  }
};

int main()
{
  int status = 0;
  // Stands in for the peripheral, which reports a word received and space to
  // send at all times.
  h7spi::spi_reg_t registers{};
  registers.sr = 0b11;
  registers.rxdr = 0x42;

  demo_clock_tree clocks;
  constexpr h7spi::pin_id pa5{ .port = h7spi::gpio_port::a,
                               .pin = 5,
                               .function = 5 };
  constexpr h7spi::pin_id pa7{ .port = h7spi::gpio_port::a,
                               .pin = 7,
                               .function = 5 };

  try {
    h7spi::spi_master<h7spi::u8> spi(
      h7spi::bus<1>,
      h7spi::pins<pa5, h7spi::no_miso, pa7>,
      h7spi::peripheral_handle(h7spi::unsafe{}, 1, &registers),
      h7spi::spi_config(h7spi::mode::m3).manage_cs().cs_delay(1_us),
      5_MHz,
      clocks);

    auto const& plan = spi.plan();
    std::println("kernel clock = {} Hz", plan.kernel_frequency);
    std::println("prescaler = /{}", h7spi::divisor_value(plan.prescaler));
    std::println("SCK = {} Hz", spi.clock_rate());
    std::println("CS delay = {} cycles", plan.cs_delay_cycles);

    std::array<h7spi::u8, 4> buffer{ 0xDE, 0xAD, 0xBE, 0xEF };
    h7spi::transfer(spi, buffer);
    std::println("received = {::#04x}", buffer);

    // Released peripherals can be reconfigured
    auto handle = std::move(spi).release();
    h7spi::spi_master<h7spi::u8> slow(
      h7spi::unsafe{}, std::move(handle), h7spi::mode::m0, 0_Hz, clocks);
  } catch (h7spi::argument_out_of_domain const& p_error) {
    std::println("Caught argument_out_of_domain error successfully!");
    std::println("    Object address: {}", p_error.instance());
  } catch (h7spi::exception const& p_error) {
    std::println("Unexpected error: {}",
                 std::make_error_code(p_error.error_code()).message());
    status = -1;
  }

  return status;
}
