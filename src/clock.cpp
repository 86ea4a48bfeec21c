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

#include <libh7spi/clock.hpp>

#include <array>
#include <optional>
#include <span>

#include <libh7spi/error.hpp>

namespace h7spi {
namespace {
// Selector tables, indexed by the raw value of the selector field. Values
// past the end of a table are reserved.
constexpr std::array spi123_sources{
  clock_source::pll1_q, clock_source::pll2_p, clock_source::pll3_p,
  clock_source::i2s_ckin, clock_source::per,
};

constexpr std::array spi45_sources{
  clock_source::pclk2,   clock_source::pll2_q,  clock_source::pll3_q,
  clock_source::hsi_ker, clock_source::csi_ker, clock_source::hse,
};

constexpr std::array spi6_sources{
  clock_source::pclk4,   clock_source::pll2_q,  clock_source::pll3_q,
  clock_source::hsi_ker, clock_source::csi_ker, clock_source::hse,
};

constexpr std::span<clock_source const> selector_table(
  kernel_clock_group p_group)
{
  switch (p_group) {
    case kernel_clock_group::spi123:
      return spi123_sources;
    case kernel_clock_group::spi45:
      return spi45_sources;
    case kernel_clock_group::spi6:
      return spi6_sources;
  }
  return {};
}
}  // namespace

clock_source kernel_clock_source(kernel_clock_group p_group,
                                 u32 p_selector,
                                 void const* p_instance)
{
  auto const table = selector_table(p_group);
  if (p_selector >= table.size()) {
    safe_throw(operation_not_supported(p_instance));
  }
  return table[p_selector];
}

std::optional<hertz> kernel_clock(clock_tree& p_clocks,
                                  kernel_clock_group p_group)
{
  auto const selector = p_clocks.kernel_clock_selector(p_group);
  return p_clocks.frequency(kernel_clock_source(p_group, selector));
}

divisor baud_rate_divisor(hertz p_kernel,
                          hertz p_requested,
                          void const* p_instance)
{
  if (p_requested == 0) {
    safe_throw(argument_out_of_domain(p_instance));
  }

  auto const ratio = p_kernel / p_requested;

  if (ratio == 0) {
    // Requested rate is faster than the kernel clock
    safe_throw(argument_out_of_domain(p_instance));
  }
  if (ratio <= 2) {
    return divisor::div2;
  }
  if (ratio <= 5) {
    return divisor::div4;
  }
  if (ratio <= 11) {
    return divisor::div8;
  }
  if (ratio <= 23) {
    return divisor::div16;
  }
  if (ratio <= 47) {
    return divisor::div32;
  }
  if (ratio <= 95) {
    return divisor::div64;
  }
  if (ratio <= 191) {
    return divisor::div128;
  }
  return divisor::div256;
}

u8 cs_delay_cycles(seconds p_delay, hertz p_frequency)
{
  if (not(p_delay > 0.0f)) {
    return 0;
  }

  auto const cycles =
    static_cast<double>(p_delay) * static_cast<double>(p_frequency);

  // Clamp before converting to an integer so that large delays cannot
  // overflow the conversion.
  if (cycles >= static_cast<double>(max_cs_delay_cycles)) {
    return max_cs_delay_cycles;
  }

  // One extra cycle so truncation never shortens the delay
  return static_cast<u8>(static_cast<u32>(cycles) + 1U);
}

clock_plan resolve_clock(clock_tree& p_clocks,
                         kernel_clock_group p_group,
                         hertz p_requested,
                         spi_config const& p_config,
                         void const* p_instance)
{
  auto const selector = p_clocks.kernel_clock_selector(p_group);
  auto const source = kernel_clock_source(p_group, selector, p_instance);
  auto const kernel = p_clocks.frequency(source);

  if (not kernel) {
    safe_throw(clock_not_running(static_cast<u8>(source), p_instance));
  }

  return {
    .source = source,
    .kernel_frequency = *kernel,
    .prescaler = baud_rate_divisor(*kernel, p_requested, p_instance),
    .cs_delay_cycles = cs_delay_cycles(p_config.cs_delay(), p_requested),
  };
}
}  // namespace h7spi
