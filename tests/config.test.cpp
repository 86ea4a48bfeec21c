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

#include <libh7spi/config.hpp>

#include <cmath>
#include <limits>

#include <libh7spi/error.hpp>

#include <boost/ut.hpp>

namespace h7spi {
boost::ut::suite<"config_test"> config_test = []() {
  using namespace boost::ut;

  "defaults"_test = []() {
    // Exercise
    constexpr spi_config config{};

    // Verify
    expect(mode::m0 == config.bus_mode());
    expect(that % false == config.miso_mosi_swapped());
    expect(that % 0.0f == config.cs_delay());
    expect(that % 8 == config.frame_size());
    expect(that % false == config.managed_cs());
    expect(communication_mode::full_duplex == config.communication_mode());
    expect(that % 0 == config.transfer_size());
  };

  "implicit construction from a mode"_test = []() {
    // Setup
    auto const get_mode = [](spi_config const& p_config) {
      return p_config.bus_mode();
    };

    // Exercise + Verify
    expect(mode::m3 == get_mode(mode::m3));
    expect(spi_config{ mode::m2 } == spi_config(mode::m2));
  };

  "chained builders"_test = []() {
    // Exercise
    constexpr auto config = spi_config(mode::m1)
                              .swap_mosi_miso()
                              .cs_delay(2500_ns)
                              .frame_size(12)
                              .manage_cs()
                              .communication_mode(communication_mode::receiver)
                              .transfer_size(9);

    // Verify
    expect(mode::m1 == config.bus_mode());
    expect(that % true == config.miso_mosi_swapped());
    expect(that % 2500_ns == config.cs_delay());
    expect(that % 12 == config.frame_size());
    expect(that % true == config.managed_cs());
    expect(communication_mode::receiver == config.communication_mode());
    expect(that % 9 == config.transfer_size());
  };

  "builders leave the original untouched"_test = []() {
    // Setup
    spi_config const original(mode::m2);

    // Exercise
    auto const modified = original.frame_size(16).manage_cs();

    // Verify
    expect(that % 8 == original.frame_size());
    expect(that % false == original.managed_cs());
    expect(that % 16 == modified.frame_size());
    expect(original != modified);
  };

  "frame size bounds"_test = []() {
    spi_config const config{};

    expect(that % 4 == config.frame_size(4).frame_size());
    expect(that % 32 == config.frame_size(32).frame_size());
    expect(throws<argument_out_of_domain>(
      [&] { static_cast<void>(config.frame_size(0)); }));
    expect(throws<argument_out_of_domain>(
      [&] { static_cast<void>(config.frame_size(3)); }));
    expect(throws<argument_out_of_domain>(
      [&] { static_cast<void>(config.frame_size(33)); }));
  };

  "frame size is checked before narrowing"_test = []() {
    // Setup
    spi_config const config{};
    // Wraps to 4 if truncated to 8 bits
    int const bits = 260;

    // Exercise + Verify
    expect(throws<argument_out_of_domain>(
      [&] { static_cast<void>(config.frame_size(bits)); }));
    expect(throws<argument_out_of_domain>(
      [&] { static_cast<void>(config.frame_size(-1)); }));
    expect(that % 8 == config.frame_size());
  };

  "transfer size bounds"_test = []() {
    // Setup
    spi_config const config{};
    // Wraps to 4464 if truncated to 16 bits
    long const words = 70'000;

    // Exercise + Verify
    expect(that % 0xFFFF == config.transfer_size(0xFFFF).transfer_size());
    expect(throws<argument_out_of_domain>(
      [&] { static_cast<void>(config.transfer_size(words)); }));
    expect(throws<argument_out_of_domain>(
      [&] { static_cast<void>(config.transfer_size(0x1'0000)); }));
  };

  "chip select delay must be a non-negative number"_test = []() {
    spi_config const config{};

    expect(that % 0.0f == config.cs_delay(0.0f).cs_delay());
    expect(throws<argument_out_of_domain>(
      [&] { static_cast<void>(config.cs_delay(-1.0e-6f)); }));
    expect(throws<argument_out_of_domain>([&] {
      static_cast<void>(
        config.cs_delay(std::numeric_limits<float>::quiet_NaN()));
    }));
  };

  "mode to clock polarity and phase"_test = []() {
    expect(that % false == clock_idles_high(mode::m0));
    expect(that % false == data_valid_on_trailing_edge(mode::m0));
    expect(that % false == clock_idles_high(mode::m1));
    expect(that % true == data_valid_on_trailing_edge(mode::m1));
    expect(that % true == clock_idles_high(mode::m2));
    expect(that % false == data_valid_on_trailing_edge(mode::m2));
    expect(that % true == clock_idles_high(mode::m3));
    expect(that % true == data_valid_on_trailing_edge(mode::m3));
  };
};
}  // namespace h7spi
