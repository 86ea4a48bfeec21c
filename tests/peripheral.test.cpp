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

#include <libh7spi/peripheral.hpp>

#include <utility>

#include <libh7spi/error.hpp>

#include "helpers.hpp"

#include <boost/ut.hpp>

namespace h7spi {
boost::ut::suite<"peripheral_test"> peripheral_test = []() {
  using namespace boost::ut;

  "instance table"_test = []() {
    expect(that % 0x4001'3000 == peripherals[0].address);
    expect(that % 0x5800'1400 == peripherals[5].address);
    expect(kernel_clock_group::spi123 == peripherals[2].clock_group);
    expect(kernel_clock_group::spi45 == peripherals[4].clock_group);
    expect(kernel_clock_group::spi6 == peripherals[5].clock_group);
    expect(peripheral_enable{ rcc_enable_register::apb4enr, 5 } ==
           peripherals[5].enable);
    for (u8 i = 0; i < peripheral_count; i++) {
      expect(i + 1 == peripherals[i].bus);
    }
  };

  "runtime handle points at the hardware block"_test = []() {
    // Exercise
    peripheral_handle handle(runtime{}, 4);

    // Verify
    expect(handle.owns());
    expect(that % 4 == handle.bus());
    expect(that % 0x4001'3400 == reinterpret_cast<uptr>(handle.registers()));
    expect(kernel_clock_group::spi45 == handle.info().clock_group);
  };

  "compile time bus selection"_test = []() {
    peripheral_handle handle(bus<2>);

    expect(that % 2 == handle.bus());
    expect(that % 0x4000'3800 == reinterpret_cast<uptr>(handle.registers()));
  };

  "second handle for an owned instance is rejected"_test = []() {
    // Setup
    simulated_spi simulated;
    auto first = simulated.handle(3);

    // Exercise + Verify
    expect(peripheral_handle::is_owned(3));
    expect(throws<device_or_resource_busy>(
      [] { peripheral_handle second(runtime{}, 3); }));
    expect(first.owns());
  };

  "destroying a handle frees the instance"_test = []() {
    // Setup
    simulated_spi simulated;

    // Exercise
    {
      auto handle = simulated.handle(5);
      expect(peripheral_handle::is_owned(5));
    }

    // Verify
    expect(not peripheral_handle::is_owned(5));
    expect(nothrow([&] { auto handle = simulated.handle(5); }));
  };

  "move transfers ownership"_test = []() {
    // Setup
    simulated_spi simulated;
    auto source = simulated.handle(1);

    // Exercise
    peripheral_handle destination(std::move(source));

    // Verify
    expect(not source.owns());  // NOLINT(bugprone-use-after-move)
    expect(that % 0 == source.bus());
    expect(destination.owns());
    expect(&simulated.registers == destination.registers());
    expect(peripheral_handle::is_owned(1));
  };

  "move assignment frees the previous instance"_test = []() {
    // Setup
    simulated_spi first_block;
    simulated_spi second_block;
    auto first = first_block.handle(1);
    auto second = second_block.handle(2);

    // Exercise
    first = std::move(second);

    // Verify
    expect(not peripheral_handle::is_owned(1));
    expect(peripheral_handle::is_owned(2));
    expect(that % 2 == first.bus());
    expect(&second_block.registers == first.registers());
  };

  "invalid bus numbers"_test = []() {
    simulated_spi simulated;

    expect(throws<argument_out_of_domain>(
      [] { peripheral_handle handle(runtime{}, 0); }));
    expect(throws<argument_out_of_domain>(
      [] { peripheral_handle handle(runtime{}, 7); }));
    expect(throws<argument_out_of_domain>(
      [&] { auto handle = simulated.handle(7); }));
    expect(throws<argument_out_of_domain>(
      [] { peripheral_handle handle(unsafe{}, 1, nullptr); }));
    expect(not peripheral_handle::is_owned(1));
  };
};
}  // namespace h7spi
