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

#include <libh7spi/pins.hpp>

#include <libh7spi/error.hpp>

#include "helpers.hpp"

#include <boost/ut.hpp>

namespace h7spi {
namespace {
constexpr pin_id pa6_af8{ .port = gpio_port::a, .pin = 6, .function = 8 };
constexpr pin_id pb3_af6{ .port = gpio_port::b, .pin = 3, .function = 6 };

// Compile time checks available to drivers
static_assert(pins_t<pa5_af5, pa6_af5, pa7_af5>::valid_for(1));
static_assert(not pins_t<pa5_af5, pa6_af5, pa7_af5>::valid_for(6));
static_assert(pins_t<pa5_af8, no_miso, no_mosi>::valid_for(6));
static_assert(pins_t<no_sck, no_miso, no_mosi>::valid_for(4));
static_assert(pins_param<pins_t<pa5_af5, no_miso, no_mosi>>);
}  // namespace

boost::ut::suite<"pins_test"> pins_test = []() {
  using namespace boost::ut;

  "capability tables exist for every instance"_test = []() {
    for (u64 bus = 1; bus <= 6; bus++) {
      expect(not pin_capabilities(bus).empty()) << "bus " << bus;
    }
    expect(pin_capabilities(0).empty());
    expect(pin_capabilities(7).empty());
  };

  "pin valid for its role"_test = []() {
    expect(is_valid_pin(1, pin_role::sck, pa5_af5));
    expect(is_valid_pin(1, pin_role::miso, pa6_af5));
    expect(is_valid_pin(1, pin_role::mosi, pa7_af5));
    expect(is_valid_pin(6, pin_role::sck, pa5_af8));
    expect(is_valid_pin(6, pin_role::sck, pg13_af5));
  };

  "pin rejected for another role"_test = []() {
    expect(not is_valid_pin(1, pin_role::sck, pa6_af5));
    expect(not is_valid_pin(1, pin_role::mosi, pa5_af5));
  };

  "pin rejected on another instance"_test = []() {
    // PA5 reaches SPI6 through AF8, not AF5
    expect(not is_valid_pin(6, pin_role::sck, pa5_af5));
    expect(not is_valid_pin(1, pin_role::sck, pa5_af8));
  };

  "pin rejected with the wrong alternate function"_test = []() {
    expect(not is_valid_pin(1, pin_role::sck, pb3_af6));
  };

  "filler is valid for every role and instance"_test = []() {
    for (u64 bus = 1; bus <= 6; bus++) {
      expect(is_valid_pin(bus, pin_role::sck, no_sck));
      expect(is_valid_pin(bus, pin_role::miso, no_miso));
      expect(is_valid_pin(bus, pin_role::mosi, no_mosi));
    }
  };

  "first_invalid_role() checks sck, then miso, then mosi"_test = []() {
    // Setup
    pin_assignment const valid{ .sck = pa5_af8,
                                .miso = pa6_af8,
                                .mosi = no_mosi };
    pin_assignment const bad_miso{ .sck = pa5_af8,
                                   .miso = pa6_af5,
                                   .mosi = pa7_af5 };
    pin_assignment const all_bad{ .sck = pa5_af5,
                                  .miso = pa6_af5,
                                  .mosi = pa7_af5 };

    // Exercise + Verify
    expect(not first_invalid_role(6, valid).has_value());
    expect(pin_role::miso == first_invalid_role(6, bad_miso).value());
    expect(pin_role::sck == first_invalid_role(6, all_bad).value());
  };

  "validate_pins() reports the rejected role"_test = []() {
    // Setup
    int const driver = 0;
    pin_assignment const pins_in{ .sck = pa5_af5,
                                  .miso = no_miso,
                                  .mosi = no_mosi };

    // Exercise
    try {
      validate_pins(6, pins_in, &driver);
      expect(false) << "invalid_pin_assignment was not thrown";
    } catch (invalid_pin_assignment const& p_error) {
      // Verify
      expect(that % static_cast<u8>(pin_role::sck) == p_error.role);
      expect(&driver == p_error.instance());
    }

    expect(nothrow([&] { validate_pins(1, pins_in); }));
  };

  "pins<> value"_test = []() {
    constexpr auto assignment = pins<pa5_af5, pa6_af5>;

    expect(pa5_af5 == assignment.value.sck);
    expect(pa6_af5 == assignment.value.miso);
    expect(no_mosi == assignment.value.mosi);
  };
};
}  // namespace h7spi
