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

#include <libh7spi/error.hpp>

#include <system_error>

#include <boost/ut.hpp>

namespace h7spi {
boost::ut::suite<"error_test"> error_test = []() {
  using namespace boost::ut;

  "safe_throw() carries instance and error code"_test = []() {
    // Setup
    int const driver = 0;

    // Exercise
    try {
      safe_throw(overrun(&driver));
      expect(false) << "overrun was not thrown";
    } catch (transfer_error const& p_error) {
      // Verify
      expect(&driver == p_error.instance());
      expect(std::errc::io_error == p_error.error_code());
    }
  };

  "hardware errors share the transfer_error base"_test = []() {
    expect(throws<transfer_error>([] { safe_throw(overrun(nullptr)); }));
    expect(throws<transfer_error>([] { safe_throw(mode_fault(nullptr)); }));
    expect(throws<transfer_error>([] { safe_throw(crc_error(nullptr)); }));
    expect(throws<exception>([] { safe_throw(crc_error(nullptr)); }));
  };

  "clock_not_running is an operation_not_supported"_test = []() {
    try {
      safe_throw(clock_not_running(7, nullptr));
      expect(false) << "clock_not_running was not thrown";
    } catch (operation_not_supported const& p_error) {
      expect(std::errc::operation_not_supported == p_error.error_code());
    }

    try {
      safe_throw(clock_not_running(7, nullptr));
    } catch (clock_not_running const& p_error) {
      expect(that % 7 == p_error.source);
    }
  };

  "error codes"_test = []() {
    expect(std::errc::operation_not_permitted ==
           operation_not_permitted(nullptr).error_code());
    expect(std::errc::argument_out_of_domain ==
           argument_out_of_domain(nullptr).error_code());
    expect(std::errc::device_or_resource_busy ==
           device_or_resource_busy(nullptr).error_code());
    expect(std::errc::invalid_argument ==
           invalid_pin_assignment(2, nullptr).error_code());
    expect(that % 2 == invalid_pin_assignment(2, nullptr).role);
  };
};
}  // namespace h7spi
