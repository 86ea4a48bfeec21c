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

namespace h7spi {
void validate_pins(u64 p_bus,
                   pin_assignment const& p_pins,
                   void const* p_instance)
{
  auto const rejected = first_invalid_role(p_bus, p_pins);
  if (rejected) {
    safe_throw(
      invalid_pin_assignment(static_cast<u8>(*rejected), p_instance));
  }
}
}  // namespace h7spi
