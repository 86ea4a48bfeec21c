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

#include <array>
#include <utility>

#include <libh7spi/error.hpp>

namespace h7spi {
namespace {
// Index 0 is unused so that the bus number indexes directly
std::array<bool, peripheral_count + 1> owned_peripherals{};

void acquire(u64 p_bus, void const* p_instance)
{
  if (not is_valid_bus(p_bus)) {
    safe_throw(argument_out_of_domain(p_instance));
  }
  if (owned_peripherals[p_bus]) {
    safe_throw(device_or_resource_busy(p_instance));
  }
  owned_peripherals[p_bus] = true;
}
}  // namespace

peripheral_handle::peripheral_handle(runtime, u64 p_bus)
{
  acquire(p_bus, this);
  m_bus = static_cast<u8>(p_bus);
  // NOLINTNEXTLINE(performance-no-int-to-ptr)
  m_reg = reinterpret_cast<spi_reg_t*>(info().address);
}

peripheral_handle::peripheral_handle(unsafe, u64 p_bus, spi_reg_t* p_registers)
{
  if (p_registers == nullptr) {
    safe_throw(argument_out_of_domain(this));
  }
  acquire(p_bus, this);
  m_bus = static_cast<u8>(p_bus);
  m_reg = p_registers;
}

peripheral_handle::peripheral_handle(peripheral_handle&& p_other) noexcept
  : m_reg(std::exchange(p_other.m_reg, nullptr))
  , m_bus(std::exchange(p_other.m_bus, 0))
{
}

peripheral_handle& peripheral_handle::operator=(
  peripheral_handle&& p_other) noexcept
{
  if (this != &p_other) {
    reset();
    m_reg = std::exchange(p_other.m_reg, nullptr);
    m_bus = std::exchange(p_other.m_bus, 0);
  }
  return *this;
}

peripheral_handle::~peripheral_handle()
{
  reset();
}

bool peripheral_handle::is_owned(u64 p_bus)
{
  return is_valid_bus(p_bus) && owned_peripherals[p_bus];
}

void peripheral_handle::reset() noexcept
{
  if (m_reg != nullptr) {
    owned_peripherals[m_bus] = false;
  }
  m_reg = nullptr;
  m_bus = 0;
}
}  // namespace h7spi
