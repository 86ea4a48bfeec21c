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

#include <libh7spi/spi.hpp>

#include <libh7spi/clock.hpp>
#include <libh7spi/error.hpp>
#include <libh7spi/registers.hpp>

namespace h7spi::detail {
clock_plan plan_peripheral(peripheral_handle const& p_handle,
                           u8 p_word_size,
                           spi_config const& p_config,
                           hertz p_frequency,
                           clock_tree& p_clocks,
                           void const* p_instance)
{
  if (not p_handle.owns()) {
    safe_throw(operation_not_permitted(p_instance));
  }

  if (word_size_for(p_config.frame_size()) != p_word_size) {
    safe_throw(operation_not_supported(p_instance));
  }

  return resolve_clock(
    p_clocks, p_handle.info().clock_group, p_frequency, p_config, p_instance);
}

void program_peripheral(peripheral_handle const& p_handle,
                        spi_config const& p_config,
                        clock_plan const& p_plan,
                        clock_tree& p_clocks)
{
  p_clocks.enable(p_handle.info().enable);

  auto& reg = *p_handle.registers();

  // Disable SS output while the peripheral is being configured
  reg.cfg2 = 0;

  u32 config1 = reg.cfg1;
  config1 = insert(config1, cfg1::mbr, static_cast<u32>(p_plan.prescaler));
  config1 = insert(config1, cfg1::dsize, p_config.frame_size() - 1U);
  reg.cfg1 = config1;

  reg.cr2 = insert(0, cr2::tsize, p_config.transfer_size());

  // ssi: select slave = master mode
  reg.cr1 = cr1::ssi.value();

  u32 config2 = 0;
  config2 =
    insert(config2, cfg2::cpha, data_valid_on_trailing_edge(p_config.bus_mode()));
  config2 = insert(config2, cfg2::cpol, clock_idles_high(p_config.bus_mode()));
  config2 = insert(config2, cfg2::master, 1);
  // MSB first
  config2 = insert(config2, cfg2::lsbfrst, 0);
  config2 = insert(config2, cfg2::ssoe, p_config.managed_cs());
  config2 = insert(config2, cfg2::ssm, not p_config.managed_cs());
  config2 = insert(config2, cfg2::mssi, p_plan.cs_delay_cycles);
  config2 = insert(config2, cfg2::ioswp, p_config.miso_mosi_swapped());
  config2 = insert(
    config2, cfg2::comm, static_cast<u32>(p_config.communication_mode()));
  reg.cfg2 = config2;

  // spe: enable the SPI bus
  reg.cr1 = cr1::ssi.value() | cr1::spe.value();
}

void throw_on_error(u32 p_status, void const* p_instance)
{
  if (is_set(p_status, sr::ovr)) {
    safe_throw(overrun(p_instance));
  }
  if (is_set(p_status, sr::modf)) {
    safe_throw(mode_fault(p_instance));
  }
  if (is_set(p_status, sr::crce)) {
    safe_throw(crc_error(p_instance));
  }
}

void set_interrupt(spi_reg_t& p_reg, event p_event, bool p_enable)
{
  u32 mask = 0;
  switch (p_event) {
    case event::receive_ready:
      mask = ier::rxpie.value();
      break;
    case event::transmit_ready:
      mask = ier::txpie.value();
      break;
    case event::error:
      mask = ier::udrie.value() | ier::ovrie.value() | ier::crceie.value() |
             ier::modfie.value();
      break;
    case event::transaction_complete:
      mask = ier::eotie.value();
      break;
  }

  u32 const enabled = p_reg.ier;
  p_reg.ier = p_enable ? (enabled | mask) : (enabled & ~mask);
}

void start_transaction(spi_reg_t& p_reg)
{
  p_reg.cr1 = p_reg.cr1 | cr1::cstart.value();
}
}  // namespace h7spi::detail
