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

#include <span>
#include <type_traits>

#include "io_waiter.hpp"
#include "registers.hpp"
#include "spi.hpp"

namespace h7spi {
/**
 * @brief Send a word, waiting until the peripheral accepts it
 *
 * @param p_spi - driver to send on
 * @param p_word - word to send
 * @param p_waiter - called each time the peripheral has no space
 * @throws h7spi::transfer_error - if the hardware reports an error
 */
template<mmio_width word_t>
void send(spi_master<word_t>& p_spi,
          word_t p_word,
          io_waiter& p_waiter = polling_io_waiter())
{
  while (not p_spi.try_send(p_word)) {
    p_waiter.wait();
  }
}

/**
 * @brief Receive a word, waiting until one is available
 *
 * @param p_spi - driver to receive on
 * @param p_waiter - called each time no word is available
 * @return word_t - received word
 * @throws h7spi::transfer_error - if the hardware reports an error
 */
template<mmio_width word_t>
[[nodiscard]] word_t receive(spi_master<word_t>& p_spi,
                             io_waiter& p_waiter = polling_io_waiter())
{
  while (true) {
    if (auto const word = p_spi.try_receive(); word) {
      return *word;
    }
    p_waiter.wait();
  }
}

/**
 * @brief Write words to the bus and discard the words clocked in
 *
 * Each word is sent and the word received in exchange is read back before
 * the next one is sent, so the receive FIFO never overruns.
 *
 * @param p_spi - driver to write on
 * @param p_words - words to write
 * @param p_waiter - called each time the peripheral is not ready
 * @throws h7spi::transfer_error - if the hardware reports an error. Words
 * before the failing one have been sent.
 */
template<mmio_width word_t>
void write(spi_master<word_t>& p_spi,
           std::span<std::type_identity_t<word_t> const> p_words,
           io_waiter& p_waiter = polling_io_waiter())
{
  for (auto const word : p_words) {
    send(p_spi, word, p_waiter);
    static_cast<void>(receive(p_spi, p_waiter));
  }
}

/**
 * @brief Exchange words in place
 *
 * Each word of the buffer is sent and replaced with the word received in
 * exchange.
 *
 * @param p_spi - driver to transfer on
 * @param p_words - words to send, overwritten with the words received
 * @param p_waiter - called each time the peripheral is not ready
 * @throws h7spi::transfer_error - if the hardware reports an error. Words
 * before the failing one have been exchanged.
 */
template<mmio_width word_t>
void transfer(spi_master<word_t>& p_spi,
              std::span<std::type_identity_t<word_t>> p_words,
              io_waiter& p_waiter = polling_io_waiter())
{
  for (auto& word : p_words) {
    send(p_spi, word, p_waiter);
    word = receive(p_spi, p_waiter);
  }
}
}  // namespace h7spi
