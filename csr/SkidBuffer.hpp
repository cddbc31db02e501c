/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <utility>

/**
 * @brief The SkidBuffer class One-entry elastic buffer between a producer
 * and the externally visible consumer handshake.
 *
 * Usage per cycle: the consumer calls accept() with its ready signal, the
 * producer calls offer(), then tick() latches both transfers. The consumer
 * side (poll) only ever shows what was latched on an earlier tick, so a
 * value offered in cycle t is visible in cycle t+1 at the earliest.
 */
template <typename T>
class SkidBuffer {
 public:
  /* ------ Consumer side ------ */
  /**
   * @brief poll Registered output of the buffer.
   * @retval value held, or std::nullopt if the buffer is empty (not valid)
   */
  const std::optional<T> &poll() const { return m_slot; }

  bool consumerValid() const { return m_slot.has_value(); }

  /**
   * @brief accept Set the consumer ready signal for the current cycle.
   */
  void accept(const bool consumerReady) { m_consumerReady = consumerReady; }

  /* ------ Producer side ------ */
  /**
   * @brief producerReady the slot is free, or is being drained this cycle.
   */
  bool producerReady() const { return !m_slot || m_consumerReady; }

  /**
   * @brief offer Present a value for the current cycle.
   * @param value value to enqueue
   * @param producerValid producer valid signal
   * @retval producer ready. The value is taken iff producerValid and the
   * return value are both true.
   */
  bool offer(const T &value, const bool producerValid = true) {
    const bool ready = producerReady();
    if (producerValid && ready) {
      if (m_next) {
        throw std::logic_error("SkidBuffer: more than one offer per cycle");
      }
      m_next = value;
    }
    return ready;
  }

  /* ------ Clock ------ */
  /**
   * @brief tick Latch this cycle's transfers and clear the per-cycle inputs.
   * @retval true if the consumer took a value this cycle
   */
  bool tick() {
    const bool popped = m_slot && m_consumerReady;
    if (popped) {
      m_slot.reset();
    }
    if (m_next) {
      m_slot = std::move(m_next);
      m_next.reset();
    }
    m_consumerReady = false;
    return popped;
  }

  /**
   * @brief reset Drop any held value.
   */
  void reset() {
    m_slot.reset();
    m_next.reset();
    m_consumerReady = false;
  }

 private:
  std::optional<T> m_slot{};    //! Registered entry
  std::optional<T> m_next{};    //! Value accepted this cycle
  bool m_consumerReady{false};  //! Consumer ready, this cycle only
};
