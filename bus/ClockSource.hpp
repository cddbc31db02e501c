/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdint.h>
#include <systemc>

class ClockSourceIf : public virtual sc_core::sc_interface {
 public:
  /**
   * @brief getPeriod
   * @retval clock period
   */
  virtual const sc_core::sc_time &getPeriod() const = 0;

  /**
   * @brief default_event returns the clock edge event, used when building the
   * sensitivity list (i.e. "sensitive << channel")
   * @retval default event
   */
  virtual const sc_core::sc_event &default_event() const = 0;

  /**
   * @brief cycles number of edges since the clock was started.
   */
  virtual uint64_t cycles() const = 0;
};

/**
 * @brief The ClockSource class Periodic edge generator. Only rising edges
 * are modelled, one default_event notification per period.
 */
class ClockSource : public ClockSourceIf, public sc_core::sc_module {
 public:
  ClockSource(sc_core::sc_module_name nm,
              sc_core::sc_time period = sc_core::SC_ZERO_TIME)
      : sc_core::sc_module(nm), m_period(period) {
    SC_HAS_PROCESS(ClockSource);
    SC_METHOD(process);
    sensitive << m_edgeEvent;
    dont_initialize();

    if (m_period > sc_core::SC_ZERO_TIME) {
      m_edgeEvent.notify(period);
    }
  }

  virtual const sc_core::sc_event &default_event() const override {
    return m_edgeEvent;
  }

  virtual const sc_core::sc_time &getPeriod() const override {
    return m_period;
  }

  virtual uint64_t cycles() const override { return m_cycles; }

 private:
  /* ------ Private variables ------ */
  sc_core::sc_time m_period;                       //! Clock period
  sc_core::sc_event m_edgeEvent{"m_edgeEvent"};    //! Edge event
  uint64_t m_cycles{0};                            //! Edges so far

  /* ------ Private functions ------ */

  /**
   * @brief process count the edge and queue up the next one
   */
  void process() {
    m_cycles++;
    if (m_period > sc_core::SC_ZERO_TIME) {
      m_edgeEvent.notify(m_period);
    }
  }
};
