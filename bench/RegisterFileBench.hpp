/*
 * Copyright (c) 2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdint.h>
#include <stdexcept>
#include <string>
#include <systemc>
#include <utility>
#include <vector>
#include "bench/StimulusPlayer.hpp"
#include "bus/ClockSource.hpp"
#include "bus/CsrBusTarget.hpp"
#include "csr/RegisterFileConfig.hpp"
#include "utilities/Config.hpp"
#include "utilities/Stimulus.hpp"

/**
 * @brief RegisterFileBench Top level of the simulator: a clock, the register
 * file and a stimulus player driving its bus and direct-load ports.
 */
SC_MODULE(RegisterFileBench) {
 public:
  /* ------ Signals ------ */
  sc_core::sc_signal<bool> nReset{"nReset", true};
  sc_core::sc_vector<sc_core::sc_signal<bool>> loadEnable;
  sc_core::sc_vector<sc_core::sc_signal<uint8_t>> loadValue;
  sc_core::sc_vector<sc_core::sc_signal<bool>> writeActive;
  sc_core::sc_vector<sc_core::sc_signal<bool>> readActive;

  /* ------ Components ------ */
  ClockSource clk;
  CsrBusTarget regs;
  StimulusPlayer player;

  RegisterFileBench(const sc_core::sc_module_name nm,
                    const RegisterFileConfig &config,
                    const sc_core::sc_time &clockPeriod,
                    std::vector<StimulusCommand> commands)
      : sc_core::sc_module(nm),
        loadEnable("loadEnable", config.numBytes),
        loadValue("loadValue", config.numBytes),
        writeActive("writeActive", config.numBytes),
        readActive("readActive", config.numBytes),
        clk("clk", clockPeriod),
        regs("regs", config),
        player("player", config.numBytes, config.dataWidthBytes,
               std::move(commands)) {
    regs.clk.bind(clk);
    regs.nReset.bind(nReset);
    regs.loadEnable.bind(loadEnable);
    regs.loadValue.bind(loadValue);
    regs.writeActive.bind(writeActive);
    regs.readActive.bind(readActive);

    player.clk.bind(clk);
    player.iSocket.bind(regs.tSocket);
    player.loadEnable.bind(loadEnable);
    player.loadValue.bind(loadValue);
  }

  /**
   * @brief clockPeriodFromConfig ClockPeriodNs from the Config store, 10 ns
   * if absent. Throws std::invalid_argument unless it is a positive number.
   */
  static sc_core::sc_time clockPeriodFromConfig() {
    const auto &config = Config::get();
    if (!config.contains("ClockPeriodNs")) {
      return sc_core::sc_time(10, sc_core::SC_NS);
    }
    const double ns = config.getDouble("ClockPeriodNs");
    if (!(ns > 0)) {
      throw std::invalid_argument("ClockPeriodNs must be positive, got " +
                                  config.getString("ClockPeriodNs"));
    }
    return sc_core::sc_time(ns, sc_core::SC_NS);
  }
};
