/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <spdlog/common.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace Utility {

/**
 * @brief unpackBytes unpack a (right-aligned) variable into bus lanes, lane 0
 * gets the least significant byte.
 * @param data pointer to destination array
 * @param width number of bytes to unpack
 */
void unpackBytes(uint8_t *const data, uint64_t val, const size_t width);

/**
 * @brief repeatLanes repeat a 32-bit pattern across width lanes, truncating
 * it for buses narrower than 4 bytes.
 */
std::vector<uint8_t> repeatLanes(const uint32_t pattern, const size_t width);

/**
 * @brief parseUint parse a decimal or 0x-prefixed hexadecimal number.
 * Throws std::invalid_argument if str is not a number.
 */
uint64_t parseUint(const std::string &str);

/**
 * @brief parseUintList parse a comma-separated list of numbers and inclusive
 * ranges (a-b), e.g. "0, 2, 4-7". Throws std::invalid_argument if an entry
 * is not a number, a range is empty, or a value is not below limit. Ranges
 * are checked against limit before they are expanded.
 * @param limit exclusive upper bound on every value, none if 0
 */
std::vector<uint64_t> parseUintList(const std::string &str,
                                    const uint64_t limit = 0);

/**
 * @brief parseLogLevel spdlog level from its name. Throws
 * std::invalid_argument for unknown names.
 */
spdlog::level::level_enum parseLogLevel(const std::string &name);

/**
 * @brief split split a string on whitespace.
 */
std::vector<std::string> split(const std::string &str);

/**
 * @brief assertFileExists Assert that file exists, exit with error otherwise.
 * @param filename
 */
bool assertFileExists(const std::string &filename);

}  // namespace Utility
