/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

/*
 * @brief Definitions/macros shared by the regbank register-file model
 */

#ifndef __REGBANK_H
#define __REGBANK_H

//! Read payload returned with SLAVE_ERROR (little-endian lanes)
#define REGBANK_READ_ERROR_SENTINEL 0xBA5E1E55u

//! Protection attribute bits (AxPROT encoding)
#define REGBANK_PROT_PRIVILEGED 0x1
#define REGBANK_PROT_NONSECURE 0x2
#define REGBANK_PROT_INSTRUCTION 0x4

//! Widest bus address supported
#define REGBANK_MAX_ADDRESS_WIDTH 64

//! Default configuration file, relative to the working directory
#define REGBANK_DEFAULT_CONFIG "config/regbank-config.yml"

#endif
