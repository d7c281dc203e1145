/* Color escape codes for terminal output.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

// CPP stringification
#define XSTR(x) STR(x)
#define STR(x) #x

#ifdef LOG_COLOR_DISABLE
#define CLR(clr, str) str
#else
#define CLR(clr, str) "\e[" XSTR(clr) "m" str "\e[0m"
#endif

#define CLR_BLU(str) CLR(34, str) // Print str in blue
