/* std::filesystem alias
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

namespace fs = std::filesystem;
