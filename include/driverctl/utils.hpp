/* Utilities.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <driverctl/fs.hpp>

namespace driverctl {
namespace utils {

// Remove trailing whitespace and newlines.
std::string rtrim(const std::string &s);

// helper type for std::visit
template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};

// Explicit deduction guide (not needed as of C++20)
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Write data to a (sysfs) file.
//
// Sysfs attributes report rejected values on write() or close(), so both
// are checked. Throws SystemError on failure.
void write_to_file(const std::string &data, const fs::path &file);

// Read the first line of a file without the trailing newline.
//
// Returns std::nullopt if the file cannot be opened.
std::optional<std::string> read_from_file(const fs::path &file);

// Names of all entries in a directory, sorted.
std::vector<std::string> read_names_in_directory(const fs::path &directory);

} // namespace utils
} // namespace driverctl
