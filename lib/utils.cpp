/* Utilities.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

#include <driverctl/exceptions.hpp>
#include <driverctl/log.hpp>
#include <driverctl/utils.hpp>

namespace driverctl {
namespace utils {

std::string rtrim(const std::string &s) {
  auto end = s.find_last_not_of(" \t\r\n");

  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

void write_to_file(const std::string &data, const fs::path &file) {
  Log::get("Filewriter")->debug("{} > {}", data, file.string());

  int fd = ::open(file.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC);
  if (fd < 0)
    throw SystemError("Failed to open {}", file.string());

  ssize_t ret = ::write(fd, data.data(), data.size());
  if (ret < 0 || static_cast<size_t>(ret) != data.size()) {
    int err = ret < 0 ? errno : EIO;
    ::close(fd);

    errno = err;
    throw SystemError("Failed to write to {}", file.string());
  }

  if (::close(fd))
    throw SystemError("Failed to close {}", file.string());
}

std::optional<std::string> read_from_file(const fs::path &file) {
  std::ifstream f(file);
  if (!f.is_open())
    return std::nullopt;

  std::string line;
  std::getline(f, line);

  return rtrim(line);
}

std::vector<std::string> read_names_in_directory(const fs::path &directory) {
  std::vector<std::string> names;

  for (auto const &entry : fs::directory_iterator{directory})
    names.push_back(entry.path().filename());

  std::sort(names.begin(), names.end());

  return names;
}

} // namespace utils
} // namespace driverctl
