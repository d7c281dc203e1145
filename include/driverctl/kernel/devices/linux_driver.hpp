/* Implementation of driver interface for Linux drivers.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <driverctl/fs.hpp>
#include <driverctl/kernel/devices/driver.hpp>

namespace driverctl {
namespace kernel {
namespace devices {

class LinuxDriver : public Driver {
private:
  static constexpr char UNBIND_DEFAULT[] = "unbind";
  static constexpr char NEW_ID_DEFAULT[] = "new_id";

public:
  const fs::path path;

private:
  const fs::path unbind_path;
  const fs::path new_id_path;

public:
  LinuxDriver(const fs::path path)
      : LinuxDriver(path, path / fs::path(UNBIND_DEFAULT),
                    path / fs::path(NEW_ID_DEFAULT)){};

  LinuxDriver(const fs::path path, const fs::path unbind_path,
              const fs::path new_id_path)
      : path(path), unbind_path(unbind_path), new_id_path(new_id_path){};

public:
  void add_id(const Device &device) const override;
  std::string name() const override;
  void unbind(const Device &device) const override;
};

} // namespace devices
} // namespace kernel
} // namespace driverctl
