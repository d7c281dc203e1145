/* PCI device classes usable as listing filters.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cctype>

#include <driverctl/device_class.hpp>

using namespace driverctl;

namespace {

struct ClassInfo {
  DeviceClass cls;
  const char *name;
  const char *code;
};

// PCI base class codes, the first byte of the class attribute.
const ClassInfo classTable[] = {
    {DeviceClass::ALL, "all", nullptr},
    {DeviceClass::STORAGE, "storage", "01"},
    {DeviceClass::NETWORK, "network", "02"},
    {DeviceClass::DISPLAY, "display", "03"},
    {DeviceClass::MULTIMEDIA, "multimedia", "04"},
    {DeviceClass::MEMORY, "memory", "05"},
    {DeviceClass::BRIDGE, "bridge", "06"},
    {DeviceClass::COMMUNICATION, "communication", "07"},
    {DeviceClass::SYSTEM, "system", "08"},
    {DeviceClass::INPUT, "input", "09"},
    {DeviceClass::DOCKING, "docking", "0a"},
    {DeviceClass::PROCESSOR, "processor", "0b"},
    {DeviceClass::SERIAL, "serial", "0c"},
};

const ClassInfo &lookup(DeviceClass cls) {
  return *std::find_if(std::begin(classTable), std::end(classTable),
                       [cls](const ClassInfo &i) { return i.cls == cls; });
}

} // namespace

const std::vector<DeviceClass> &driverctl::deviceClasses() {
  static const std::vector<DeviceClass> classes = [] {
    std::vector<DeviceClass> v;
    for (auto &i : classTable)
      v.push_back(i.cls);
    return v;
  }();

  return classes;
}

std::optional<DeviceClass> driverctl::parseDeviceClass(const std::string &name) {
  for (auto &i : classTable) {
    if (name == i.name)
      return i.cls;
  }

  return std::nullopt;
}

std::string driverctl::deviceClassName(DeviceClass cls) {
  return lookup(cls).name;
}

std::optional<std::string> driverctl::deviceClassCode(DeviceClass cls) {
  auto code = lookup(cls).code;
  if (!code)
    return std::nullopt;

  return std::string(code);
}

bool driverctl::deviceClassMatches(DeviceClass cls,
                                   const std::string &classAttribute) {
  auto code = deviceClassCode(cls);
  if (!code)
    return true;

  // Skip the leading "0x"
  if (classAttribute.size() < 4 || classAttribute.compare(0, 2, "0x") != 0)
    return false;

  auto base = classAttribute.substr(2, 2);
  std::transform(base.begin(), base.end(), base.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  return base == *code;
}
