/* List overridable devices of a bus.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <driverctl/enumerator.hpp>
#include <driverctl/exceptions.hpp>

using namespace driverctl;

std::vector<DeviceListing> DeviceEnumerator::enumerate(bool overridesOnly,
                                                       DeviceClass cls) const {
  std::vector<DeviceListing> listings;

  for (auto &dev : bus.devices()) {
    if (!dev->overridable()) {
      logger->trace("Skipping {}: no driver override support", dev->name());
      continue;
    }

    auto value = dev->override_value();
    if (overridesOnly && !value)
      continue;

    if (!deviceClassMatches(cls, dev->class_code()))
      continue;

    DeviceListing listing;
    listing.id = dev->name();
    listing.overridden = value.has_value();

    auto drv = dev->driver();
    if (drv)
      listing.driver = (*drv)->name();

    listings.push_back(listing);
  }

  if (listings.empty())
    throw NoDevicesFound(bus.name());

  return listings;
}
