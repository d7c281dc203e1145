/* Resolve user supplied device identifiers.
 *
 * SPDX-FileCopyrightText: 2025 The driverctl Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <driverctl/exceptions.hpp>
#include <driverctl/resolver.hpp>

using namespace driverctl;

// Domain prepended to bare PCI addresses like "00:1f.2"
static const char PCI_DEFAULT_DOMAIN[] = "0000:";

std::string driverctl::stripMountRoot(const fs::path &path,
                                      const fs::path &root) {
  auto p = path.lexically_normal().string();
  auto r = root.lexically_normal().string();

  while (r.size() > 1 && r.back() == '/')
    r.pop_back();

  if (r == "/")
    return p;

  if (p.compare(0, r.size(), r) != 0 ||
      (p.size() > r.size() && p[r.size()] != '/'))
    throw RuntimeError("Path {} is not below {}", p, r);

  auto rel = p.substr(r.size());
  return rel.empty() ? "/" : rel;
}

fs::path DeviceResolver::link(const std::string &bus,
                              const std::string &id) const {
  return ctx.sysfs / "bus" / bus / "devices" / id;
}

ResolvedDevice DeviceResolver::resolve(const std::string &identifier,
                                       bool mustExist) const {
  ResolvedDevice dev;

  auto sep = identifier.find('/');
  if (sep != std::string::npos) {
    dev.bus = identifier.substr(0, sep);
    dev.id = identifier.substr(sep + 1);
  } else {
    dev.bus = ctx.bus;
    dev.id = identifier;
  }

  if (dev.bus.empty() || dev.id.empty())
    throw UsageError("Invalid device identifier: '{}'", identifier);

  if (ctx.devpath) {
    dev.devpath = *ctx.devpath;
    dev.sysPath = ctx.sysfs / fs::path(dev.devpath).relative_path();

    // The event names the device by its kernel name, which is canonical
    auto event = fs::path(dev.devpath).lexically_normal();
    if (event.filename().empty())
      event = event.parent_path();

    auto name = event.filename().string();
    if (!name.empty() && name != dev.id) {
      logger->debug("Using event device name {} instead of {}", name, dev.id);
      dev.id = name;
    }
    dev.present = fs::exists(dev.sysPath);

    if (mustExist && !dev.present)
      throw DeviceNotFound(dev.bus, dev.id);

    logger->debug("Using event device path {}", dev.sysPath.string());

    return dev;
  }

  auto candidate = link(dev.bus, dev.id);

  if (!fs::exists(candidate) && dev.bus == "pci") {
    auto canonical = link(dev.bus, PCI_DEFAULT_DOMAIN + dev.id);

    // A vanished device still gets the canonical id so that its persisted
    // record can be found.
    bool bare = std::count(dev.id.begin(), dev.id.end(), ':') == 1;
    if (fs::exists(canonical) || (!mustExist && bare)) {
      dev.id = PCI_DEFAULT_DOMAIN + dev.id;
      candidate = canonical;
    }
  }

  if (!fs::exists(candidate)) {
    if (mustExist)
      throw DeviceNotFound(dev.bus, dev.id);

    logger->debug("Device {} is gone", candidate.string());

    dev.sysPath = candidate;
    dev.present = false;

    return dev;
  }

  auto real = fs::canonical(candidate);

  dev.devpath = stripMountRoot(real, fs::canonical(ctx.sysfs));
  dev.sysPath = ctx.sysfs / fs::path(dev.devpath).relative_path();

  logger->debug("Resolved {}/{} to {}", dev.bus, dev.id, dev.sysPath.string());

  return dev;
}
