#pragma once

#include "preclude.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sonyflake {

using MachineIdResolver = std::function<std::optional<std::int64_t>()>;

struct NetInterface {
  std::string name;
  int family;
  std::string address;
  bool internal;
};

// Snapshot of the host's interface addresses, one entry per address.
auto listInterfaces() -> std::vector<NetInterface>;

// Low 16 bits of a dotted IPv4 address, i.e. the last two octets.
auto machineIdFromIp(std::string_view ip) -> std::optional<std::int64_t>;

// First external IPv4 address wins.
auto machineIdFromInterfaces(std::vector<NetInterface> const& interfaces) -> std::optional<std::int64_t>;

auto machineIdByIp() -> std::optional<std::int64_t>;

} // namespace sonyflake
