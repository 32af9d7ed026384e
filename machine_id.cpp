#include "machine_id.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace sonyflake {

auto listInterfaces() -> std::vector<NetInterface>
{
  auto result = std::vector<NetInterface>();
  ifaddrs* addrs = nullptr;
  if (::getifaddrs(&addrs) != 0) {
    spdlog::warn("getifaddrs failed: {}", std::system_category().message(errno));
    return result;
  }
  auto _ = Defer([addrs]() { ::freeifaddrs(addrs); });

  for (auto* it = addrs; it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr) {
      continue;
    }
    auto family = static_cast<int>(it->ifa_addr->sa_family);
    char buf[INET6_ADDRSTRLEN] = {};
    void const* src = nullptr;
    if (family == AF_INET) {
      src = &reinterpret_cast<sockaddr_in const*>(it->ifa_addr)->sin_addr;
    } else if (family == AF_INET6) {
      src = &reinterpret_cast<sockaddr_in6 const*>(it->ifa_addr)->sin6_addr;
    } else {
      continue;
    }
    if (::inet_ntop(family, src, buf, sizeof(buf)) == nullptr) {
      continue;
    }
    result.push_back(NetInterface{
        .name = it->ifa_name,
        .family = family,
        .address = buf,
        .internal = (it->ifa_flags & IFF_LOOPBACK) != 0,
    });
  }
  return result;
}

auto machineIdFromIp(std::string_view ip) -> std::optional<std::int64_t>
{
  auto addr = in_addr{};
  auto str = std::string(ip);
  if (::inet_pton(AF_INET, str.c_str(), &addr) != 1) {
    return std::nullopt;
  }
  auto host = ntohl(addr.s_addr);
  return static_cast<std::int64_t>(host & 0xFFFF);
}

auto machineIdFromInterfaces(std::vector<NetInterface> const& interfaces) -> std::optional<std::int64_t>
{
  for (auto const& iface : interfaces) {
    if (iface.family != AF_INET || iface.internal) {
      continue;
    }
    if (auto id = machineIdFromIp(iface.address); id) {
      spdlog::debug("machine id {} taken from {} ({})", *id, iface.name, iface.address);
      return id;
    }
  }
  return std::nullopt;
}

auto machineIdByIp() -> std::optional<std::int64_t> { return machineIdFromInterfaces(listInterfaces()); }

} // namespace sonyflake
