#pragma once

#include <cstdint>
#include <string>

namespace lanshare {
namespace network {

// Used when no LAN route exists
constexpr const char* LOOPBACK_ADDRESS = "127.0.0.1";

// Returns the IPv4 address of the interface that routes to the internet,
// found by connecting a UDP socket (nothing is sent). Falls back to
// LOOPBACK_ADDRESS when there is no route.
std::string resolve_local_ipv4();

// Builds "http://<host>:<port>/"
std::string make_server_url(const std::string& host, uint16_t port);

} // namespace network
} // namespace lanshare
