#include "network/local_address.hpp"
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>

namespace lanshare {
namespace network {

namespace net = boost::asio;
using udp = boost::asio::ip::udp;

std::string resolve_local_ipv4() {
  net::io_context io_context;
  udp::socket socket(io_context);
  boost::system::error_code ec;

  socket.open(udp::v4(), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Local address: Failed to open UDP socket: " << ec.message();
    return LOOPBACK_ADDRESS;
  }

  // Connecting a datagram socket only picks a route
  udp::endpoint remote(net::ip::make_address_v4("8.8.8.8"), 80);
  socket.connect(remote, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Local address: No route to public address: " << ec.message();
    return LOOPBACK_ADDRESS;
  }

  const auto local = socket.local_endpoint(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Local address: Failed to read local endpoint: " << ec.message();
    return LOOPBACK_ADDRESS;
  }

  boost::system::error_code close_ec;
  socket.close(close_ec);

  const std::string address = local.address().to_string();
  BOOST_LOG_TRIVIAL(debug) << "Local address: Resolved " << address;
  return address;
}

std::string make_server_url(const std::string& host, uint16_t port) {
  return "http://" + host + ":" + std::to_string(port) + "/";
}

} // namespace network
} // namespace lanshare
