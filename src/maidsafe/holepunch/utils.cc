/*  Copyright 2012 MaidSafe.net limited

    This MaidSafe Software is licensed to you under (1) the MaidSafe.net Commercial License,
    version 1.0 or later, or (2) The General Public License (GPL), version 3, depending on which
    licence you accepted on initial access to the Software (the "Licences").

    By contributing code to the MaidSafe Software, or to this project generally, you agree to be
    bound by the terms of the MaidSafe Contributor Agreement, version 1.0, found in the root
    directory of this project at LICENSE, COPYING and CONTRIBUTOR respectively and also
    available at: http://www.maidsafe.net/licenses

    Unless required by applicable law or agreed to in writing, the MaidSafe Software distributed
    under the GPL Licence is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS
    OF ANY KIND, either express or implied.

    See the Licences for the specific language governing permissions and limitations relating to
    use of the MaidSafe Software.                                                                 */

#include "maidsafe/holepunch/utils.h"

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <iterator>

#include "boost/system/error_code.hpp"

namespace ip = boost::asio::ip;

namespace maidsafe {

namespace holepunch {

namespace detail {

namespace {

struct Range {
  Range(const char* min_in, const char* max_in)
      : min(ip::address_v4::from_string(min_in)), max(ip::address_v4::from_string(max_in)) {}
  bool Contains(const ip::address_v4& address) const { return min <= address && address <= max; }
  ip::address_v4 min, max;
};

const std::vector<Range>& NonPublicRangesV4() {
  static const std::vector<Range> ranges{
      Range("0.0.0.0", "0.255.255.255"),        // "this" network
      Range("10.0.0.0", "10.255.255.255"),      // private class A
      Range("100.64.0.0", "100.127.255.255"),   // shared address space (CGNAT)
      Range("127.0.0.0", "127.255.255.255"),    // loopback
      Range("169.254.0.0", "169.254.255.255"),  // link-local
      Range("172.16.0.0", "172.31.255.255"),    // private class B
      Range("192.0.0.0", "192.0.0.255"),        // IETF protocol assignments
      Range("192.168.0.0", "192.168.255.255"),  // private class C
      Range("198.18.0.0", "198.19.255.255"),    // benchmarking
      Range("224.0.0.0", "255.255.255.255")};   // multicast and reserved
  return ranges;
}

bool IsPublicV4(const ip::address_v4& address) {
  return std::none_of(NonPublicRangesV4().begin(), NonPublicRangesV4().end(),
                      [&address](const Range& range) { return range.Contains(address); });
}

bool IsPublicV6(const ip::address_v6& address) {
  if (address.is_v4_mapped())
    return IsPublicV4(address.to_v4());
  if (address.is_unspecified() || address.is_loopback() || address.is_link_local() ||
      address.is_site_local() || address.is_multicast()) {
    return false;
  }
  // Unique local, fc00::/7.
  return (address.to_bytes()[0] & 0xfe) != 0xfc;
}

}  // unnamed namespace

bool IsRelayAddress(const Address& address) {
  return address.hasProtocol(Protocol::P2P_CIRCUIT);
}

Addresses RemoveRelayAddresses(const Addresses& addresses) {
  Addresses result;
  std::copy_if(addresses.begin(), addresses.end(), std::back_inserter(result),
               [](const Address& address) { return !IsRelayAddress(address); });
  return result;
}

bool IsPublicAddress(const Address& address) {
  if (IsRelayAddress(address))
    return false;
  ip::address ip;
  if (!GetIp(address, ip))
    return false;
  return !OnPrivateNetwork(ip);
}

bool OnPrivateNetwork(const ip::address& ip) {
  if (ip.is_v4())
    return !IsPublicV4(ip.to_v4());
  else
    return !IsPublicV6(ip.to_v6());
}

bool GetIp(const Address& address, ip::address& ip) {
  for (auto protocol : {Protocol::IP4, Protocol::IP6}) {
    if (!address.hasProtocol(protocol))
      continue;
    auto value(address.getFirstValueForProtocol(protocol));
    if (!value)
      return false;
    boost::system::error_code ec;
    ip = ip::address::from_string(value.value(), ec);
    return !ec;
  }
  return false;
}

bool GetDirectConnection(const Host& host, const PeerId& peer_id,
                         ConnectionInfo& direct_connection) {
  for (const auto& connection : host.ConnectionsToPeer(peer_id)) {
    if (!IsRelayAddress(connection.remote_address)) {
      direct_connection = connection;
      return true;
    }
  }
  return false;
}

std::vector<std::string> AddressesToBytes(const Addresses& addresses) {
  std::vector<std::string> encoded;
  encoded.reserve(addresses.size());
  for (const auto& address : addresses)
    encoded.push_back(EncodeAddress(address));
  return encoded;
}

Duration ToDuration(const Timeout& timeout) {
  return std::chrono::duration_cast<Duration>(
      std::chrono::microseconds(timeout.total_microseconds()));
}

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe
