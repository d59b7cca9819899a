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

#ifndef MAIDSAFE_HOLEPUNCH_UTILS_H_
#define MAIDSAFE_HOLEPUNCH_UTILS_H_

#include <exception>
#include <string>
#include <vector>

#include "boost/asio/ip/address.hpp"
#include "boost/exception/diagnostic_information.hpp"

#include "maidsafe/common/log.h"

#include "maidsafe/holepunch/address.h"
#include "maidsafe/holepunch/host.h"
#include "maidsafe/holepunch/parameters.h"
#include "maidsafe/holepunch/tracer.h"
#include "maidsafe/holepunch/types.h"

namespace maidsafe {

namespace holepunch {

namespace detail {

// True if address is routed through a relay (contains a p2p-circuit component).
bool IsRelayAddress(const Address& address);

Addresses RemoveRelayAddresses(const Addresses& addresses);

// True if address is neither relayed nor on a private, loopback, link-local, shared (CGNAT),
// multicast or unspecified network.
bool IsPublicAddress(const Address& address);

bool OnPrivateNetwork(const boost::asio::ip::address& ip);

// Sets ip to the address's ip4 value, or failing that its ip6 value.
bool GetIp(const Address& address, boost::asio::ip::address& ip);

// Sets direct_connection to the first connection to peer_id which isn't relayed.
bool GetDirectConnection(const Host& host, const PeerId& peer_id,
                         ConnectionInfo& direct_connection);

std::vector<std::string> AddressesToBytes(const Addresses& addresses);

// Undecodable entries are skipped.
template <typename Container>
Addresses AddressesFromBytes(const Container& encoded_addresses) {
  Addresses addresses;
  for (const auto& encoded : encoded_addresses) {
    Address address(UnspecifiedAddress());
    if (DecodeAddress(encoded, address))
      addresses.push_back(address);
    else
      LOG(kVerbose) << "Skipping undecodable address of " << encoded.size() << " bytes";
  }
  return addresses;
}

Duration ToDuration(const Timeout& timeout);

// Notifies tracer (if non-null), never letting it affect the caller.
template <typename Functor>
void Trace(Tracer* tracer, Functor functor) {
  if (!tracer)
    return;
  try {
    functor(*tracer);
  }
  catch (const std::exception& e) {
    LOG(kWarning) << "Tracer threw: " << e.what();
  }
  catch (...) {
    LOG(kWarning) << "Tracer threw: " << boost::current_exception_diagnostic_information();
  }
}

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_UTILS_H_
