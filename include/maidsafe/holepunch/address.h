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

#ifndef MAIDSAFE_HOLEPUNCH_ADDRESS_H_
#define MAIDSAFE_HOLEPUNCH_ADDRESS_H_

#include <string>
#include <vector>

#include "libp2p/multi/multiaddress.hpp"

namespace maidsafe {

namespace holepunch {

// A multiaddr, e.g. "/ip4/1.2.3.4/udp/4001/quic-v1", or for an address routed via a relay
// "/ip4/5.6.7.8/tcp/4001/p2p/<relay id>/p2p-circuit".
typedef libp2p::multi::Multiaddress Address;
typedef std::vector<Address> Addresses;
typedef libp2p::multi::Protocol::Code Protocol;

// Both return false and leave address untouched if the input isn't a valid multiaddr.
bool ParseAddress(const std::string& text, Address& address);
bool DecodeAddress(const std::string& bytes, Address& address);

std::string EncodeAddress(const Address& address);

// "/ip4/0.0.0.0/tcp/0", standing in where a connection's remote address is unknown.
const Address& UnspecifiedAddress();

std::string DebugString(const Address& address);
std::string DebugString(const Addresses& addresses);

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_ADDRESS_H_
