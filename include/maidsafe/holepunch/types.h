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

#ifndef MAIDSAFE_HOLEPUNCH_TYPES_H_
#define MAIDSAFE_HOLEPUNCH_TYPES_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <utility>

#include "maidsafe/common/node_id.h"

#include "maidsafe/holepunch/address.h"

namespace maidsafe {

namespace holepunch {

typedef maidsafe::NodeId PeerId;
typedef std::chrono::steady_clock Clock;
typedef Clock::duration Duration;
typedef Clock::time_point TimePoint;

// Returns the current set of locally observable listen addresses.
typedef std::function<Addresses()> ListenAddressesFunctor;

enum class Direction { kUnknown, kInbound, kOutbound };

template <typename Elem, typename Traits>
std::basic_ostream<Elem, Traits>& operator<<(std::basic_ostream<Elem, Traits>& ostream,
                                             const Direction& direction) {
  std::string direction_str;
  switch (direction) {
    case Direction::kInbound:
      direction_str = "inbound";
      break;
    case Direction::kOutbound:
      direction_str = "outbound";
      break;
    case Direction::kUnknown:
      direction_str = "unknown direction";
      break;
    default:
      direction_str = "Invalid direction";
      break;
  }

  for (auto& ch : direction_str)
    ostream << ostream.widen(ch);
  return ostream;
}

// Snapshot of one connection held by the network stack.
struct ConnectionInfo {
  ConnectionInfo()
      : id(0),
        remote_peer(),
        remote_address(UnspecifiedAddress()),
        direction(Direction::kUnknown) {}
  ConnectionInfo(uint64_t id_in, PeerId remote_peer_in, Address remote_address_in,
                 Direction direction_in)
      : id(id_in),
        remote_peer(std::move(remote_peer_in)),
        remote_address(std::move(remote_address_in)),
        direction(direction_in) {}

  uint64_t id;
  PeerId remote_peer;
  Address remote_address;
  Direction direction;
};

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_TYPES_H_
