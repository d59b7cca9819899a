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

#ifndef MAIDSAFE_HOLEPUNCH_RENDEZVOUS_H_
#define MAIDSAFE_HOLEPUNCH_RENDEZVOUS_H_

#include <memory>
#include <system_error>

#include "maidsafe/holepunch/address.h"
#include "maidsafe/holepunch/cancel_signal.h"
#include "maidsafe/holepunch/host.h"
#include "maidsafe/holepunch/types.h"

namespace maidsafe {

namespace holepunch {

namespace detail {

struct RendezvousResult {
  RendezvousResult() : remote_addresses(), local_addresses(), rtt(Duration::zero()) {}
  // Filtered candidate addresses received from the remote peer.
  Addresses remote_addresses;
  // Filtered addresses offered to the remote peer.
  Addresses local_addresses;
  Duration rtt;
};

// Local side of the CONNECT/CONNECT/SYNC exchange.
class Rendezvous {
 public:
  // address_filter may be null.
  Rendezvous(ListenAddressesFunctor listen_addresses, AddressFilter* address_filter);

  // Opens a stream to peer_id over the existing (relayed) connection and runs the initiator
  // side: send CONNECT, receive CONNECT, send SYNC.  rtt is measured from sending CONNECT to
  // receiving the peer's CONNECT.
  std::error_code Initiate(Host& host, const PeerId& peer_id, const CancelSignal& cancel,
                           RendezvousResult& result) const;

  // Runs the responder side on an incoming stream: receive CONNECT, send CONNECT, receive SYNC.
  // rtt is measured from sending CONNECT to receiving SYNC.
  std::error_code Respond(Stream& stream, RendezvousResult& result) const;

  // Listen addresses with relay addresses removed, passed through the local filter.
  Addresses LocalOffer(const PeerId& peer_id) const;
  // Received addresses with relay addresses removed, passed through the remote filter.
  Addresses FilterRemote(const PeerId& peer_id, const Addresses& received) const;

 private:
  std::error_code ExchangeAsInitiator(Stream& stream, RendezvousResult& result) const;
  std::error_code ExchangeAsResponder(Stream& stream, RendezvousResult& result) const;

  ListenAddressesFunctor listen_addresses_;
  AddressFilter* address_filter_;
};

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_RENDEZVOUS_H_
