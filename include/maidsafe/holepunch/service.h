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

#ifndef MAIDSAFE_HOLEPUNCH_SERVICE_H_
#define MAIDSAFE_HOLEPUNCH_SERVICE_H_

#include <cstddef>
#include <memory>
#include <mutex>

#include "maidsafe/holepunch/cancel_signal.h"
#include "maidsafe/holepunch/host.h"
#include "maidsafe/holepunch/tracer.h"
#include "maidsafe/holepunch/types.h"

namespace maidsafe {

namespace holepunch {

namespace detail {
class HolePuncher;
class Rendezvous;
class TaskTracker;
}  // namespace detail

// Upgrades relayed connections to direct ones by coordinated hole punching.  Registers the
// responder for the hole punching protocol with host and initiates hole punching for every
// inbound relayed connection host reports.
class Service {
 public:
  struct Options {
    Options();
    // Timeout of the opportunistic direct dial and of each hole punching connect attempt.
    Duration direct_dial_timeout;
    // Preserves the historical role assignment: the initiator upgrades the punched connection as
    // server and the responder as client.  Read at the start of each connect attempt.
    bool legacy_role_behavior;
    // Optional.  Must outlive the Service.
    Tracer* tracer;
    // Optional.  Must outlive the Service.
    AddressFilter* address_filter;
  };

  // host and identify_service (which may be null) must outlive the Service.
  Service(Host& host, IdentifyService* identify_service, ListenAddressesFunctor listen_addresses,
          const Options& options = Options());
  ~Service();

  // Blocks until a direct connection to peer_id exists.  Throws std::system_error with a
  // HolePunchErrors code on failure.
  void DirectConnect(const PeerId& peer_id);

  // Stops serving and initiating hole punches.  Blocks until all in-progress work, including
  // DirectConnect calls, has returned.
  void Close();

  bool IsActive(const PeerId& peer_id) const;
  size_t ActiveCount() const;

  void SetLegacyRoleBehavior(bool legacy);

 private:
  Service(const Service&);
  Service& operator=(const Service&);

  void HandleNewStream(std::shared_ptr<Stream> stream);
  void Respond(Stream& stream);

  Host& host_;
  const Options kOptions_;
  std::unique_ptr<detail::Rendezvous> rendezvous_;
  std::unique_ptr<detail::HolePuncher> hole_puncher_;
  CancelSignal cancel_;
  std::unique_ptr<detail::TaskTracker> tracker_;
  std::mutex close_mutex_;
  bool closed_;
};

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_SERVICE_H_
