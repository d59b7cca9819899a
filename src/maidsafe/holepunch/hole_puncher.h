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

#ifndef MAIDSAFE_HOLEPUNCH_HOLE_PUNCHER_H_
#define MAIDSAFE_HOLEPUNCH_HOLE_PUNCHER_H_

#include <atomic>
#include <cstddef>
#include <mutex>
#include <system_error>

#include "maidsafe/common/asio_service.h"

#include "maidsafe/holepunch/cancel_signal.h"
#include "maidsafe/holepunch/host.h"
#include "maidsafe/holepunch/tracer.h"
#include "maidsafe/holepunch/types.h"
#include "maidsafe/holepunch/active_peers.h"
#include "maidsafe/holepunch/connection_event_queue.h"
#include "maidsafe/holepunch/punch_scheduler.h"
#include "maidsafe/holepunch/rendezvous.h"
#include "maidsafe/holepunch/task_tracker.h"

namespace maidsafe {

namespace holepunch {

namespace detail {

// Initiator side of hole punching.  Watches for inbound relayed connections and upgrades each of
// them to a direct connection, and serves explicit DirectConnect requests.
class HolePuncher {
 public:
  struct Options {
    Options();
    Duration direct_dial_timeout;
    bool legacy_role_behavior;
    // Both optional.  Must outlive the HolePuncher.
    Tracer* tracer;
    AddressFilter* address_filter;
  };

  // identify_service may be null, in which case inbound relayed connections are upgraded without
  // waiting for identification.
  HolePuncher(Host& host, IdentifyService* identify_service,
              ListenAddressesFunctor listen_addresses, const Options& options);
  ~HolePuncher();

  // Blocks until a direct connection to peer_id exists, or fails with already_active, closed,
  // a rendezvous error, cancelled or all_retries_failed.
  std::error_code DirectConnect(const PeerId& peer_id);

  // Refuses new attempts, cancels those in progress and waits for them to return.
  void Close();

  bool IsActive(const PeerId& peer_id) const { return active_peers_.Contains(peer_id); }
  size_t ActiveCount() const { return active_peers_.size(); }

  void set_legacy_role_behavior(bool legacy) { legacy_role_behavior_ = legacy; }
  bool legacy_role_behavior() const { return legacy_role_behavior_; }

 private:
  HolePuncher(const HolePuncher&);
  HolePuncher& operator=(const HolePuncher&);

  std::error_code DoDirectConnect(const PeerId& peer_id);
  bool TryDirectDial(const PeerId& peer_id);
  std::error_code PunchWithRetries(const PeerId& peer_id);
  void OnConnected(const ConnectionInfo& connection);
  void UpgradeRelayedConnection(const ConnectionInfo& connection);
  bool WaitForIdentify(const ConnectionInfo& connection);

  Host& host_;
  IdentifyService* identify_service_;
  const Options kOptions_;
  std::atomic<bool> legacy_role_behavior_;
  const Rendezvous kRendezvous_;
  const RetryPolicy kRetryPolicy_;
  ActivePeers active_peers_;
  CancelSignal cancel_;
  TaskTracker tracker_;
  maidsafe::AsioService asio_service_;
  ConnectionEventQueue event_queue_;
  std::mutex close_mutex_;
  bool closed_;
};

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_HOLE_PUNCHER_H_
