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

#ifndef MAIDSAFE_HOLEPUNCH_PUNCH_SCHEDULER_H_
#define MAIDSAFE_HOLEPUNCH_PUNCH_SCHEDULER_H_

#include <system_error>

#include "boost/asio/io_service.hpp"

#include "maidsafe/holepunch/address.h"
#include "maidsafe/holepunch/cancel_signal.h"
#include "maidsafe/holepunch/host.h"
#include "maidsafe/holepunch/types.h"

namespace maidsafe {

namespace holepunch {

namespace detail {

enum class Role { kInitiator, kResponder };

// Time to wait after the rendezvous before dialling, so both ends dial at about the same moment.
Duration SyncDelay(const Duration& rtt);

// Role used in the connection upgrade of a simultaneous connect.  Under the legacy behaviour
// the initiator acts as server and the responder as client.
bool IsClient(Role role, bool legacy_role_behavior);

// Blocks for delay, using a timer run by io_service.  Returns cancelled if cancel fires first.
std::error_code WaitForSync(boost::asio::io_service& io_service, const Duration& delay,
                            const CancelSignal& cancel);

// A single forced direct, simultaneous connect to peer_id on addresses.
std::error_code HolePunchConnect(Host& host, const PeerId& peer_id, const Addresses& addresses,
                                 bool is_client, const Duration& timeout,
                                 const CancelSignal& cancel);

// Classifies the outcome of each stage of a hole punching iteration.  Rendezvous failures are
// fatal to the whole attempt; connect failures are retried until max_retries iterations have run.
class RetryPolicy {
 public:
  enum class Stage { kRendezvous, kConnect };
  enum class Decision { kProceed, kConnected, kRetry, kAbort, kExhausted };

  explicit RetryPolicy(int max_retries);

  // attempt is 1-based.
  Decision Decide(Stage stage, const std::error_code& error, int attempt, bool cancelled) const;
  int max_retries() const { return kMaxRetries_; }

 private:
  const int kMaxRetries_;
};

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_PUNCH_SCHEDULER_H_
