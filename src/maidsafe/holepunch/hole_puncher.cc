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

#include "maidsafe/holepunch/hole_puncher.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <utility>

#include "maidsafe/common/log.h"

#include "maidsafe/holepunch/parameters.h"
#include "maidsafe/holepunch/return_codes.h"
#include "maidsafe/holepunch/utils.h"

namespace maidsafe {

namespace holepunch {

namespace detail {

HolePuncher::Options::Options()
    : direct_dial_timeout(ToDuration(Parameters::direct_dial_timeout)),
      legacy_role_behavior(true),
      tracer(nullptr),
      address_filter(nullptr) {}

HolePuncher::HolePuncher(Host& host, IdentifyService* identify_service,
                         ListenAddressesFunctor listen_addresses, const Options& options)
    : host_(host),
      identify_service_(identify_service),
      kOptions_(options),
      legacy_role_behavior_(options.legacy_role_behavior),
      kRendezvous_(std::move(listen_addresses), options.address_filter),
      kRetryPolicy_(Parameters::max_retries),
      active_peers_(),
      cancel_(),
      tracker_(),
      asio_service_(1),
      event_queue_(asio_service_.service(),
                   [this](const ConnectionInfo& connection) { OnConnected(connection); }),
      close_mutex_(),
      closed_(false) {
  host_.AddConnectionListener(&event_queue_);
}

HolePuncher::~HolePuncher() { Close(); }

void HolePuncher::Close() {
  {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_)
      return;
    closed_ = true;
  }
  active_peers_.Close();
  cancel_.Cancel();
  event_queue_.Stop();
  host_.RemoveConnectionListener(&event_queue_);
  tracker_.ShutdownAndWait();
  asio_service_.Stop();
  LOG(kVerbose) << "Hole puncher for " << DebugId(host_.id()) << " closed";
}

std::error_code HolePuncher::DirectConnect(const PeerId& peer_id) {
  TaskTracker::Scope scope(tracker_);
  if (!scope.registered())
    return make_error_code(HolePunchErrors::closed);

  ActivePeers::Guard guard(active_peers_, peer_id);
  switch (guard.admission()) {
    case ActivePeers::Admission::kClosed:
      return make_error_code(HolePunchErrors::closed);
    case ActivePeers::Admission::kAlreadyActive:
      LOG(kVerbose) << "Hole punch with " << DebugId(peer_id) << " already in progress";
      return make_error_code(HolePunchErrors::already_active);
    default:
      break;
  }
  return DoDirectConnect(peer_id);
}

std::error_code HolePuncher::DoDirectConnect(const PeerId& peer_id) {
  ConnectionInfo direct_connection;
  if (GetDirectConnection(host_, peer_id, direct_connection)) {
    LOG(kVerbose) << DebugId(host_.id()) << " already directly connected to "
                  << DebugId(peer_id);
    return std::error_code();
  }

  if (TryDirectDial(peer_id))
    return std::error_code();

  LOG(kVerbose) << "Hole punching with " << DebugId(peer_id) << " over relayed connection";
  return PunchWithRetries(peer_id);
}

bool HolePuncher::TryDirectDial(const PeerId& peer_id) {
  const Addresses known_addresses(host_.PeerAddresses(peer_id));
  LOG(kVerbose) << "Considering direct dial to " << DebugId(peer_id) << " on "
                << DebugString(known_addresses);
  for (const auto& address : known_addresses) {
    if (!IsPublicAddress(address))
      continue;

    DialOptions options;
    options.force_direct = true;
    options.timeout = kOptions_.direct_dial_timeout;
    options.reason = "hole-punching";
    options.cancel = &cancel_;

    TimePoint start(Clock::now());
    // An empty address list dials all known addresses, public and private.
    std::error_code ec(host_.Connect(peer_id, Addresses(), options));
    Duration elapsed(Clock::now() - start);
    if (ec) {
      LOG(kWarning) << "Direct dial to " << DebugId(peer_id) << " failed: " << ec.message();
      Trace(kOptions_.tracer,
            [&](Tracer& tracer) { tracer.DirectDialFailed(peer_id, elapsed, ec); });
      return false;
    }
    Trace(kOptions_.tracer,
          [&](Tracer& tracer) { tracer.DirectDialSuccessful(peer_id, elapsed); });
    LOG(kInfo) << "Direct dial to " << DebugId(peer_id) << " succeeded, no need to hole punch";
    return true;
  }
  return false;
}

std::error_code HolePuncher::PunchWithRetries(const PeerId& peer_id) {
  typedef RetryPolicy::Decision Decision;
  typedef RetryPolicy::Stage Stage;
  const int kMaxRetries(kRetryPolicy_.max_retries());

  for (int attempt(1); attempt <= kMaxRetries; ++attempt) {
    RendezvousResult result;
    std::error_code ec(kRendezvous_.Initiate(host_, peer_id, cancel_, result));
    if (kRetryPolicy_.Decide(Stage::kRendezvous, ec, attempt, cancel_.cancelled()) ==
        Decision::kAbort) {
      if (!ec)
        return make_error_code(HolePunchErrors::cancelled);
      Trace(kOptions_.tracer, [&](Tracer& tracer) { tracer.ProtocolError(peer_id, ec); });
      return ec;
    }

    const Duration kDelay(SyncDelay(result.rtt));
    LOG(kVerbose) << "RTT to " << DebugId(peer_id) << " is "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(result.rtt).count()
                  << " ms; starting hole punch in "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(kDelay).count()
                  << " ms";
    ec = WaitForSync(asio_service_.service(), kDelay, cancel_);
    if (ec)
      return ec;

    Trace(kOptions_.tracer, [&](Tracer& tracer) {
      tracer.StartHolePunch(peer_id, result.remote_addresses, result.rtt);
      tracer.HolePunchAttempt(peer_id);
    });
    TimePoint start(Clock::now());
    ec = HolePunchConnect(host_, peer_id, result.remote_addresses,
                          IsClient(Role::kInitiator, legacy_role_behavior_),
                          kOptions_.direct_dial_timeout, cancel_);
    Duration elapsed(Clock::now() - start);
    Trace(kOptions_.tracer,
          [&](Tracer& tracer) { tracer.EndHolePunch(peer_id, elapsed, ec); });

    switch (kRetryPolicy_.Decide(Stage::kConnect, ec, attempt, cancel_.cancelled())) {
      case Decision::kConnected: {
        ConnectionInfo direct_connection;
        bool direct(GetDirectConnection(host_, peer_id, direct_connection));
        LOG(kInfo) << "Hole punch with " << DebugId(peer_id) << " succeeded on attempt "
                   << attempt;
        Trace(kOptions_.tracer, [&](Tracer& tracer) {
          tracer.HolePunchFinished("initiator", attempt, result.remote_addresses,
                                   result.local_addresses,
                                   direct ? &direct_connection : nullptr);
        });
        return std::error_code();
      }
      case Decision::kAbort:
        return make_error_code(HolePunchErrors::cancelled);
      case Decision::kExhausted:
        Trace(kOptions_.tracer, [&](Tracer& tracer) {
          tracer.HolePunchFinished("initiator", kMaxRetries, result.remote_addresses,
                                   result.local_addresses, nullptr);
        });
        break;
      default:
        LOG(kVerbose) << "Hole punch attempt " << attempt << " with " << DebugId(peer_id)
                      << " failed: " << ec.message();
        break;
    }
  }
  LOG(kWarning) << "All retries for hole punch with " << DebugId(peer_id) << " failed";
  return make_error_code(HolePunchErrors::all_retries_failed);
}

void HolePuncher::OnConnected(const ConnectionInfo& connection) {
  if (connection.direction != Direction::kInbound || !IsRelayAddress(connection.remote_address))
    return;
  LOG(kVerbose) << "Got inbound relayed connection from " << DebugId(connection.remote_peer);
  if (!tracker_.Spawn([this, connection] { UpgradeRelayedConnection(connection); }))
    LOG(kVerbose) << "Not upgrading connection to " << DebugId(connection.remote_peer)
                  << " as hole puncher is closing";
}

void HolePuncher::UpgradeRelayedConnection(const ConnectionInfo& connection) {
  if (!WaitForIdentify(connection))
    return;
  std::error_code ec(DirectConnect(connection.remote_peer));
  if (ec) {
    LOG(kWarning) << "Failed to upgrade relayed connection to "
                  << DebugId(connection.remote_peer) << ": " << ec.message();
  }
}

bool HolePuncher::WaitForIdentify(const ConnectionInfo& connection) {
  if (!identify_service_)
    return !cancel_.cancelled();

  struct State {
    State() : mutex(), cond_var(), identified(false), cancelled(false) {}
    std::mutex mutex;
    std::condition_variable cond_var;
    bool identified, cancelled;
  };
  auto state(std::make_shared<State>());

  identify_service_->IdentifyWait(connection, [state] {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->identified = true;
    state->cond_var.notify_all();
  });
  CancelSignal::Subscription subscription(cancel_, [state] {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->cancelled = true;
    state->cond_var.notify_all();
  });

  std::unique_lock<std::mutex> lock(state->mutex);
  state->cond_var.wait(lock, [state] { return state->identified || state->cancelled; });
  return !state->cancelled;
}

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe
