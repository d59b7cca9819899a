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

#include "maidsafe/holepunch/service.h"

#include <string>
#include <system_error>
#include <utility>

#include "maidsafe/common/log.h"

#include "maidsafe/holepunch/hole_puncher.h"
#include "maidsafe/holepunch/parameters.h"
#include "maidsafe/holepunch/punch_scheduler.h"
#include "maidsafe/holepunch/rendezvous.h"
#include "maidsafe/holepunch/return_codes.h"
#include "maidsafe/holepunch/task_tracker.h"
#include "maidsafe/holepunch/utils.h"

namespace maidsafe {

namespace holepunch {

namespace {

detail::HolePuncher::Options ToHolePuncherOptions(const Service::Options& options) {
  detail::HolePuncher::Options hole_puncher_options;
  hole_puncher_options.direct_dial_timeout = options.direct_dial_timeout;
  hole_puncher_options.legacy_role_behavior = options.legacy_role_behavior;
  hole_puncher_options.tracer = options.tracer;
  hole_puncher_options.address_filter = options.address_filter;
  return hole_puncher_options;
}

}  // unnamed namespace

Service::Options::Options()
    : direct_dial_timeout(detail::ToDuration(Parameters::direct_dial_timeout)),
      legacy_role_behavior(true),
      tracer(nullptr),
      address_filter(nullptr) {}

Service::Service(Host& host, IdentifyService* identify_service,
                 ListenAddressesFunctor listen_addresses, const Options& options)
    : host_(host),
      kOptions_(options),
      rendezvous_(new detail::Rendezvous(listen_addresses, options.address_filter)),
      hole_puncher_(new detail::HolePuncher(host, identify_service, listen_addresses,
                                            ToHolePuncherOptions(options))),
      cancel_(),
      tracker_(new detail::TaskTracker),
      close_mutex_(),
      closed_(false) {
  host_.SetStreamHandler(Parameters::protocol_id,
                         [this](std::shared_ptr<Stream> stream) { HandleNewStream(stream); });
}

Service::~Service() { Close(); }

void Service::Close() {
  {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_)
      return;
    closed_ = true;
  }
  cancel_.Cancel();
  host_.RemoveStreamHandler(Parameters::protocol_id);
  tracker_->ShutdownAndWait();
  hole_puncher_->Close();
}

void Service::DirectConnect(const PeerId& peer_id) {
  std::error_code ec(hole_puncher_->DirectConnect(peer_id));
  if (!ec)
    return;
  if (ec == make_error_code(HolePunchErrors::all_retries_failed)) {
    throw std::system_error(ec, "all retries for hole punch with peer " + DebugId(peer_id) +
                                    " failed after " + std::to_string(Parameters::max_retries) +
                                    " attempts");
  }
  throw std::system_error(ec, "hole punch with peer " + DebugId(peer_id) + " failed");
}

bool Service::IsActive(const PeerId& peer_id) const { return hole_puncher_->IsActive(peer_id); }

size_t Service::ActiveCount() const { return hole_puncher_->ActiveCount(); }

void Service::SetLegacyRoleBehavior(bool legacy) {
  hole_puncher_->set_legacy_role_behavior(legacy);
}

void Service::HandleNewStream(std::shared_ptr<Stream> stream) {
  detail::TaskTracker::Scope scope(*tracker_);
  if (!scope.registered()) {
    stream->Reset();
    return;
  }
  Respond(*stream);
}

void Service::Respond(Stream& stream) {
  const ConnectionInfo kConnection(stream.Connection());
  const PeerId& peer_id(kConnection.remote_peer);
  // The remote end opens the stream over a connection it accepted, so here the connection must
  // be outbound.
  if (kConnection.direction == Direction::kInbound) {
    LOG(kWarning) << "Received hole punch stream from " << DebugId(peer_id)
                  << " over an inbound connection";
    stream.Reset();
    return;
  }
  if (!detail::IsRelayAddress(kConnection.remote_address)) {
    LOG(kVerbose) << "Received hole punch stream from " << DebugId(peer_id)
                  << " over a direct connection";
    stream.Reset();
    return;
  }

  detail::RendezvousResult result;
  std::error_code ec(rendezvous_->Respond(stream, result));
  if (ec) {
    detail::Trace(kOptions_.tracer, [&](Tracer& tracer) { tracer.ProtocolError(peer_id, ec); });
    return;
  }

  detail::Trace(kOptions_.tracer, [&](Tracer& tracer) {
    tracer.StartHolePunch(peer_id, result.remote_addresses, result.rtt);
    tracer.HolePunchAttempt(peer_id);
  });
  TimePoint start(Clock::now());
  ec = detail::HolePunchConnect(
      host_, peer_id, result.remote_addresses,
      detail::IsClient(detail::Role::kResponder, hole_puncher_->legacy_role_behavior()),
      kOptions_.direct_dial_timeout, cancel_);
  Duration elapsed(Clock::now() - start);
  detail::Trace(kOptions_.tracer,
                [&](Tracer& tracer) { tracer.EndHolePunch(peer_id, elapsed, ec); });

  ConnectionInfo direct_connection;
  bool direct(!ec && detail::GetDirectConnection(host_, peer_id, direct_connection));
  if (direct)
    LOG(kInfo) << "Hole punch with " << DebugId(peer_id) << " succeeded as receiver";
  detail::Trace(kOptions_.tracer, [&](Tracer& tracer) {
    tracer.HolePunchFinished("receiver", 1, result.remote_addresses, result.local_addresses,
                             direct ? &direct_connection : nullptr);
  });
}

}  // namespace holepunch

}  // namespace maidsafe
