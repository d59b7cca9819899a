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

#include "maidsafe/holepunch/tracer.h"

#include <chrono>

#include "maidsafe/common/log.h"

namespace maidsafe {

namespace holepunch {

namespace {

int64_t Milliseconds(const Duration& duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

}  // unnamed namespace

void LoggingTracer::DirectDialSuccessful(const PeerId& peer_id, const Duration& elapsed) {
  LOG(kInfo) << "Direct dial to " << DebugId(peer_id) << " succeeded after "
             << Milliseconds(elapsed) << " ms";
}

void LoggingTracer::DirectDialFailed(const PeerId& peer_id, const Duration& elapsed,
                                     const std::error_code& error) {
  LOG(kVerbose) << "Direct dial to " << DebugId(peer_id) << " failed after "
                << Milliseconds(elapsed) << " ms: " << error.message();
}

void LoggingTracer::ProtocolError(const PeerId& peer_id, const std::error_code& error) {
  LOG(kError) << "Hole punch protocol error with " << DebugId(peer_id) << ": "
              << error.message();
}

void LoggingTracer::StartHolePunch(const PeerId& peer_id, const Addresses& remote_addresses,
                                   const Duration& rtt) {
  LOG(kVerbose) << "Starting hole punch with " << DebugId(peer_id) << " on "
                << DebugString(remote_addresses) << ", RTT " << Milliseconds(rtt) << " ms";
}

void LoggingTracer::HolePunchAttempt(const PeerId& peer_id) {
  LOG(kVerbose) << "Hole punch attempt with " << DebugId(peer_id);
}

void LoggingTracer::EndHolePunch(const PeerId& peer_id, const Duration& elapsed,
                                 const std::error_code& error) {
  if (error) {
    LOG(kVerbose) << "Hole punch with " << DebugId(peer_id) << " failed after "
                  << Milliseconds(elapsed) << " ms: " << error.message();
  } else {
    LOG(kVerbose) << "Hole punch with " << DebugId(peer_id) << " succeeded after "
                  << Milliseconds(elapsed) << " ms";
  }
}

void LoggingTracer::HolePunchFinished(const std::string& side, int attempts,
                                      const Addresses& remote_addresses,
                                      const Addresses& local_addresses,
                                      const ConnectionInfo* direct_connection) {
  if (direct_connection) {
    LOG(kInfo) << "Hole punch as " << side << " finished after " << attempts
               << " attempt(s) with direct connection to "
               << DebugId(direct_connection->remote_peer) << " on "
               << DebugString(direct_connection->remote_address);
  } else {
    LOG(kWarning) << "Hole punch as " << side << " finished after " << attempts
                  << " attempt(s) without a direct connection.  Remote "
                  << DebugString(remote_addresses) << ", local " << DebugString(local_addresses);
  }
}

}  // namespace holepunch

}  // namespace maidsafe
