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

#ifndef MAIDSAFE_HOLEPUNCH_TRACER_H_
#define MAIDSAFE_HOLEPUNCH_TRACER_H_

#include <string>
#include <system_error>

#include "maidsafe/holepunch/address.h"
#include "maidsafe/holepunch/types.h"

namespace maidsafe {

namespace holepunch {

// Observability sink.  All notifications are one-way; exceptions thrown from any of these are
// logged and otherwise ignored.
class Tracer {
 public:
  virtual ~Tracer() {}

  virtual void DirectDialSuccessful(const PeerId& /*peer_id*/, const Duration& /*elapsed*/) {}
  virtual void DirectDialFailed(const PeerId& /*peer_id*/, const Duration& /*elapsed*/,
                                const std::error_code& /*error*/) {}
  virtual void ProtocolError(const PeerId& /*peer_id*/, const std::error_code& /*error*/) {}
  virtual void StartHolePunch(const PeerId& /*peer_id*/, const Addresses& /*remote_addresses*/,
                              const Duration& /*rtt*/) {}
  virtual void HolePunchAttempt(const PeerId& /*peer_id*/) {}
  virtual void EndHolePunch(const PeerId& /*peer_id*/, const Duration& /*elapsed*/,
                            const std::error_code& /*error*/) {}
  // side is "initiator" or "receiver".  direct_connection is null if no direct connection was
  // established.
  virtual void HolePunchFinished(const std::string& /*side*/, int /*attempts*/,
                                 const Addresses& /*remote_addresses*/,
                                 const Addresses& /*local_addresses*/,
                                 const ConnectionInfo* /*direct_connection*/) {}
};

class LoggingTracer : public Tracer {
 public:
  virtual void DirectDialSuccessful(const PeerId& peer_id, const Duration& elapsed);
  virtual void DirectDialFailed(const PeerId& peer_id, const Duration& elapsed,
                                const std::error_code& error);
  virtual void ProtocolError(const PeerId& peer_id, const std::error_code& error);
  virtual void StartHolePunch(const PeerId& peer_id, const Addresses& remote_addresses,
                              const Duration& rtt);
  virtual void HolePunchAttempt(const PeerId& peer_id);
  virtual void EndHolePunch(const PeerId& peer_id, const Duration& elapsed,
                            const std::error_code& error);
  virtual void HolePunchFinished(const std::string& side, int attempts,
                                 const Addresses& remote_addresses,
                                 const Addresses& local_addresses,
                                 const ConnectionInfo* direct_connection);
};

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_TRACER_H_
