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

#ifndef MAIDSAFE_HOLEPUNCH_HOST_H_
#define MAIDSAFE_HOLEPUNCH_HOST_H_

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "maidsafe/holepunch/address.h"
#include "maidsafe/holepunch/cancel_signal.h"
#include "maidsafe/holepunch/types.h"

namespace maidsafe {

namespace holepunch {

// The interfaces in this file are implemented by the surrounding network stack.  Hole punching
// only consumes them.

// A bidirectional, multiplexed stream to a single remote peer.
class Stream {
 public:
  virtual ~Stream() {}

  virtual ConnectionInfo Connection() const = 0;

  // Reads at least one and at most size bytes.  Blocks until data arrives, the deadline passes,
  // or the stream is closed or reset by either side.
  virtual size_t ReadSome(char* data, size_t size, std::error_code& ec) = 0;
  // Writes all of data, or fails.
  virtual void Write(const std::string& data, std::error_code& ec) = 0;
  // Applies to all subsequent reads and writes.
  virtual void SetDeadline(const TimePoint& deadline) = 0;

  // Graceful close.
  virtual void Close() = 0;
  // Abrupt termination, signalling failure to the remote end.
  virtual void Reset() = 0;

  // Resource accounting.
  virtual std::error_code SetService(const std::string& service_name) = 0;
  virtual std::error_code ReserveMemory(size_t size) = 0;
  virtual void ReleaseMemory(size_t size) = 0;
};

typedef std::function<void(std::shared_ptr<Stream>)> StreamHandler;

struct StreamOptions {
  StreamOptions() : no_dial(false), allow_limited_connection(false), reason(), cancel(nullptr) {}
  // Only use an existing connection.
  bool no_dial;
  // Allow use of a data or time limited (i.e. relayed) connection.
  bool allow_limited_connection;
  std::string reason;
  const CancelSignal* cancel;
};

struct DialOptions {
  DialOptions()
      : force_direct(false),
        simultaneous_connect(false),
        is_client(true),
        timeout(),
        reason(),
        cancel(nullptr) {}
  // Dial even though a usable (relayed) connection already exists.
  bool force_direct;
  // Both ends are dialling each other at the same moment; is_client decides which end acts as
  // the client during the security and multiplexer upgrade.
  bool simultaneous_connect;
  bool is_client;
  Duration timeout;
  std::string reason;
  const CancelSignal* cancel;
};

// Passive observer of the network stack's connection lifecycle.
class ConnectionListener {
 public:
  virtual ~ConnectionListener() {}
  virtual void Connected(const ConnectionInfo& connection) = 0;
  virtual void Disconnected(const ConnectionInfo& connection) = 0;
};

class Host {
 public:
  virtual ~Host() {}

  virtual PeerId id() const = 0;
  virtual std::vector<ConnectionInfo> ConnectionsToPeer(const PeerId& peer_id) const = 0;
  // Addresses known for peer_id, e.g. as learned from the address-observation service.
  virtual Addresses PeerAddresses(const PeerId& peer_id) const = 0;

  virtual std::shared_ptr<Stream> NewStream(const PeerId& peer_id, const std::string& protocol,
                                            const StreamOptions& options,
                                            std::error_code& ec) = 0;
  // Dials peer_id on addresses, or on all known addresses if addresses is empty.  Returns once a
  // connection is established or the attempt failed, timed out or was cancelled.
  virtual std::error_code Connect(const PeerId& peer_id, const Addresses& addresses,
                                  const DialOptions& options) = 0;

  virtual void SetStreamHandler(const std::string& protocol, StreamHandler handler) = 0;
  virtual void RemoveStreamHandler(const std::string& protocol) = 0;

  virtual void AddConnectionListener(ConnectionListener* listener) = 0;
  virtual void RemoveConnectionListener(ConnectionListener* listener) = 0;
};

// Address-observation service.
class IdentifyService {
 public:
  virtual ~IdentifyService() {}
  // Invokes on_identified once the peer on connection has been identified, i.e. once its
  // observed and public addresses are known.  May invoke it immediately.
  virtual void IdentifyWait(const ConnectionInfo& connection,
                            std::function<void()> on_identified) = 0;
};

// Restricts the addresses offered to and accepted from a peer.
class AddressFilter {
 public:
  virtual ~AddressFilter() {}
  virtual Addresses FilterLocal(const PeerId& peer_id, const Addresses& addresses) = 0;
  virtual Addresses FilterRemote(const PeerId& peer_id, const Addresses& addresses) = 0;
};

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_HOST_H_
