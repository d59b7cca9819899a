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

#ifndef MAIDSAFE_HOLEPUNCH_TESTS_TEST_UTILS_H_
#define MAIDSAFE_HOLEPUNCH_TESTS_TEST_UTILS_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "maidsafe/common/node_id.h"
#include "maidsafe/common/test.h"

#include "maidsafe/holepunch/address.h"
#include "maidsafe/holepunch/host.h"
#include "maidsafe/holepunch/tracer.h"
#include "maidsafe/holepunch/types.h"

namespace maidsafe {

namespace holepunch {

namespace test {

class FakeNetwork;

// The peer id of the relay in RelayAddress().
const char* const kRelayPeerId("QmNnooDu7bfjPFoTZYxMNLWUQJyrVwtbZg5gBMjTezGAJN");

// A public tcp address in 203.0.113.0/24.
Address PublicAddress(uint8_t last_octet, uint16_t port = 4001);
// A private tcp address in 192.168.1.0/24.
Address PrivateAddress(uint8_t last_octet, uint16_t port = 4001);
// The address under which a peer is seen over a relayed connection.
Address RelayAddress();

PeerId RandomPeerId();

// One direction of a FakeStream pair.
struct Channel {
  Channel() : mutex(), cond_var(), data(), closed(false), reset(false) {}
  std::mutex mutex;
  std::condition_variable cond_var;
  std::string data;
  bool closed, reset;
};

class FakeStream : public Stream {
 public:
  FakeStream(ConnectionInfo connection, std::shared_ptr<Channel> inbound,
             std::shared_ptr<Channel> outbound, std::shared_ptr<std::atomic<int64_t>> reserved);
  virtual ~FakeStream();

  virtual ConnectionInfo Connection() const { return connection_; }
  virtual size_t ReadSome(char* data, size_t size, std::error_code& ec);
  virtual void Write(const std::string& data, std::error_code& ec);
  virtual void SetDeadline(const TimePoint& deadline);
  virtual void Close();
  virtual void Reset();
  virtual std::error_code SetService(const std::string& service_name);
  virtual std::error_code ReserveMemory(size_t size);
  virtual void ReleaseMemory(size_t size);

  bool was_reset() const;
  bool was_closed() const;
  std::string service_name() const;

 private:
  const ConnectionInfo connection_;
  std::shared_ptr<Channel> inbound_, outbound_;
  std::shared_ptr<std::atomic<int64_t>> reserved_;
  mutable std::mutex mutex_;
  TimePoint deadline_;
  std::string service_name_;
  bool closed_by_us_, reset_by_us_;
};

struct DialRecord {
  DialRecord() : peer_id(), addresses(), options(), time() {}
  PeerId peer_id;
  Addresses addresses;
  DialOptions options;
  TimePoint time;
};

class FakeHost : public Host {
 public:
  typedef std::function<std::error_code(const DialRecord&)> DialBehaviour;

  // Succeeds only for simultaneous connects, as a peer behind a NAT would.
  static DialBehaviour SimultaneousDialSucceeds();
  static DialBehaviour AlwaysSucceeds();
  // Fails with error once the dial's timeout expires, or with operation_canceled if cancelled.
  static DialBehaviour TimesOut();

  FakeHost(FakeNetwork& network, const PeerId& peer_id, const Address& address);

  virtual PeerId id() const { return kPeerId_; }
  virtual std::vector<ConnectionInfo> ConnectionsToPeer(const PeerId& peer_id) const;
  virtual Addresses PeerAddresses(const PeerId& peer_id) const;
  virtual std::shared_ptr<Stream> NewStream(const PeerId& peer_id, const std::string& protocol,
                                            const StreamOptions& options, std::error_code& ec);
  virtual std::error_code Connect(const PeerId& peer_id, const Addresses& addresses,
                                  const DialOptions& options);
  virtual void SetStreamHandler(const std::string& protocol, StreamHandler handler);
  // Blocks until handlers for protocol already running have returned.
  virtual void RemoveStreamHandler(const std::string& protocol);
  virtual void AddConnectionListener(ConnectionListener* listener);
  virtual void RemoveConnectionListener(ConnectionListener* listener);

  void SetPeerAddresses(const PeerId& peer_id, const Addresses& addresses);
  void SetDialBehaviour(DialBehaviour dial_behaviour);

  const Address& address() const { return kAddress_; }
  std::vector<DialRecord> dials() const;
  int streams_opened() const { return streams_opened_; }
  int64_t reserved_memory() const { return *reserved_; }
  size_t listener_count() const;
  // The most recent stream this host opened.
  std::shared_ptr<FakeStream> last_stream() const;

  void NotifyConnected(const ConnectionInfo& connection);
  // Runs the handler for protocol, if any, on a new thread with a stream over the given
  // channels.
  bool HandleIncomingStream(const std::string& protocol, std::shared_ptr<Channel> inbound,
                            std::shared_ptr<Channel> outbound, const ConnectionInfo& connection);

 private:
  FakeHost(const FakeHost&);
  FakeHost& operator=(const FakeHost&);

  FakeNetwork& network_;
  const PeerId kPeerId_;
  const Address kAddress_;
  mutable std::mutex mutex_;
  std::condition_variable handlers_cond_var_;
  std::map<std::string, StreamHandler> handlers_;
  std::map<std::string, int> running_handlers_;
  std::vector<ConnectionListener*> listeners_;
  std::map<PeerId, Addresses> peer_addresses_;
  DialBehaviour dial_behaviour_;
  std::vector<DialRecord> dials_;
  std::shared_ptr<FakeStream> last_stream_;
  std::atomic<int> streams_opened_;
  std::shared_ptr<std::atomic<int64_t>> reserved_;
};

// Connects FakeHosts in-process.  Must outlive everything using its hosts.
class FakeNetwork {
 public:
  FakeNetwork();
  ~FakeNetwork();

  FakeHost& AddHost(const Address& address);

  // Adds a connection dialled by dialler and accepted by listener, notifying both hosts'
  // connection listeners.
  void Connect(const PeerId& dialler, const PeerId& listener, bool relayed);
  std::vector<ConnectionInfo> ConnectionsOf(const PeerId& local, const PeerId& remote) const;
  // Hands the remote end of a new stream from local over connection to the remote host.
  // inbound and outbound are as seen by the remote end.
  bool DeliverStream(const PeerId& local, const ConnectionInfo& connection,
                     const std::string& protocol, std::shared_ptr<Channel> inbound,
                     std::shared_ptr<Channel> outbound);
  void RunDetached(std::function<void()> functor);

 private:
  FakeNetwork(const FakeNetwork&);
  FakeNetwork& operator=(const FakeNetwork&);

  struct Link {
    uint64_t id;
    PeerId dialler, listener;
    bool relayed;
  };

  FakeHost* Find(const PeerId& peer_id) const;
  ConnectionInfo View(const Link& link, const PeerId& local) const;

  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<FakeHost>> hosts_;
  std::vector<Link> links_;
  uint64_t next_link_id_;
  std::vector<std::thread> threads_;
};

class FakeIdentifyService : public IdentifyService {
 public:
  FakeIdentifyService();
  virtual void IdentifyWait(const ConnectionInfo& connection,
                            std::function<void()> on_identified);
  // While held, callbacks are queued until Release() is called.
  void Hold();
  void Release();
  int waits() const;

 private:
  mutable std::mutex mutex_;
  bool held_;
  int waits_;
  std::vector<std::function<void()>> pending_;
};

class RecordingTracer : public Tracer {
 public:
  struct Finished {
    std::string side;
    int attempts;
    Addresses remote_addresses, local_addresses;
    bool direct;
  };

  RecordingTracer();
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

  // Event names in order of arrival.
  std::vector<std::string> events() const;
  int Count(const std::string& event) const;
  std::vector<Finished> finished() const;
  std::vector<std::error_code> protocol_errors() const;

 private:
  void Record(const std::string& event);

  mutable std::mutex mutex_;
  std::vector<std::string> events_;
  std::vector<Finished> finished_;
  std::vector<std::error_code> protocol_errors_;
};

// A stream handler playing the responder side of the rendezvous: reads CONNECT, waits for
// reply_delay, replies with a CONNECT (or a SYNC if reply_with_sync) offering offer, then reads
// the initiator's SYNC.  syncs_received (which may be null) counts SYNCs read.
StreamHandler ScriptedResponder(const Addresses& offer, const Duration& reply_delay,
                                bool reply_with_sync,
                                std::shared_ptr<std::atomic<int>> syncs_received);

// Polls condition until it holds or timeout expires.
testing::AssertionResult WaitFor(std::function<bool()> condition,
                                 const std::chrono::milliseconds& timeout);

}  // namespace test

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_TESTS_TEST_UTILS_H_
