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

#include "maidsafe/holepunch/tests/test_utils.h"

#include <algorithm>
#include <initializer_list>
#include <string>
#include <utility>

#include "maidsafe/common/log.h"
#include "maidsafe/common/utils.h"

#include "maidsafe/holepunch/cancel_signal.h"
#include "maidsafe/holepunch/message_io.h"
#include "maidsafe/holepunch/parameters.h"
#include "maidsafe/holepunch/utils.h"
#include "holepunch.pb.h"

namespace maidsafe {

namespace holepunch {

namespace test {

namespace {

Address TcpAddress(const std::string& ip, uint16_t port) {
  return Address::create("/ip4/" + ip + "/tcp/" + std::to_string(port)).value();
}

}  // unnamed namespace

Address PublicAddress(uint8_t last_octet, uint16_t port) {
  return TcpAddress("203.0.113." + std::to_string(last_octet), port);
}

Address PrivateAddress(uint8_t last_octet, uint16_t port) {
  return TcpAddress("192.168.1." + std::to_string(last_octet), port);
}

Address RelayAddress() {
  return Address::create("/ip4/198.51.100.7/tcp/4001/p2p/" + std::string(kRelayPeerId) +
                         "/p2p-circuit").value();
}

PeerId RandomPeerId() { return PeerId(maidsafe::RandomString(PeerId::kSize)); }

StreamHandler ScriptedResponder(const Addresses& offer, const Duration& reply_delay,
                                bool reply_with_sync,
                                std::shared_ptr<std::atomic<int>> syncs_received) {
  return [=](std::shared_ptr<Stream> stream) {
    detail::MessageReader reader(*stream, Parameters::max_message_size);
    detail::MessageWriter writer(*stream);
    protobuf::HolePunch message;
    if (reader.ReadMessage(message) || message.type() != protobuf::HolePunch::CONNECT) {
      stream->Reset();
      return;
    }
    if (reply_delay > Duration::zero())
      maidsafe::Sleep(std::chrono::duration_cast<std::chrono::milliseconds>(reply_delay));

    protobuf::HolePunch reply;
    reply.set_type(reply_with_sync ? protobuf::HolePunch::SYNC : protobuf::HolePunch::CONNECT);
    for (const auto& address : offer)
      reply.add_obs_addrs(EncodeAddress(address));
    if (writer.WriteMessage(reply)) {
      stream->Reset();
      return;
    }

    message.Clear();
    if (!reader.ReadMessage(message) && message.type() == protobuf::HolePunch::SYNC &&
        syncs_received) {
      ++*syncs_received;
    }
    stream->Close();
  };
}

testing::AssertionResult WaitFor(std::function<bool()> condition,
                                 const std::chrono::milliseconds& timeout) {
  TimePoint deadline(Clock::now() + timeout);
  while (!condition()) {
    if (Clock::now() > deadline)
      return testing::AssertionFailure() << "Timed out after " << timeout.count() << " ms";
    maidsafe::Sleep(std::chrono::milliseconds(10));
  }
  return testing::AssertionSuccess();
}

// ================================ FakeStream ================================================

FakeStream::FakeStream(ConnectionInfo connection, std::shared_ptr<Channel> inbound,
                       std::shared_ptr<Channel> outbound,
                       std::shared_ptr<std::atomic<int64_t>> reserved)
    : connection_(std::move(connection)),
      inbound_(std::move(inbound)),
      outbound_(std::move(outbound)),
      reserved_(std::move(reserved)),
      mutex_(),
      deadline_(),
      service_name_(),
      closed_by_us_(false),
      reset_by_us_(false) {}

FakeStream::~FakeStream() {
  if (!was_closed() && !was_reset())
    Reset();
}

size_t FakeStream::ReadSome(char* data, size_t size, std::error_code& ec) {
  TimePoint deadline;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    deadline = deadline_;
  }
  std::unique_lock<std::mutex> lock(inbound_->mutex);
  auto ready([this] { return !inbound_->data.empty() || inbound_->closed || inbound_->reset; });
  if (deadline == TimePoint()) {
    inbound_->cond_var.wait(lock, ready);
  } else if (!inbound_->cond_var.wait_until(lock, deadline, ready)) {
    ec = std::make_error_code(std::errc::timed_out);
    return 0;
  }
  if (inbound_->reset) {
    ec = std::make_error_code(std::errc::connection_reset);
    return 0;
  }
  if (inbound_->data.empty()) {
    ec = std::make_error_code(std::errc::connection_aborted);
    return 0;
  }
  size_t count(std::min(size, inbound_->data.size()));
  std::copy(inbound_->data.begin(), inbound_->data.begin() + count, data);
  inbound_->data.erase(0, count);
  return count;
}

void FakeStream::Write(const std::string& data, std::error_code& ec) {
  std::lock_guard<std::mutex> lock(outbound_->mutex);
  if (outbound_->reset) {
    ec = std::make_error_code(std::errc::connection_reset);
    return;
  }
  if (outbound_->closed) {
    ec = std::make_error_code(std::errc::broken_pipe);
    return;
  }
  outbound_->data += data;
  outbound_->cond_var.notify_all();
}

void FakeStream::SetDeadline(const TimePoint& deadline) {
  std::lock_guard<std::mutex> lock(mutex_);
  deadline_ = deadline;
}

void FakeStream::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_by_us_ = true;
  }
  std::lock_guard<std::mutex> lock(outbound_->mutex);
  outbound_->closed = true;
  outbound_->cond_var.notify_all();
}

void FakeStream::Reset() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_by_us_ = true;
  }
  for (auto channel : {inbound_, outbound_}) {
    std::lock_guard<std::mutex> lock(channel->mutex);
    channel->reset = true;
    channel->cond_var.notify_all();
  }
}

std::error_code FakeStream::SetService(const std::string& service_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  service_name_ = service_name;
  return std::error_code();
}

std::error_code FakeStream::ReserveMemory(size_t size) {
  *reserved_ += static_cast<int64_t>(size);
  return std::error_code();
}

void FakeStream::ReleaseMemory(size_t size) { *reserved_ -= static_cast<int64_t>(size); }

bool FakeStream::was_reset() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reset_by_us_;
}

bool FakeStream::was_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_by_us_;
}

std::string FakeStream::service_name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return service_name_;
}

// ================================ FakeHost ==================================================

FakeHost::DialBehaviour FakeHost::SimultaneousDialSucceeds() {
  return [](const DialRecord& record) {
    return record.options.simultaneous_connect
               ? std::error_code()
               : std::make_error_code(std::errc::connection_refused);
  };
}

FakeHost::DialBehaviour FakeHost::AlwaysSucceeds() {
  return [](const DialRecord&) { return std::error_code(); };
}

FakeHost::DialBehaviour FakeHost::TimesOut() {
  return [](const DialRecord& record) {
    struct State {
      State() : mutex(), cond_var(), cancelled(false) {}
      std::mutex mutex;
      std::condition_variable cond_var;
      bool cancelled;
    };
    auto state(std::make_shared<State>());
    std::unique_ptr<CancelSignal::Subscription> subscription;
    if (record.options.cancel) {
      subscription.reset(new CancelSignal::Subscription(*record.options.cancel, [state] {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->cancelled = true;
        state->cond_var.notify_all();
      }));
    }
    std::unique_lock<std::mutex> lock(state->mutex);
    state->cond_var.wait_for(lock, record.options.timeout, [state] { return state->cancelled; });
    return state->cancelled ? std::make_error_code(std::errc::operation_canceled)
                            : std::make_error_code(std::errc::timed_out);
  };
}

FakeHost::FakeHost(FakeNetwork& network, const PeerId& peer_id, const Address& address)
    : network_(network),
      kPeerId_(peer_id),
      kAddress_(address),
      mutex_(),
      handlers_cond_var_(),
      handlers_(),
      running_handlers_(),
      listeners_(),
      peer_addresses_(),
      dial_behaviour_(SimultaneousDialSucceeds()),
      dials_(),
      last_stream_(),
      streams_opened_(0),
      reserved_(std::make_shared<std::atomic<int64_t>>(0)) {}

std::vector<ConnectionInfo> FakeHost::ConnectionsToPeer(const PeerId& peer_id) const {
  return network_.ConnectionsOf(kPeerId_, peer_id);
}

Addresses FakeHost::PeerAddresses(const PeerId& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto itr(peer_addresses_.find(peer_id));
  return itr == peer_addresses_.end() ? Addresses() : itr->second;
}

std::shared_ptr<Stream> FakeHost::NewStream(const PeerId& peer_id, const std::string& protocol,
                                            const StreamOptions& options, std::error_code& ec) {
  ++streams_opened_;
  std::vector<ConnectionInfo> connections(ConnectionsToPeer(peer_id));
  if (connections.empty()) {
    ec = std::make_error_code(std::errc::not_connected);
    return nullptr;
  }
  const ConnectionInfo& connection(connections.front());
  if (detail::IsRelayAddress(connection.remote_address) && !options.allow_limited_connection) {
    ec = std::make_error_code(std::errc::permission_denied);
    return nullptr;
  }
  auto inbound(std::make_shared<Channel>()), outbound(std::make_shared<Channel>());
  auto stream(std::make_shared<FakeStream>(connection, inbound, outbound, reserved_));
  if (!network_.DeliverStream(kPeerId_, connection, protocol, outbound, inbound)) {
    ec = std::make_error_code(std::errc::protocol_not_supported);
    return nullptr;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  last_stream_ = stream;
  return stream;
}

std::error_code FakeHost::Connect(const PeerId& peer_id, const Addresses& addresses,
                                  const DialOptions& options) {
  DialRecord record;
  record.peer_id = peer_id;
  record.addresses = addresses;
  record.options = options;
  record.time = Clock::now();
  DialBehaviour dial_behaviour;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dials_.push_back(record);
    dial_behaviour = dial_behaviour_;
  }
  std::error_code ec(dial_behaviour(record));
  if (ec)
    return ec;
  ConnectionInfo direct_connection;
  if (!detail::GetDirectConnection(*this, peer_id, direct_connection))
    network_.Connect(kPeerId_, peer_id, false);
  return ec;
}

void FakeHost::SetStreamHandler(const std::string& protocol, StreamHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[protocol] = handler;
}

void FakeHost::RemoveStreamHandler(const std::string& protocol) {
  std::unique_lock<std::mutex> lock(mutex_);
  handlers_.erase(protocol);
  handlers_cond_var_.wait(lock, [&] { return running_handlers_[protocol] == 0; });
}

void FakeHost::AddConnectionListener(ConnectionListener* listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.push_back(listener);
}

void FakeHost::RemoveConnectionListener(ConnectionListener* listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void FakeHost::SetPeerAddresses(const PeerId& peer_id, const Addresses& addresses) {
  std::lock_guard<std::mutex> lock(mutex_);
  peer_addresses_[peer_id] = addresses;
}

void FakeHost::SetDialBehaviour(DialBehaviour dial_behaviour) {
  std::lock_guard<std::mutex> lock(mutex_);
  dial_behaviour_ = dial_behaviour;
}

std::vector<DialRecord> FakeHost::dials() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dials_;
}

size_t FakeHost::listener_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

std::shared_ptr<FakeStream> FakeHost::last_stream() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_stream_;
}

void FakeHost::NotifyConnected(const ConnectionInfo& connection) {
  std::vector<ConnectionListener*> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners = listeners_;
  }
  for (auto listener : listeners)
    listener->Connected(connection);
}

bool FakeHost::HandleIncomingStream(const std::string& protocol,
                                    std::shared_ptr<Channel> inbound,
                                    std::shared_ptr<Channel> outbound,
                                    const ConnectionInfo& connection) {
  StreamHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto itr(handlers_.find(protocol));
    if (itr == handlers_.end())
      return false;
    handler = itr->second;
    ++running_handlers_[protocol];
  }
  auto stream(std::make_shared<FakeStream>(connection, inbound, outbound, reserved_));
  network_.RunDetached([this, handler, stream, protocol]() mutable {
    handler(stream);
    stream.reset();
    std::lock_guard<std::mutex> lock(mutex_);
    if (--running_handlers_[protocol] == 0)
      handlers_cond_var_.notify_all();
  });
  return true;
}

// ================================ FakeNetwork ===============================================

FakeNetwork::FakeNetwork()
    : mutex_(), hosts_(), links_(), next_link_id_(1), threads_() {}

FakeNetwork::~FakeNetwork() {
  for (;;) {
    std::vector<std::thread> threads;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      threads.swap(threads_);
    }
    if (threads.empty())
      break;
    for (auto& thread : threads)
      thread.join();
  }
}

FakeHost& FakeNetwork::AddHost(const Address& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  hosts_.emplace_back(new FakeHost(*this, RandomPeerId(), address));
  return *hosts_.back();
}

void FakeNetwork::Connect(const PeerId& dialler, const PeerId& listener, bool relayed) {
  FakeHost* dialler_host(nullptr);
  FakeHost* listener_host(nullptr);
  ConnectionInfo dialler_view, listener_view;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Link link;
    link.id = next_link_id_++;
    link.dialler = dialler;
    link.listener = listener;
    link.relayed = relayed;
    links_.push_back(link);
    dialler_host = Find(dialler);
    listener_host = Find(listener);
    dialler_view = View(link, dialler);
    listener_view = View(link, listener);
  }
  if (dialler_host)
    dialler_host->NotifyConnected(dialler_view);
  if (listener_host)
    listener_host->NotifyConnected(listener_view);
}

std::vector<ConnectionInfo> FakeNetwork::ConnectionsOf(const PeerId& local,
                                                       const PeerId& remote) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConnectionInfo> connections;
  for (const auto& link : links_) {
    if ((link.dialler == local && link.listener == remote) ||
        (link.dialler == remote && link.listener == local)) {
      connections.push_back(View(link, local));
    }
  }
  return connections;
}

bool FakeNetwork::DeliverStream(const PeerId& local, const ConnectionInfo& connection,
                                const std::string& protocol, std::shared_ptr<Channel> inbound,
                                std::shared_ptr<Channel> outbound) {
  FakeHost* remote_host(nullptr);
  ConnectionInfo remote_view;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto itr(std::find_if(links_.begin(), links_.end(),
                          [&connection](const Link& link) { return link.id == connection.id; }));
    if (itr == links_.end())
      return false;
    remote_host = Find(connection.remote_peer);
    remote_view = View(*itr, connection.remote_peer);
  }
  return remote_host && remote_view.remote_peer == local &&
         remote_host->HandleIncomingStream(protocol, inbound, outbound, remote_view);
}

void FakeNetwork::RunDetached(std::function<void()> functor) {
  std::lock_guard<std::mutex> lock(mutex_);
  threads_.emplace_back(std::move(functor));
}

FakeHost* FakeNetwork::Find(const PeerId& peer_id) const {
  for (const auto& host : hosts_) {
    if (host->id() == peer_id)
      return host.get();
  }
  return nullptr;
}

ConnectionInfo FakeNetwork::View(const Link& link, const PeerId& local) const {
  bool local_dialled(link.dialler == local);
  const PeerId& remote(local_dialled ? link.listener : link.dialler);
  Address remote_address(RelayAddress());
  if (!link.relayed) {
    FakeHost* remote_host(Find(remote));
    remote_address = remote_host ? remote_host->address() : UnspecifiedAddress();
  }
  return ConnectionInfo(link.id, remote, remote_address,
                        local_dialled ? Direction::kOutbound : Direction::kInbound);
}

// ================================ FakeIdentifyService =======================================

FakeIdentifyService::FakeIdentifyService() : mutex_(), held_(false), waits_(0), pending_() {}

void FakeIdentifyService::IdentifyWait(const ConnectionInfo& /*connection*/,
                                       std::function<void()> on_identified) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++waits_;
    if (held_) {
      pending_.push_back(on_identified);
      return;
    }
  }
  on_identified();
}

void FakeIdentifyService::Hold() {
  std::lock_guard<std::mutex> lock(mutex_);
  held_ = true;
}

void FakeIdentifyService::Release() {
  std::vector<std::function<void()>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    held_ = false;
    pending.swap(pending_);
  }
  for (auto& on_identified : pending)
    on_identified();
}

int FakeIdentifyService::waits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return waits_;
}

// ================================ RecordingTracer ===========================================

RecordingTracer::RecordingTracer() : mutex_(), events_(), finished_(), protocol_errors_() {}

void RecordingTracer::DirectDialSuccessful(const PeerId& /*peer_id*/, const Duration& /*elapsed*/) {
  Record("DirectDialSuccessful");
}

void RecordingTracer::DirectDialFailed(const PeerId& /*peer_id*/, const Duration& /*elapsed*/,
                                       const std::error_code& /*error*/) {
  Record("DirectDialFailed");
}

void RecordingTracer::ProtocolError(const PeerId& /*peer_id*/, const std::error_code& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back("ProtocolError");
  protocol_errors_.push_back(error);
}

void RecordingTracer::StartHolePunch(const PeerId& /*peer_id*/,
                                     const Addresses& /*remote_addresses*/,
                                     const Duration& /*rtt*/) {
  Record("StartHolePunch");
}

void RecordingTracer::HolePunchAttempt(const PeerId& /*peer_id*/) { Record("HolePunchAttempt"); }

void RecordingTracer::EndHolePunch(const PeerId& /*peer_id*/, const Duration& /*elapsed*/,
                                   const std::error_code& /*error*/) {
  Record("EndHolePunch");
}

void RecordingTracer::HolePunchFinished(const std::string& side, int attempts,
                                        const Addresses& remote_addresses,
                                        const Addresses& local_addresses,
                                        const ConnectionInfo* direct_connection) {
  Finished finished;
  finished.side = side;
  finished.attempts = attempts;
  finished.remote_addresses = remote_addresses;
  finished.local_addresses = local_addresses;
  finished.direct = direct_connection != nullptr;
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back("HolePunchFinished");
  finished_.push_back(finished);
}

std::vector<std::string> RecordingTracer::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

int RecordingTracer::Count(const std::string& event) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(std::count(events_.begin(), events_.end(), event));
}

std::vector<RecordingTracer::Finished> RecordingTracer::finished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_;
}

std::vector<std::error_code> RecordingTracer::protocol_errors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return protocol_errors_;
}

void RecordingTracer::Record(const std::string& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

}  // namespace test

}  // namespace holepunch

}  // namespace maidsafe
