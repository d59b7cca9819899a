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

#include "maidsafe/holepunch/rendezvous.h"

#include <string>
#include <utility>

#include "maidsafe/common/log.h"

#include "maidsafe/holepunch/message_io.h"
#include "maidsafe/holepunch/parameters.h"
#include "maidsafe/holepunch/return_codes.h"
#include "maidsafe/holepunch/utils.h"
#include "holepunch.pb.h"

namespace maidsafe {

namespace holepunch {

namespace detail {

namespace {

// Holds a memory reservation on a stream for the duration of one exchange.
class ScopedReservation {
 public:
  ScopedReservation(Stream& stream, size_t size) : stream_(stream), size_(size), held_(false) {}
  ~ScopedReservation() {
    if (held_)
      stream_.ReleaseMemory(size_);
  }
  std::error_code Reserve() {
    std::error_code ec(stream_.ReserveMemory(size_));
    if (ec) {
      LOG(kError) << "Failed to reserve " << size_ << " bytes for stream: " << ec.message();
      return make_error_code(HolePunchErrors::memory_reservation_failed);
    }
    held_ = true;
    return ec;
  }

 private:
  ScopedReservation(const ScopedReservation&);
  ScopedReservation& operator=(const ScopedReservation&);

  Stream& stream_;
  const size_t size_;
  bool held_;
};

protobuf::HolePunch ConnectMessage(const Addresses& addresses) {
  protobuf::HolePunch message;
  message.set_type(protobuf::HolePunch::CONNECT);
  for (const auto& encoded : AddressesToBytes(addresses))
    message.add_obs_addrs(encoded);
  return message;
}

protobuf::HolePunch SyncMessage() {
  protobuf::HolePunch message;
  message.set_type(protobuf::HolePunch::SYNC);
  return message;
}

// Resets the stream and returns error.
std::error_code Abort(Stream& stream, const std::error_code& error) {
  stream.Reset();
  return error;
}

}  // unnamed namespace

Rendezvous::Rendezvous(ListenAddressesFunctor listen_addresses, AddressFilter* address_filter)
    : listen_addresses_(std::move(listen_addresses)), address_filter_(address_filter) {}

Addresses Rendezvous::LocalOffer(const PeerId& peer_id) const {
  Addresses offer(RemoveRelayAddresses(listen_addresses_ ? listen_addresses_() : Addresses()));
  if (address_filter_)
    offer = address_filter_->FilterLocal(peer_id, offer);
  return offer;
}

Addresses Rendezvous::FilterRemote(const PeerId& peer_id, const Addresses& received) const {
  Addresses candidates(RemoveRelayAddresses(received));
  if (address_filter_)
    candidates = address_filter_->FilterRemote(peer_id, candidates);
  return candidates;
}

std::error_code Rendezvous::Initiate(Host& host, const PeerId& peer_id,
                                     const CancelSignal& cancel,
                                     RendezvousResult& result) const {
  StreamOptions options;
  options.no_dial = true;
  options.allow_limited_connection = true;
  options.reason = "hole-punch";
  options.cancel = &cancel;
  std::error_code ec;
  std::shared_ptr<Stream> stream(host.NewStream(peer_id, Parameters::protocol_id, options, ec));
  if (ec || !stream) {
    LOG(kError) << "Failed to open hole punching stream to " << DebugId(peer_id) << ": "
                << (ec ? ec.message() : "no stream");
    return make_error_code(HolePunchErrors::stream_open_failed);
  }

  ec = stream->SetService(Parameters::service_name);
  if (ec) {
    LOG(kError) << "Failed to attach stream to " << Parameters::service_name << ": "
                << ec.message();
    return Abort(*stream, ec);
  }

  ScopedReservation reservation(*stream, Parameters::max_message_size);
  ec = reservation.Reserve();
  if (ec)
    return Abort(*stream, ec);

  stream->SetDeadline(Clock::now() + ToDuration(Parameters::stream_timeout));
  ec = ExchangeAsInitiator(*stream, result);
  if (ec)
    return Abort(*stream, ec);
  stream->Close();
  return ec;
}

std::error_code Rendezvous::ExchangeAsInitiator(Stream& stream, RendezvousResult& result) const {
  const PeerId peer_id(stream.Connection().remote_peer);
  result.local_addresses = LocalOffer(peer_id);
  if (result.local_addresses.empty()) {
    LOG(kWarning) << "Aborting hole punch initiation with " << DebugId(peer_id)
                  << " as we have no public address";
    return make_error_code(HolePunchErrors::no_public_address);
  }
  LOG(kVerbose) << "Initiating hole punch with " << DebugId(peer_id) << " offering "
                << DebugString(result.local_addresses);

  MessageWriter writer(stream);
  MessageReader reader(stream, Parameters::max_message_size);

  TimePoint start(Clock::now());
  std::error_code ec(writer.WriteMessage(ConnectMessage(result.local_addresses)));
  if (ec)
    return ec;

  protobuf::HolePunch message;
  ec = reader.ReadMessage(message);
  if (ec) {
    LOG(kError) << "Failed to read CONNECT from " << DebugId(peer_id) << ": " << ec.message();
    return ec;
  }
  result.rtt = Clock::now() - start;
  if (message.type() != protobuf::HolePunch::CONNECT) {
    LOG(kError) << "Expected CONNECT from " << DebugId(peer_id) << ", got " << message.type();
    return make_error_code(HolePunchErrors::protocol_error);
  }

  result.remote_addresses = FilterRemote(peer_id, AddressesFromBytes(message.obs_addrs()));
  if (result.remote_addresses.empty()) {
    LOG(kWarning) << "Didn't receive any public addresses in CONNECT from " << DebugId(peer_id);
    return make_error_code(HolePunchErrors::no_public_address);
  }

  ec = writer.WriteMessage(SyncMessage());
  if (ec)
    LOG(kError) << "Failed to send SYNC to " << DebugId(peer_id) << ": " << ec.message();
  return ec;
}

std::error_code Rendezvous::Respond(Stream& stream, RendezvousResult& result) const {
  std::error_code ec(stream.SetService(Parameters::service_name));
  if (ec) {
    LOG(kError) << "Failed to attach stream to " << Parameters::service_name << ": "
                << ec.message();
    return Abort(stream, ec);
  }

  ScopedReservation reservation(stream, Parameters::max_message_size);
  ec = reservation.Reserve();
  if (ec)
    return Abort(stream, ec);

  stream.SetDeadline(Clock::now() + ToDuration(Parameters::stream_timeout));
  ec = ExchangeAsResponder(stream, result);
  if (ec)
    return Abort(stream, ec);
  stream.Close();
  return ec;
}

std::error_code Rendezvous::ExchangeAsResponder(Stream& stream, RendezvousResult& result) const {
  const PeerId peer_id(stream.Connection().remote_peer);
  result.local_addresses = LocalOffer(peer_id);
  if (result.local_addresses.empty()) {
    LOG(kWarning) << "Rejecting hole punch request from " << DebugId(peer_id)
                  << " as we have no public address";
    return make_error_code(HolePunchErrors::no_public_address);
  }

  MessageWriter writer(stream);
  MessageReader reader(stream, Parameters::max_message_size);

  protobuf::HolePunch message;
  std::error_code ec(reader.ReadMessage(message));
  if (ec) {
    LOG(kError) << "Failed to read CONNECT from " << DebugId(peer_id) << ": " << ec.message();
    return ec;
  }
  if (message.type() != protobuf::HolePunch::CONNECT) {
    LOG(kError) << "Expected CONNECT from " << DebugId(peer_id) << ", got " << message.type();
    return make_error_code(HolePunchErrors::protocol_error);
  }

  result.remote_addresses = FilterRemote(peer_id, AddressesFromBytes(message.obs_addrs()));
  if (result.remote_addresses.empty()) {
    LOG(kWarning) << "Didn't receive any public addresses in CONNECT from " << DebugId(peer_id);
    return make_error_code(HolePunchErrors::no_public_address);
  }

  ec = writer.WriteMessage(ConnectMessage(result.local_addresses));
  if (ec)
    return ec;
  TimePoint start(Clock::now());

  message.Clear();
  ec = reader.ReadMessage(message);
  if (ec) {
    LOG(kError) << "Failed to read SYNC from " << DebugId(peer_id) << ": " << ec.message();
    return ec;
  }
  result.rtt = Clock::now() - start;
  if (message.type() != protobuf::HolePunch::SYNC) {
    LOG(kError) << "Expected SYNC from " << DebugId(peer_id) << ", got " << message.type();
    return make_error_code(HolePunchErrors::protocol_error);
  }
  return ec;
}

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe
