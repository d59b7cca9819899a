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

#include "maidsafe/holepunch/punch_scheduler.h"

#include <chrono>
#include <future>
#include <memory>

#include "boost/asio/deadline_timer.hpp"
#include "boost/asio/error.hpp"
#include "boost/date_time/posix_time/posix_time_types.hpp"

#include "maidsafe/common/log.h"

#include "maidsafe/holepunch/return_codes.h"

namespace asio = boost::asio;
namespace bptime = boost::posix_time;

namespace maidsafe {

namespace holepunch {

namespace detail {

Duration SyncDelay(const Duration& rtt) {
  return rtt < Duration::zero() ? Duration::zero() : rtt / 2;
}

bool IsClient(Role role, bool legacy_role_behavior) {
  return (role == Role::kInitiator) != legacy_role_behavior;
}

std::error_code WaitForSync(asio::io_service& io_service, const Duration& delay,
                            const CancelSignal& cancel) {
  if (cancel.cancelled())
    return make_error_code(HolePunchErrors::cancelled);
  if (delay <= Duration::zero())
    return std::error_code();

  auto timer(std::make_shared<asio::deadline_timer>(io_service));
  auto promise(std::make_shared<std::promise<boost::system::error_code>>());
  auto future(promise->get_future());
  const bptime::time_duration expiry(bptime::microseconds(
      std::chrono::duration_cast<std::chrono::microseconds>(delay).count()));

  io_service.post([timer, promise, expiry] {
    timer->expires_from_now(expiry);
    timer->async_wait([promise](const boost::system::error_code& ec) { promise->set_value(ec); });
  });
  // Both the wait and the cancel run on the io_service thread, so a cancel can't overtake the
  // wait it's meant to interrupt.
  CancelSignal::Subscription subscription(cancel, [&io_service, timer] {
    io_service.post([timer] {
      boost::system::error_code ignored;
      timer->cancel(ignored);
    });
  });

  boost::system::error_code result(future.get());
  if (result == asio::error::operation_aborted)
    return make_error_code(HolePunchErrors::cancelled);
  if (result) {
    LOG(kError) << "Sync timer failed: " << result.message();
    return make_error_code(HolePunchErrors::cancelled);
  }
  return std::error_code();
}

std::error_code HolePunchConnect(Host& host, const PeerId& peer_id, const Addresses& addresses,
                                 bool is_client, const Duration& timeout,
                                 const CancelSignal& cancel) {
  DialOptions options;
  options.force_direct = true;
  options.simultaneous_connect = true;
  options.is_client = is_client;
  options.timeout = timeout;
  options.reason = "hole-punching";
  options.cancel = &cancel;
  std::error_code ec(host.Connect(peer_id, addresses, options));
  if (ec) {
    LOG(kVerbose) << "Hole punch connect to " << DebugId(peer_id) << " on "
                  << DebugString(addresses) << " failed: " << ec.message();
    return make_error_code(cancel.cancelled() ? HolePunchErrors::cancelled
                                              : HolePunchErrors::connect_failed);
  }
  LOG(kVerbose) << "Hole punch connect to " << DebugId(peer_id) << " succeeded";
  return ec;
}

RetryPolicy::RetryPolicy(int max_retries) : kMaxRetries_(max_retries) {}

RetryPolicy::Decision RetryPolicy::Decide(Stage stage, const std::error_code& error, int attempt,
                                          bool cancelled) const {
  if (stage == Stage::kRendezvous)
    return (error || cancelled) ? Decision::kAbort : Decision::kProceed;
  if (!error)
    return Decision::kConnected;
  if (cancelled || error == make_error_code(HolePunchErrors::cancelled))
    return Decision::kAbort;
  return attempt < kMaxRetries_ ? Decision::kRetry : Decision::kExhausted;
}

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe
