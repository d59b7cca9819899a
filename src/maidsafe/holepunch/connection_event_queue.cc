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

#include "maidsafe/holepunch/connection_event_queue.h"

#include <utility>

namespace maidsafe {

namespace holepunch {

namespace detail {

ConnectionEventQueue::ConnectionEventQueue(boost::asio::io_service& io_service,
                                           EventHandler on_connected)
    : io_service_(io_service),
      on_connected_(std::move(on_connected)),
      mutex_(),
      stopped_(false),
      events_() {}

void ConnectionEventQueue::Connected(const ConnectionInfo& connection) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_)
      return;
    events_.push(connection);
  }
  io_service_.post([this] { ConsumeOne(); });
}

void ConnectionEventQueue::Disconnected(const ConnectionInfo& /*connection*/) {}

void ConnectionEventQueue::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  stopped_ = true;
  std::queue<ConnectionInfo>().swap(events_);
}

void ConnectionEventQueue::ConsumeOne() {
  ConnectionInfo connection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || events_.empty())
      return;
    connection = events_.front();
    events_.pop();
  }
  on_connected_(connection);
}

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe
