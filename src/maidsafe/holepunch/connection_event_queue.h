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

#ifndef MAIDSAFE_HOLEPUNCH_CONNECTION_EVENT_QUEUE_H_
#define MAIDSAFE_HOLEPUNCH_CONNECTION_EVENT_QUEUE_H_

#include <functional>
#include <mutex>
#include <queue>

#include "boost/asio/io_service.hpp"

#include "maidsafe/holepunch/host.h"
#include "maidsafe/holepunch/types.h"

namespace maidsafe {

namespace holepunch {

namespace detail {

// Receives connection notifications from the network stack on arbitrary threads and hands each
// "connected" event to a single consumer running on io_service.  Disconnections are ignored.
class ConnectionEventQueue : public ConnectionListener {
 public:
  typedef std::function<void(const ConnectionInfo&)> EventHandler;

  ConnectionEventQueue(boost::asio::io_service& io_service, EventHandler on_connected);

  virtual void Connected(const ConnectionInfo& connection);
  virtual void Disconnected(const ConnectionInfo& connection);

  // Drops queued events and ignores all further ones.
  void Stop();

 private:
  ConnectionEventQueue(const ConnectionEventQueue&);
  ConnectionEventQueue& operator=(const ConnectionEventQueue&);

  void ConsumeOne();

  boost::asio::io_service& io_service_;
  EventHandler on_connected_;
  std::mutex mutex_;
  bool stopped_;
  std::queue<ConnectionInfo> events_;
};

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_CONNECTION_EVENT_QUEUE_H_
