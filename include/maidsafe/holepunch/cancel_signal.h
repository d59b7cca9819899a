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

#ifndef MAIDSAFE_HOLEPUNCH_CANCEL_SIGNAL_H_
#define MAIDSAFE_HOLEPUNCH_CANCEL_SIGNAL_H_

#include <functional>
#include <mutex>

#include "boost/signals2/connection.hpp"
#include "boost/signals2/signal.hpp"

namespace maidsafe {

namespace holepunch {

// One-shot broadcast used to interrupt in-flight work.  Once Cancel() has been called the signal
// stays cancelled.  Connected handlers are invoked exactly once, on the thread calling Cancel(),
// or immediately on the subscribing thread if the signal has already fired.  A handler may still
// be running when its connection is dropped, so handlers must only touch state they co-own.
class CancelSignal {
 public:
  typedef std::function<void()> Handler;

  // Disconnects its handler on destruction.
  class Subscription {
   public:
    Subscription(const CancelSignal& signal, Handler handler);

   private:
    Subscription(const Subscription&);
    Subscription& operator=(const Subscription&);

    boost::signals2::scoped_connection connection_;
  };

  CancelSignal();

  void Cancel();
  bool cancelled() const;

  // Returns a disconnected connection if the signal had already fired, in which case handler has
  // been run.
  boost::signals2::connection Subscribe(Handler handler) const;

 private:
  CancelSignal(const CancelSignal&);
  CancelSignal& operator=(const CancelSignal&);

  mutable std::mutex mutex_;
  bool cancelled_;
  mutable boost::signals2::signal<void()> signal_;
};

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_CANCEL_SIGNAL_H_
