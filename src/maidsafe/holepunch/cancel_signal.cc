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

#include "maidsafe/holepunch/cancel_signal.h"

namespace maidsafe {

namespace holepunch {

CancelSignal::Subscription::Subscription(const CancelSignal& signal, Handler handler)
    : connection_(signal.Subscribe(handler)) {}

CancelSignal::CancelSignal() : mutex_(), cancelled_(false), signal_() {}

void CancelSignal::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_)
      return;
    cancelled_ = true;
  }
  signal_();
  signal_.disconnect_all_slots();
}

bool CancelSignal::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

boost::signals2::connection CancelSignal::Subscribe(Handler handler) const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_)
      return signal_.connect(handler);
  }
  handler();
  return boost::signals2::connection();
}

}  // namespace holepunch

}  // namespace maidsafe
