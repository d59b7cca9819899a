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

#include "maidsafe/holepunch/active_peers.h"

namespace maidsafe {

namespace holepunch {

namespace detail {

ActivePeers::Guard::Guard(ActivePeers& active_peers, const PeerId& peer_id)
    : active_peers_(active_peers), kPeerId_(peer_id), admission_(active_peers.TryInsert(peer_id)) {}

ActivePeers::Guard::~Guard() {
  if (admission_ == Admission::kAdmitted)
    active_peers_.Remove(kPeerId_);
}

ActivePeers::ActivePeers() : mutex_(), closed_(false), peers_() {}

ActivePeers::Admission ActivePeers::TryInsert(const PeerId& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_)
    return Admission::kClosed;
  return peers_.insert(peer_id).second ? Admission::kAdmitted : Admission::kAlreadyActive;
}

void ActivePeers::Remove(const PeerId& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_.erase(peer_id);
}

void ActivePeers::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
}

bool ActivePeers::Contains(const PeerId& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.count(peer_id) != 0;
}

size_t ActivePeers::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

bool ActivePeers::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe
