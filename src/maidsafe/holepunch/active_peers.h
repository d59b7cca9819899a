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

#ifndef MAIDSAFE_HOLEPUNCH_ACTIVE_PEERS_H_
#define MAIDSAFE_HOLEPUNCH_ACTIVE_PEERS_H_

#include <cstddef>
#include <mutex>
#include <set>

#include "maidsafe/holepunch/types.h"

namespace maidsafe {

namespace holepunch {

namespace detail {

// The set of peers with a hole punching attempt in progress.  A peer is admitted at most once at
// a time, and nothing is admitted after Close().
class ActivePeers {
 public:
  enum class Admission { kAdmitted, kClosed, kAlreadyActive };

  // Removes the peer on destruction if it was admitted.
  class Guard {
   public:
    Guard(ActivePeers& active_peers, const PeerId& peer_id);
    ~Guard();
    Admission admission() const { return admission_; }

   private:
    Guard(const Guard&);
    Guard& operator=(const Guard&);

    ActivePeers& active_peers_;
    const PeerId kPeerId_;
    const Admission admission_;
  };

  ActivePeers();

  Admission TryInsert(const PeerId& peer_id);
  void Remove(const PeerId& peer_id);
  void Close();

  bool Contains(const PeerId& peer_id) const;
  size_t size() const;
  bool closed() const;

 private:
  ActivePeers(const ActivePeers&);
  ActivePeers& operator=(const ActivePeers&);

  mutable std::mutex mutex_;
  bool closed_;
  std::set<PeerId> peers_;
};

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_ACTIVE_PEERS_H_
