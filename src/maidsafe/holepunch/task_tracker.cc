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

#include "maidsafe/holepunch/task_tracker.h"

#include <system_error>
#include <thread>
#include <utility>

#include "maidsafe/common/log.h"

namespace maidsafe {

namespace holepunch {

namespace detail {

TaskTracker::TaskTracker() : mutex_(), cond_var_(), shut_down_(false), outstanding_(0) {}

bool TaskTracker::Add() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_)
    return false;
  ++outstanding_;
  return true;
}

void TaskTracker::Done() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (--outstanding_ == 0)
    cond_var_.notify_all();
}

void TaskTracker::ShutdownAndWait() {
  std::unique_lock<std::mutex> lock(mutex_);
  shut_down_ = true;
  cond_var_.wait(lock, [this] { return outstanding_ == 0; });
}

bool TaskTracker::Spawn(std::function<void()> task) {
  if (!Add())
    return false;
  try {
    std::thread([this](std::function<void()> task) {
      {
        // Destroy the task's state before signalling completion.
        std::function<void()> local(std::move(task));
        local();
      }
      Done();
    }, std::move(task)).detach();
  }
  catch (const std::system_error& error) {
    LOG(kError) << "Failed to start task thread: " << error.what();
    Done();
    return false;
  }
  return true;
}

int TaskTracker::outstanding() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outstanding_;
}

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe
