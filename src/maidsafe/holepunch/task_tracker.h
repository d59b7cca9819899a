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

#ifndef MAIDSAFE_HOLEPUNCH_TASK_TRACKER_H_
#define MAIDSAFE_HOLEPUNCH_TASK_TRACKER_H_

#include <condition_variable>
#include <functional>
#include <mutex>

namespace maidsafe {

namespace holepunch {

namespace detail {

// Counts outstanding work so that shutdown can wait for all of it to finish.
class TaskTracker {
 public:
  // Calls Done() on destruction if registration succeeded.
  class Scope {
   public:
    explicit Scope(TaskTracker& tracker) : tracker_(tracker), registered_(tracker.Add()) {}
    ~Scope() {
      if (registered_)
        tracker_.Done();
    }
    bool registered() const { return registered_; }

   private:
    Scope(const Scope&);
    Scope& operator=(const Scope&);

    TaskTracker& tracker_;
    const bool registered_;
  };

  TaskTracker();

  // Returns false once ShutdownAndWait() has been called.
  bool Add();
  void Done();
  // Refuses further work, then blocks until all outstanding work is done.  Must not be called
  // from within tracked work.
  void ShutdownAndWait();

  // Runs task on a new detached thread as tracked work.  Returns false without running task if
  // shut down.
  bool Spawn(std::function<void()> task);

  int outstanding() const;

 private:
  TaskTracker(const TaskTracker&);
  TaskTracker& operator=(const TaskTracker&);

  mutable std::mutex mutex_;
  std::condition_variable cond_var_;
  bool shut_down_;
  int outstanding_;
};

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_TASK_TRACKER_H_
