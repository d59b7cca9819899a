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

#include "maidsafe/holepunch/return_codes.h"

namespace maidsafe {

namespace holepunch {

namespace {

class HolePunchCategory : public std::error_category {
 public:
  virtual const char* name() const noexcept { return "holepunch"; }

  virtual std::string message(int error_value) const {
    switch (static_cast<HolePunchErrors>(error_value)) {
      case HolePunchErrors::closed:
        return "hole puncher has been closed";
      case HolePunchErrors::already_active:
        return "another hole punching attempt to this peer is active";
      case HolePunchErrors::no_public_address:
        return "no public address to hole punch with";
      case HolePunchErrors::protocol_error:
        return "unexpected rendezvous message";
      case HolePunchErrors::stream_open_failed:
        return "failed to open hole punching stream";
      case HolePunchErrors::message_too_large:
        return "rendezvous message exceeds maximum size";
      case HolePunchErrors::memory_reservation_failed:
        return "failed to reserve memory for hole punching stream";
      case HolePunchErrors::connect_failed:
        return "hole punch connect attempt failed";
      case HolePunchErrors::all_retries_failed:
        return "all retries for hole punch failed";
      case HolePunchErrors::cancelled:
        return "hole punching cancelled";
      default:
        return "unknown hole punching error";
    }
  }
};

}  // unnamed namespace

const std::error_category& GetHolePunchCategory() {
  static HolePunchCategory instance;
  return instance;
}

std::error_code make_error_code(HolePunchErrors code) {
  return std::error_code(static_cast<int>(code), GetHolePunchCategory());
}

std::error_condition make_error_condition(HolePunchErrors code) {
  return std::error_condition(static_cast<int>(code), GetHolePunchCategory());
}

}  // namespace holepunch

}  // namespace maidsafe
