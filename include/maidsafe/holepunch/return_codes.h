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

#ifndef MAIDSAFE_HOLEPUNCH_RETURN_CODES_H_
#define MAIDSAFE_HOLEPUNCH_RETURN_CODES_H_

#include <string>
#include <system_error>
#include <type_traits>

namespace maidsafe {

namespace holepunch {

enum class HolePunchErrors {
  // The coordinator is shutting down or has shut down.
  closed = 1,
  // Another hole punching attempt to this peer is running.
  already_active,
  // Neither side has an address worth offering.
  no_public_address,
  // Malformed or out-of-sequence rendezvous message.
  protocol_error,
  stream_open_failed,
  message_too_large,
  memory_reservation_failed,
  connect_failed,
  all_retries_failed,
  cancelled
};

const std::error_category& GetHolePunchCategory();

std::error_code make_error_code(HolePunchErrors code);
std::error_condition make_error_condition(HolePunchErrors code);

}  // namespace holepunch

}  // namespace maidsafe

namespace std {

template <>
struct is_error_code_enum<maidsafe::holepunch::HolePunchErrors> : public true_type {};

}  // namespace std

#endif  // MAIDSAFE_HOLEPUNCH_RETURN_CODES_H_
