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

#ifndef MAIDSAFE_HOLEPUNCH_PARAMETERS_H_
#define MAIDSAFE_HOLEPUNCH_PARAMETERS_H_

#include <cstdint>
#include <string>

#include "boost/date_time/posix_time/posix_time_duration.hpp"

namespace maidsafe {

namespace holepunch {

typedef boost::posix_time::time_duration Timeout;

// This struct provides the configurability to all hole punching related parameters.
struct Parameters {
 public:
  // Protocol identifier of the stream used for the rendezvous exchange.
  static const std::string protocol_id;

  // Name of the resource-accounting service the rendezvous stream is attached to.
  static const std::string service_name;

  // Timeout applied to the opportunistic direct dial and to each timed connect attempt.
  static Timeout direct_dial_timeout;

  // I/O deadline applied to the whole of a rendezvous exchange.
  static Timeout stream_timeout;

  // Maximum number of rendezvous + timed connect iterations per DirectConnect call.
  static int max_retries;

  // Maximum size of a single framed rendezvous message.  Also the amount of memory reserved
  // on the stream for the duration of an exchange.
  static uint32_t max_message_size;

 private:
  // Disallow copying and assignment.
  Parameters(const Parameters&);
  Parameters& operator=(const Parameters&);
};

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_PARAMETERS_H_
