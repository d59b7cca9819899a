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

#include "maidsafe/holepunch/parameters.h"

namespace bptime = boost::posix_time;

namespace maidsafe {

namespace holepunch {

const std::string Parameters::protocol_id("/libp2p/dcutr");
const std::string Parameters::service_name("libp2p.holepunch");
Timeout Parameters::direct_dial_timeout(bptime::seconds(5));
Timeout Parameters::stream_timeout(bptime::minutes(1));
int Parameters::max_retries(3);
uint32_t Parameters::max_message_size(4 * 1024);

}  // namespace holepunch

}  // namespace maidsafe
