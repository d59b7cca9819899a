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

#include "maidsafe/holepunch/address.h"

#include <cstdint>

namespace maidsafe {

namespace holepunch {

bool ParseAddress(const std::string& text, Address& address) {
  auto parsed(Address::create(text));
  if (!parsed)
    return false;
  address = parsed.value();
  return true;
}

bool DecodeAddress(const std::string& bytes, Address& address) {
  const std::vector<uint8_t> kBytes(bytes.begin(), bytes.end());
  auto decoded(Address::create(kBytes));
  if (!decoded)
    return false;
  address = decoded.value();
  return true;
}

std::string EncodeAddress(const Address& address) {
  const auto& bytes(address.getBytesAddress());
  return std::string(bytes.begin(), bytes.end());
}

const Address& UnspecifiedAddress() {
  static const Address kUnspecified(Address::create("/ip4/0.0.0.0/tcp/0").value());
  return kUnspecified;
}

std::string DebugString(const Address& address) {
  return std::string(address.getStringAddress());
}

std::string DebugString(const Addresses& addresses) {
  std::string result("[");
  for (size_t i(0); i != addresses.size(); ++i) {
    if (i != 0)
      result += ", ";
    result += DebugString(addresses[i]);
  }
  return result + "]";
}

}  // namespace holepunch

}  // namespace maidsafe
