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

#ifndef MAIDSAFE_HOLEPUNCH_MESSAGE_IO_H_
#define MAIDSAFE_HOLEPUNCH_MESSAGE_IO_H_

#include <cstdint>
#include <string>
#include <system_error>

#include "maidsafe/holepunch/host.h"

namespace maidsafe {

namespace holepunch {

namespace protobuf { class HolePunch; }

namespace detail {

// Messages are framed as an unsigned varint length followed by the serialised message.
std::string Frame(const std::string& serialised_message);

class MessageWriter {
 public:
  explicit MessageWriter(Stream& stream);
  std::error_code WriteMessage(const protobuf::HolePunch& message);

 private:
  MessageWriter(const MessageWriter&);
  MessageWriter& operator=(const MessageWriter&);

  Stream& stream_;
};

// Bytes read from the stream beyond the end of one message are kept for the next.
class MessageReader {
 public:
  MessageReader(Stream& stream, uint32_t max_message_size);
  std::error_code ReadMessage(protobuf::HolePunch& message);

 private:
  MessageReader(const MessageReader&);
  MessageReader& operator=(const MessageReader&);

  std::error_code ReadLength(uint64_t& length, size_t& prefix_size);
  std::error_code FillBuffer(size_t size);

  Stream& stream_;
  const uint32_t kMaxMessageSize_;
  std::string buffer_;
};

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe

#endif  // MAIDSAFE_HOLEPUNCH_MESSAGE_IO_H_
