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

#include "maidsafe/holepunch/message_io.h"

#include <array>

#include "google/protobuf/io/coded_stream.h"

#include "maidsafe/common/log.h"

#include "maidsafe/holepunch/return_codes.h"
#include "holepunch.pb.h"

namespace maidsafe {

namespace holepunch {

namespace detail {

namespace {

const size_t kMaxVarint32Size(5);
const size_t kMaxVarint64Size(10);
const size_t kReadChunkSize(1024);

}  // unnamed namespace

std::string Frame(const std::string& serialised_message) {
  std::array<google::protobuf::uint8, kMaxVarint32Size> prefix;
  google::protobuf::uint8* end(google::protobuf::io::CodedOutputStream::WriteVarint32ToArray(
      static_cast<google::protobuf::uint32>(serialised_message.size()), prefix.data()));
  std::string framed(reinterpret_cast<const char*>(prefix.data()), end - prefix.data());
  framed += serialised_message;
  return framed;
}

MessageWriter::MessageWriter(Stream& stream) : stream_(stream) {}

std::error_code MessageWriter::WriteMessage(const protobuf::HolePunch& message) {
  std::string serialised;
  if (!message.SerializeToString(&serialised))
    return make_error_code(HolePunchErrors::protocol_error);
  std::error_code ec;
  stream_.Write(Frame(serialised), ec);
  return ec;
}

MessageReader::MessageReader(Stream& stream, uint32_t max_message_size)
    : stream_(stream), kMaxMessageSize_(max_message_size), buffer_() {}

std::error_code MessageReader::ReadMessage(protobuf::HolePunch& message) {
  uint64_t length(0);
  size_t prefix_size(0);
  std::error_code ec(ReadLength(length, prefix_size));
  if (ec)
    return ec;
  if (length > kMaxMessageSize_) {
    LOG(kError) << "Incoming message of " << length << " bytes exceeds limit of "
                << kMaxMessageSize_;
    return make_error_code(HolePunchErrors::message_too_large);
  }
  ec = FillBuffer(prefix_size + length);
  if (ec)
    return ec;
  bool parsed(message.ParseFromArray(buffer_.data() + prefix_size, static_cast<int>(length)));
  buffer_.erase(0, prefix_size + length);
  if (!parsed) {
    LOG(kError) << "Failed to parse incoming message of " << length << " bytes";
    return make_error_code(HolePunchErrors::protocol_error);
  }
  return std::error_code();
}

std::error_code MessageReader::ReadLength(uint64_t& length, size_t& prefix_size) {
  length = 0;
  prefix_size = 0;
  // Buffer the whole varint before decoding it.
  do {
    if (prefix_size == kMaxVarint64Size)
      return make_error_code(HolePunchErrors::protocol_error);
    std::error_code ec(FillBuffer(++prefix_size));
    if (ec)
      return ec;
  } while ((static_cast<uint8_t>(buffer_[prefix_size - 1]) & 0x80) != 0);

  google::protobuf::io::CodedInputStream input(
      reinterpret_cast<const google::protobuf::uint8*>(buffer_.data()),
      static_cast<int>(prefix_size));
  google::protobuf::uint64 value(0);
  if (!input.ReadVarint64(&value))
    return make_error_code(HolePunchErrors::protocol_error);
  length = value;
  return std::error_code();
}

std::error_code MessageReader::FillBuffer(size_t size) {
  std::array<char, kReadChunkSize> chunk;
  while (buffer_.size() < size) {
    std::error_code ec;
    size_t read(stream_.ReadSome(chunk.data(), chunk.size(), ec));
    if (ec)
      return ec;
    if (read == 0)
      return make_error_code(HolePunchErrors::protocol_error);
    buffer_.append(chunk.data(), read);
  }
  return std::error_code();
}

}  // namespace detail

}  // namespace holepunch

}  // namespace maidsafe
