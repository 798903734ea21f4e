/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "common/base/Status.h"

namespace graphscan {

Status::Status(Code code, folly::StringPiece msg) {
  // The header keeps the length in 16 bits
  const uint16_t size = std::min<size_t>(msg.size(), std::numeric_limits<uint16_t>::max());
  auto state = std::unique_ptr<char[]>(new char[size + kHeaderSize]);
  auto *header = reinterpret_cast<Header *>(state.get());
  header->size_ = size;
  header->code_ = code;
  ::memcpy(&state[kHeaderSize], msg.data(), size);
  state_ = std::move(state);
}

std::string Status::message() const {
  if (state_ == nullptr) {
    return "";
  }
  return std::string(&state_[kHeaderSize], size());
}

std::string Status::toString() const {
  Code code = this->code();
  if (code == kOk) {
    return "OK";
  }
  std::string result(toString(code));
  result.append(&state_[kHeaderSize], size());
  return result;
}

std::unique_ptr<const char[]> Status::copyState(const char *state) {
  const auto size = *reinterpret_cast<const uint16_t *>(state);
  const auto total = size + kHeaderSize;
  auto result = std::unique_ptr<char[]>(new char[total]);
  ::memcpy(&result[0], state, total);
  return result;
}

std::string Status::format(const char *fmt, va_list args) {
  return folly::stringVPrintf(fmt, args);
}

// static
const char *Status::toString(Code code) {
  switch (code) {
    case kOk:
      return "OK";
    case kError:
      return "";
    case kInvalidArgument:
      return "InvalidArgument: ";
    case kNotSupported:
      return "NotSupported: ";
    case kSpaceNotFound:
      return "SpaceNotFound: ";
    case kHostNotFound:
      return "HostNotFound: ";
    case kTagNotFound:
      return "TagNotFound: ";
    case kEdgeNotFound:
      return "EdgeNotFound: ";
    case kPartNotFound:
      return "PartNotFound: ";
    case kLeaderChanged:
      return "LeaderChanged: ";
    case kNoConnection:
      return "NoConnection: ";
    case kRpcFailure:
      return "RpcFailure: ";
    case kPartFailed:
      return "PartFailed: ";
    case kScanFailed:
      return "ScanFailed: ";
    case kIteratorExhausted:
      return "IteratorExhausted: ";
    case kInterrupted:
      return "Interrupted: ";
  }
  DLOG(FATAL) << "Invalid status code: " << static_cast<uint16_t>(code);
  return "";
}

}  // namespace graphscan
