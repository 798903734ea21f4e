/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef COMMON_BASE_ERRORCODE_H_
#define COMMON_BASE_ERRORCODE_H_

#include <cstdint>
#include <ostream>

namespace graphscan {

// Error codes reported by storage hosts, per partition
enum class ErrorCode : int32_t {
  SUCCEEDED = 0,

  E_DISCONNECTED = -1,
  E_FAIL_TO_CONNECT = -2,
  E_RPC_FAILURE = -3,
  E_LEADER_CHANGED = -4,

  E_SPACE_NOT_FOUND = -5,
  E_TAG_NOT_FOUND = -6,
  E_EDGE_NOT_FOUND = -7,
  E_PART_NOT_FOUND = -16,

  E_INVALID_FILTER = -301,
  E_INVALID_CURSOR = -302,
  E_CONSENSUS_ERROR = -311,
  E_STORAGE_MEMORY_EXCEEDED = -340,

  E_UNKNOWN = -8000,
};

const char* errorCodeName(ErrorCode code);

inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
  return os << errorCodeName(code) << "(" << static_cast<int32_t>(code) << ")";
}

}  // namespace graphscan

#endif  // COMMON_BASE_ERRORCODE_H_
