/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "common/base/ErrorCode.h"

namespace graphscan {

const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::SUCCEEDED:
      return "SUCCEEDED";
    case ErrorCode::E_DISCONNECTED:
      return "E_DISCONNECTED";
    case ErrorCode::E_FAIL_TO_CONNECT:
      return "E_FAIL_TO_CONNECT";
    case ErrorCode::E_RPC_FAILURE:
      return "E_RPC_FAILURE";
    case ErrorCode::E_LEADER_CHANGED:
      return "E_LEADER_CHANGED";
    case ErrorCode::E_SPACE_NOT_FOUND:
      return "E_SPACE_NOT_FOUND";
    case ErrorCode::E_TAG_NOT_FOUND:
      return "E_TAG_NOT_FOUND";
    case ErrorCode::E_EDGE_NOT_FOUND:
      return "E_EDGE_NOT_FOUND";
    case ErrorCode::E_PART_NOT_FOUND:
      return "E_PART_NOT_FOUND";
    case ErrorCode::E_INVALID_FILTER:
      return "E_INVALID_FILTER";
    case ErrorCode::E_INVALID_CURSOR:
      return "E_INVALID_CURSOR";
    case ErrorCode::E_CONSENSUS_ERROR:
      return "E_CONSENSUS_ERROR";
    case ErrorCode::E_STORAGE_MEMORY_EXCEEDED:
      return "E_STORAGE_MEMORY_EXCEEDED";
    case ErrorCode::E_UNKNOWN:
      return "E_UNKNOWN";
  }
  return "E_UNKNOWN";
}

}  // namespace graphscan
