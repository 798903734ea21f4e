/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_STORAGE_SCAN_ROWS_H_
#define CLIENTS_STORAGE_SCAN_ROWS_H_

#include "common/base/Base.h"
#include "common/base/Types.h"
#include "common/datatypes/Value.h"

namespace graphscan {
namespace storage {

// property name => value, in the order the columns were requested
using Props = std::vector<std::pair<std::string, Value>>;

struct EdgeRow {
  Value srcId;
  Value dstId;
  EdgeType type{0};
  EdgeRanking rank{0};
  Props props;

  // The value of property `name', kNullValue if absent
  const Value& prop(folly::StringPiece name) const;

  std::string toString() const;

  bool operator==(const EdgeRow& rhs) const {
    return srcId == rhs.srcId && dstId == rhs.dstId && type == rhs.type && rank == rhs.rank &&
           props == rhs.props;
  }
};

struct VertexRow {
  Value vid;
  Props props;

  const Value& prop(folly::StringPiece name) const;

  std::string toString() const;

  bool operator==(const VertexRow& rhs) const {
    return vid == rhs.vid && props == rhs.props;
  }
};

inline std::ostream& operator<<(std::ostream& os, const EdgeRow& row) {
  return os << row.toString();
}

inline std::ostream& operator<<(std::ostream& os, const VertexRow& row) {
  return os << row.toString();
}

}  // namespace storage
}  // namespace graphscan

#endif  // CLIENTS_STORAGE_SCAN_ROWS_H_
