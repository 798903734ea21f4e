/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "clients/storage/scan/Rows.h"

namespace graphscan {
namespace storage {

namespace {

const Value& findProp(const Props& props, folly::StringPiece name) {
  for (const auto& prop : props) {
    if (name == folly::StringPiece(prop.first)) {
      return prop.second;
    }
  }
  return Value::kNullValue;
}

void printProps(std::stringstream& os, const Props& props) {
  os << "props: {";
  for (size_t i = 0; i < props.size(); ++i) {
    if (i != 0) {
      os << ", ";
    }
    os << props[i].first << ": " << props[i].second;
  }
  os << "}";
}

}  // namespace

const Value& EdgeRow::prop(folly::StringPiece name) const {
  return findProp(props, name);
}

std::string EdgeRow::toString() const {
  std::stringstream os;
  os << "Edge{src: " << srcId << ", dst: " << dstId << ", type: " << type << ", rank: " << rank
     << ", ";
  printProps(os, props);
  os << "}";
  return os.str();
}

const Value& VertexRow::prop(folly::StringPiece name) const {
  return findProp(props, name);
}

std::string VertexRow::toString() const {
  std::stringstream os;
  os << "Vertex{vid: " << vid << ", ";
  printProps(os, props);
  os << "}";
  return os.str();
}

}  // namespace storage
}  // namespace graphscan
