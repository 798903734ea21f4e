/* Copyright (c) 2020 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "common/datatypes/DataSet.h"

namespace graphscan {

int64_t DataSet::colIndex(folly::StringPiece colName) const {
  for (std::size_t i = 0; i < colNames.size(); ++i) {
    if (colName == folly::StringPiece(colNames[i])) {
      return static_cast<int64_t>(i);
    }
  }
  return -1;
}

std::vector<Value> DataSet::colValues(const std::string& colName) const {
  std::vector<Value> col;
  auto index = colIndex(colName);
  if (index < 0) {
    return col;
  }
  col.reserve(rows.size());
  for (const auto& row : rows) {
    col.emplace_back(row.values[index]);
  }
  return col;
}

bool DataSet::append(DataSet&& o) {
  if (colNames.empty()) {
    colNames = std::move(o.colNames);
  } else if (colNames != o.colNames) {
    return false;
  }
  rows.reserve(rowSize() + o.rowSize());
  rows.insert(
      rows.end(), std::make_move_iterator(o.rows.begin()), std::make_move_iterator(o.rows.end()));
  return true;
}

std::string DataSet::toString() const {
  std::stringstream os;
  // header
  for (const auto& h : colNames) {
    os << h << "|";
  }
  os << std::endl;

  // body
  for (const auto& row : rows) {
    for (const auto& col : row.values) {
      os << col << "|";
    }
    os << std::endl;
  }
  return os.str();
}

}  // namespace graphscan
