/* Copyright (c) 2020 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef COMMON_DATATYPES_DATASET_H_
#define COMMON_DATATYPES_DATASET_H_

#include <iterator>

#include "common/datatypes/Value.h"

namespace graphscan {

struct Row {
  std::vector<Value> values;

  Row() = default;
  explicit Row(std::vector<Value> vals) : values(std::move(vals)) {}

  std::size_t size() const {
    return values.size();
  }

  const Value& operator[](std::size_t i) const {
    return values[i];
  }

  bool operator==(const Row& rhs) const {
    return values == rhs.values;
  }
};

// The raw payload a storage host returns for one scan request
struct DataSet {
  std::vector<std::string> colNames;
  std::vector<Row> rows;

  DataSet() = default;
  explicit DataSet(std::vector<std::string> columns) : colNames(std::move(columns)) {}

  const std::vector<std::string>& keys() const {
    return colNames;
  }

  const std::vector<Value>& rowValues(std::size_t index) const {
    return rows[index].values;
  }

  // Position of the column, or -1 if absent
  int64_t colIndex(folly::StringPiece colName) const;

  std::vector<Value> colValues(const std::string& colName) const;

  using iterator = std::vector<Row>::iterator;
  using const_iterator = std::vector<Row>::const_iterator;

  iterator begin() {
    return rows.begin();
  }

  const_iterator begin() const {
    return rows.begin();
  }

  iterator end() {
    return rows.end();
  }

  const_iterator end() const {
    return rows.end();
  }

  // Refuse rows whose width doesn't match the header
  bool emplace_back(Row row) {
    if (row.size() != colNames.size()) {
      return false;
    }
    rows.emplace_back(std::move(row));
    return true;
  }

  // append the DataSet to one with same header
  bool append(DataSet&& o);

  void clear() {
    colNames.clear();
    rows.clear();
  }

  std::size_t size() const {
    return rowSize();
  }

  std::size_t rowSize() const {
    return rows.size();
  }

  std::size_t colSize() const {
    return colNames.size();
  }

  std::string toString() const;

  bool operator==(const DataSet& rhs) const {
    return colNames == rhs.colNames && rows == rhs.rows;
  }
};

inline std::ostream& operator<<(std::ostream& os, const DataSet& d) {
  return os << d.toString();
}

}  // namespace graphscan
#endif  // COMMON_DATATYPES_DATASET_H_
