/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_STORAGE_SCAN_RECORDPROCESSOR_H_
#define CLIENTS_STORAGE_SCAN_RECORDPROCESSOR_H_

#include "clients/storage/scan/Rows.h"
#include "common/base/Base.h"
#include "common/base/StatusOr.h"
#include "common/datatypes/DataSet.h"

namespace graphscan {
namespace storage {

/**
 * Turns the raw dataset of one scan response into typed rows.
 *
 * Columns come back either bare ("_src", "name") or qualified by the
 * label ("like._src", "like.name"), the label prefix is dropped from
 * the property names.
 */
template <typename RowType>
class RecordProcessor {
 public:
  virtual ~RecordProcessor() = default;

  virtual StatusOr<std::vector<RowType>> decode(const DataSet& data) const = 0;

  const std::string& label() const {
    return label_;
  }

 protected:
  explicit RecordProcessor(std::string label) : label_(std::move(label)) {}

  // "label.prop" => "prop"
  std::string propName(const std::string& colName) const {
    if (colName.size() > label_.size() + 1 && colName[label_.size()] == '.' &&
        colName.compare(0, label_.size(), label_) == 0) {
      return colName.substr(label_.size() + 1);
    }
    return colName;
  }

  // Column index of the reserved property, -1 if absent
  int64_t keyIndex(const DataSet& data, folly::StringPiece key) const {
    for (size_t i = 0; i < data.colNames.size(); ++i) {
      if (key == folly::StringPiece(propName(data.colNames[i]))) {
        return static_cast<int64_t>(i);
      }
    }
    return -1;
  }

 private:
  std::string label_;
};

class EdgeProcessor final : public RecordProcessor<EdgeRow> {
 public:
  explicit EdgeProcessor(std::string edgeName) : RecordProcessor(std::move(edgeName)) {}

  StatusOr<std::vector<EdgeRow>> decode(const DataSet& data) const override;
};

class VertexProcessor final : public RecordProcessor<VertexRow> {
 public:
  explicit VertexProcessor(std::string tagName) : RecordProcessor(std::move(tagName)) {}

  StatusOr<std::vector<VertexRow>> decode(const DataSet& data) const override;
};

}  // namespace storage
}  // namespace graphscan

#endif  // CLIENTS_STORAGE_SCAN_RECORDPROCESSOR_H_
