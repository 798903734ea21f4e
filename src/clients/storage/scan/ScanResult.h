/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_STORAGE_SCAN_SCANRESULT_H_
#define CLIENTS_STORAGE_SCAN_SCANRESULT_H_

#include "clients/storage/scan/RecordProcessor.h"
#include "common/base/Base.h"
#include "common/base/StatusOr.h"
#include "common/datatypes/DataSet.h"

namespace graphscan {
namespace storage {

enum class ScanStatus {
  // every host of the round answered
  ALL_SUCCESS = 0,
  // some hosts failed, their partitions contribute nothing to the round
  PART_SUCCESS = 1,
};

std::ostream& operator<<(std::ostream& os, ScanStatus status);

/**
 * What one scan round brought back.
 *
 * The payloads stay raw, they are only decoded on request through the
 * processor of the scanned label. Payloads come one per answering host,
 * their order carries no meaning.
 */
template <typename RowType>
class ScanResult final {
 public:
  ScanResult(std::vector<DataSet> payloads,
             std::vector<std::string> columns,
             ScanStatus status,
             std::string label,
             std::shared_ptr<const RecordProcessor<RowType>> processor)
      : payloads_(std::move(payloads)),
        columns_(std::move(columns)),
        status_(status),
        label_(std::move(label)),
        processor_(std::move(processor)) {}

  const std::vector<DataSet>& payloads() const {
    return payloads_;
  }

  // Property names asked for by the scan
  const std::vector<std::string>& propNames() const {
    return columns_;
  }

  ScanStatus status() const {
    return status_;
  }

  bool isAllSuccess() const {
    return status_ == ScanStatus::ALL_SUCCESS;
  }

  const std::string& label() const {
    return label_;
  }

  bool isEmpty() const {
    for (const auto& ds : payloads_) {
      if (ds.rowSize() > 0) {
        return false;
      }
    }
    return true;
  }

  size_t rowSize() const {
    size_t total = 0;
    for (const auto& ds : payloads_) {
      total += ds.rowSize();
    }
    return total;
  }

  // Decode all payloads into typed rows
  StatusOr<std::vector<RowType>> rows() const {
    std::vector<RowType> all;
    all.reserve(rowSize());
    for (const auto& ds : payloads_) {
      auto decoded = processor_->decode(ds);
      if (!decoded.ok()) {
        return decoded.status();
      }
      auto& part = decoded.value();
      all.insert(all.end(),
                 std::make_move_iterator(part.begin()),
                 std::make_move_iterator(part.end()));
    }
    return all;
  }

  // The rows as they came, values in column order
  std::vector<Row> tableRows() const {
    std::vector<Row> all;
    all.reserve(rowSize());
    for (const auto& ds : payloads_) {
      all.insert(all.end(), ds.rows.begin(), ds.rows.end());
    }
    return all;
  }

 private:
  std::vector<DataSet> payloads_;
  std::vector<std::string> columns_;
  ScanStatus status_;
  std::string label_;
  std::shared_ptr<const RecordProcessor<RowType>> processor_;
};

using ScanEdgeResult = ScanResult<EdgeRow>;
using ScanVertexResult = ScanResult<VertexRow>;

}  // namespace storage
}  // namespace graphscan

#endif  // CLIENTS_STORAGE_SCAN_SCANRESULT_H_
