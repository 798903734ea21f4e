/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_STORAGE_STORAGECONNPOOL_H_
#define CLIENTS_STORAGE_STORAGECONNPOOL_H_

#include "clients/storage/StorageConnection.h"
#include "common/base/Base.h"
#include "common/base/StatusOr.h"

namespace graphscan {
namespace storage {

/**
 * A keyed pool of storage connections.
 *
 * Connections are opened through the factory on demand, kept idle per
 * host after release and handed out again while they are still open.
 * At most `maxConnsPerHost' connections may be borrowed from one host at
 * a time. The class is thread safe.
 */
class StorageConnPool final : public ConnectionProvider {
 public:
  using ConnectionFactory =
      std::function<StatusOr<std::shared_ptr<StorageConnection>>(const HostAddr&)>;

  explicit StorageConnPool(ConnectionFactory factory);
  StorageConnPool(ConnectionFactory factory, int32_t maxConnsPerHost);

  ~StorageConnPool() override;

  StatusOr<std::shared_ptr<StorageConnection>> getConnection(const HostAddr& host) override;

  void release(const HostAddr& host, std::shared_ptr<StorageConnection> conn) override;

  // Drop every idle connection, borrowed ones are dropped on release
  void close();

  int32_t numActive(const HostAddr& host) const;

  int32_t numIdle(const HostAddr& host) const;

 private:
  struct HostSlot {
    std::vector<std::shared_ptr<StorageConnection>> idle;
    int32_t active{0};
  };

  ConnectionFactory factory_;
  const int32_t maxConnsPerHost_;

  mutable std::mutex lock_;
  std::unordered_map<HostAddr, HostSlot> slots_;
  bool closed_{false};
};

}  // namespace storage
}  // namespace graphscan

#endif  // CLIENTS_STORAGE_STORAGECONNPOOL_H_
