/* Copyright (c) 2020 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_STORAGE_GFLAGS_H_
#define CLIENTS_STORAGE_GFLAGS_H_

#include "common/base/Base.h"

DECLARE_int32(scan_max_worker_threads);
DECLARE_int64(scan_default_limit);
DECLARE_int32(scan_parts_per_host);
DECLARE_bool(scan_enable_read_from_follower);
DECLARE_int32(storage_conn_max_per_host);

#endif  // CLIENTS_STORAGE_GFLAGS_H_
