/* Copyright (c) 2020 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "clients/storage/GFlags.h"

DEFINE_int32(scan_max_worker_threads,
             16,
             "Upper bound of the worker threads a scan iterator creates for itself, "
             "one thread per host is used below this bound");
DEFINE_int64(scan_default_limit, 1000, "Rows fetched per partition in one scan round");
DEFINE_int32(scan_parts_per_host,
             1,
             "Partitions of the same host scanned concurrently within one round");
DEFINE_bool(scan_enable_read_from_follower,
            true,
            "Whether storage hosts may serve a scan from a follower replica");
DEFINE_int32(storage_conn_max_per_host, 10, "Max connections borrowed to one storage host");
