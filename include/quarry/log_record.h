/************************************************************************
Copyright 2024 Quarry Contributors

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    https://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
**************************************************************************/

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <arrow/api.h>

namespace quarry {

// Column names every data block and base file carries.
constexpr const char* kRecordKeyField = "_record_key";
constexpr const char* kPartitionPathField = "_partition_path";

/**
 * @brief Tombstone for one record key
 */
struct DeleteRecord {
    std::string record_key;
    std::string partition_path;
    int64_t ordering_value = 0;

    bool operator==(const DeleteRecord& other) const {
        return record_key == other.record_key && partition_path == other.partition_path &&
               ordering_value == other.ordering_value;
    }
};

/**
 * @brief One logical record version read from a data or delete block
 *
 * Data records reference a row of the (projected) block batch rather than
 * copying it. Deletes carry no batch.
 */
struct LogRecord {
    std::string record_key;
    std::string partition_path;
    int64_t ordering_value = 0;
    std::string instant_time;
    bool is_delete = false;

    std::shared_ptr<arrow::RecordBatch> batch;
    int64_t row = 0;

    static LogRecord FromDelete(const DeleteRecord& del, const std::string& instant_time) {
        LogRecord record;
        record.record_key = del.record_key;
        record.partition_path = del.partition_path;
        record.ordering_value = del.ordering_value;
        record.instant_time = instant_time;
        record.is_delete = true;
        return record;
    }

    DeleteRecord ToDeleteRecord() const {
        return DeleteRecord{record_key, partition_path, ordering_value};
    }
};

} // namespace quarry
