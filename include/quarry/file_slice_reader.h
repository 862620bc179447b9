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

#include <map>
#include <memory>
#include <string>

#include <arrow/api.h>

#include "quarry/file_group.h"
#include "quarry/file_system.h"
#include "quarry/log_record_scanner.h"
#include "quarry/record_merger.h"
#include "quarry/status.h"
#include "quarry/timeline.h"

namespace quarry {

struct FileSliceReaderOptions {
    // Output schema. Base rows and log records are projected to it.
    std::shared_ptr<arrow::Schema> reader_schema;

    std::shared_ptr<RecordMerger> merger;
    MergeProps merge_props;
    std::string ordering_field;

    // Log blocks above this instant are ignored; empty means no ceiling.
    std::string latest_instant_time;
    Timeline completed_instants;
    ScanVariant variant = ScanVariant::kTwoPass;
};

/**
 * @brief Materializes the current rows of one file slice
 *
 * Rows of the base file are keyed by record key and overlaid with the merged
 * log records of the slice; deletes drop their keys. Rows come out ordered by
 * record key.
 */
class FileSliceReader {
public:
    FileSliceReader(std::shared_ptr<FileSystem> fs, FileSliceReaderOptions options);

    Status Read(const FileSlice& slice, std::shared_ptr<arrow::Table>* table);

    // Scan result of the log files of the last Read.
    const ScanResult& GetLastScanResult() const { return last_scan_; }

private:
    Status LoadBaseFile(const FileSlice& slice, std::map<std::string, LogRecord>* records);

    std::shared_ptr<FileSystem> fs_;
    FileSliceReaderOptions options_;
    ScanResult last_scan_;
};

} // namespace quarry
