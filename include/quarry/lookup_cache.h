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

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "quarry/file_group.h"
#include "quarry/file_slice_reader.h"
#include "quarry/status.h"
#include "quarry/table_file_index.h"
#include "quarry/table_meta_client.h"
#include "quarry/timeline.h"

namespace quarry {

/**
 * @brief Source of every row of a table, read batch by batch
 */
class LookupTableReader {
public:
    virtual ~LookupTableReader() = default;

    virtual Status Open() = 0;
    // Sets *batch to null once the table is exhausted.
    virtual Status Read(std::shared_ptr<arrow::RecordBatch>* batch) = 0;
    virtual Status Close() = 0;
};

/**
 * @brief Reads the latest merged file slices of a table
 *
 * Each Open() builds a fresh file index, so it sees the timeline as of that
 * call.
 */
class FileSliceLookupReader : public LookupTableReader {
public:
    FileSliceLookupReader(std::shared_ptr<TableMetaClient> meta_client,
                          FileIndexOptions index_options,
                          FileSliceReaderOptions reader_options);

    Status Open() override;
    Status Read(std::shared_ptr<arrow::RecordBatch>* batch) override;
    Status Close() override;

private:
    Status ReadNextSlice();

    std::shared_ptr<TableMetaClient> meta_client_;
    FileIndexOptions index_options_;
    FileSliceReaderOptions reader_options_;

    std::unique_ptr<FileSliceReader> slice_reader_;
    std::deque<FileSlice> pending_slices_;
    std::deque<std::shared_ptr<arrow::RecordBatch>> pending_batches_;
};

struct LookupCacheOptions {
    // Columns whose values form the lookup key.
    std::vector<std::string> key_columns;
    std::chrono::milliseconds reload_interval{std::chrono::minutes(60)};
    std::chrono::milliseconds retry_interval{std::chrono::seconds(10)};
    int max_retries = 3;
};

using LookupKey = std::vector<std::string>;

/**
 * @brief In-memory dimension table keyed by lookup columns
 *
 * The cache is (re)populated on a lookup once the reload interval has passed
 * and only when the table's latest commit differs from the one last loaded.
 * A failed load is retried up to max_retries times, sleeping
 * retry * retry_interval before each retry.
 *
 * Not thread-safe.
 */
class LookupCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    LookupCache(std::shared_ptr<TimelineProvider> provider,
                std::shared_ptr<LookupTableReader> reader, LookupCacheOptions options);

    void SetClock(Clock clock) { clock_ = std::move(clock); }
    void SetSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    // One-row batches whose key columns equal key, reloading first if due.
    Status Lookup(const LookupKey& key, std::vector<std::shared_ptr<arrow::RecordBatch>>* rows);

    Status CheckCacheReload();

    const std::optional<Instant>& GetCurrentCommit() const { return current_commit_; }
    size_t NumKeys() const { return cache_.size(); }
    int64_t NumRows() const { return num_rows_; }
    int64_t GetLoadCount() const { return load_count_; }

private:
    Status LoadOnce();
    Status ExtractKey(const std::shared_ptr<arrow::RecordBatch>& batch, int64_t row,
                      LookupKey* key) const;

    std::shared_ptr<TimelineProvider> provider_;
    std::shared_ptr<LookupTableReader> reader_;
    LookupCacheOptions options_;
    Clock clock_;
    Sleeper sleeper_;

    std::map<LookupKey, std::vector<std::shared_ptr<arrow::RecordBatch>>> cache_;
    std::optional<std::chrono::steady_clock::time_point> next_load_time_;
    std::optional<Instant> current_commit_;
    int64_t num_rows_ = 0;
    int64_t load_count_ = 0;
};

} // namespace quarry
