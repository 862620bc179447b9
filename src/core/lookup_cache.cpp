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


#include "quarry/lookup_cache.h"

#include <thread>

#include "quarry/logging.h"

namespace quarry {

QUARRY_LOG_TAG(LookupCache);

//==============================================================================
// FileSliceLookupReader
//==============================================================================

FileSliceLookupReader::FileSliceLookupReader(std::shared_ptr<TableMetaClient> meta_client,
                                             FileIndexOptions index_options,
                                             FileSliceReaderOptions reader_options)
    : meta_client_(std::move(meta_client)), index_options_(std::move(index_options)),
      reader_options_(std::move(reader_options)) {}

Status FileSliceLookupReader::Open() {
    pending_slices_.clear();
    pending_batches_.clear();

    std::unique_ptr<TableFileIndex> index;
    auto status = TableFileIndex::Create(meta_client_, nullptr, index_options_, &index);
    if (!status.ok()) return status;

    std::map<PartitionPath, std::vector<FileSlice>> slices;
    status = index->GetAllInputFileSlices(&slices);
    if (!status.ok()) return status;
    for (auto& entry : slices) {
        for (auto& slice : entry.second) {
            pending_slices_.push_back(std::move(slice));
        }
    }

    Timeline timeline;
    status = meta_client_->ReloadActiveTimeline(&timeline);
    if (!status.ok()) return status;

    FileSliceReaderOptions options = reader_options_;
    options.completed_instants =
        timeline.GetCommitsAndCompactionTimeline().FilterCompletedInstants();
    slice_reader_.reset(new FileSliceReader(meta_client_->GetFileSystem(), std::move(options)));
    index->Close();
    return Status::OK();
}

Status FileSliceLookupReader::ReadNextSlice() {
    FileSlice slice = std::move(pending_slices_.front());
    pending_slices_.pop_front();

    std::shared_ptr<arrow::Table> table;
    auto status = slice_reader_->Read(slice, &table);
    if (!status.ok()) return status;

    arrow::TableBatchReader batches(*table);
    while (true) {
        std::shared_ptr<arrow::RecordBatch> batch;
        auto read_status = batches.ReadNext(&batch);
        if (!read_status.ok()) {
            return Status::InternalError("Failed to iterate slice " + slice.ToString() + ": " +
                                         read_status.ToString());
        }
        if (!batch) break;
        pending_batches_.push_back(std::move(batch));
    }
    return Status::OK();
}

Status FileSliceLookupReader::Read(std::shared_ptr<arrow::RecordBatch>* batch) {
    if (!slice_reader_) {
        return Status::InvalidArgument("Lookup reader is not open");
    }
    while (pending_batches_.empty() && !pending_slices_.empty()) {
        auto status = ReadNextSlice();
        if (!status.ok()) return status;
    }
    if (pending_batches_.empty()) {
        batch->reset();
        return Status::OK();
    }
    *batch = std::move(pending_batches_.front());
    pending_batches_.pop_front();
    return Status::OK();
}

Status FileSliceLookupReader::Close() {
    slice_reader_.reset();
    pending_slices_.clear();
    pending_batches_.clear();
    return Status::OK();
}

//==============================================================================
// LookupCache
//==============================================================================

LookupCache::LookupCache(std::shared_ptr<TimelineProvider> provider,
                         std::shared_ptr<LookupTableReader> reader, LookupCacheOptions options)
    : provider_(std::move(provider)), reader_(std::move(reader)), options_(std::move(options)),
      clock_([] { return std::chrono::steady_clock::now(); }),
      sleeper_([](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); }) {}

Status LookupCache::ExtractKey(const std::shared_ptr<arrow::RecordBatch>& batch, int64_t row,
                               LookupKey* key) const {
    key->clear();
    for (const auto& name : options_.key_columns) {
        auto column = batch->GetColumnByName(name);
        if (!column) {
            return Status::InvalidArgument("Lookup key column " + name + " not found");
        }
        auto scalar = column->GetScalar(row);
        if (!scalar.ok()) {
            return Status::InternalError("Failed to read lookup key " + name + ": " +
                                         scalar.status().ToString());
        }
        key->push_back(scalar.ValueOrDie()->ToString());
    }
    return Status::OK();
}

Status LookupCache::LoadOnce() {
    cache_.clear();
    num_rows_ = 0;

    auto status = reader_->Open();
    if (!status.ok()) return status;

    while (true) {
        std::shared_ptr<arrow::RecordBatch> batch;
        status = reader_->Read(&batch);
        if (!status.ok()) break;
        if (!batch) break;

        for (int64_t row = 0; row < batch->num_rows(); ++row) {
            LookupKey key;
            status = ExtractKey(batch, row, &key);
            if (!status.ok()) break;
            cache_[key].push_back(batch->Slice(row, 1));
            ++num_rows_;
        }
        if (!status.ok()) break;
    }

    auto close_status = reader_->Close();
    if (!status.ok()) return status;
    return close_status;
}

Status LookupCache::CheckCacheReload() {
    auto now = clock_();
    if (next_load_time_ && *next_load_time_ > now) {
        return Status::OK();
    }
    if (next_load_time_) {
        QUARRY_LOG_INFO(LookupCache) << "Lookup cache has expired after "
                                     << options_.reload_interval.count() << " ms, reloading";
    } else {
        QUARRY_LOG_INFO(LookupCache) << "Populating lookup cache";
    }

    Timeline timeline;
    auto status = provider_->ReloadActiveTimeline(&timeline);
    if (!status.ok()) return status;
    auto latest_commit = timeline.GetCommitsTimeline().FilterCompletedInstants().LastInstant();
    if (!latest_commit) {
        QUARRY_LOG_INFO(LookupCache) << "No commit instant found currently";
        return Status::OK();
    }
    if (current_commit_ && *current_commit_ == *latest_commit) {
        QUARRY_LOG_INFO(LookupCache) << "Ignore loading data because the commit instant "
                                     << current_commit_->ToString() << " has not changed";
        return Status::OK();
    }

    int retry = 0;
    while (true) {
        status = LoadOnce();
        if (status.ok()) {
            ++load_count_;
            current_commit_ = latest_commit;
            next_load_time_ = clock_() + options_.reload_interval;
            QUARRY_LOG_INFO(LookupCache) << "Loaded " << num_rows_
                                         << " row(s) into lookup cache at commit "
                                         << latest_commit->ToString();
            return Status::OK();
        }
        cache_.clear();
        num_rows_ = 0;
        if (retry >= options_.max_retries) {
            return Status(status.code(), "Failed to load table into cache after " +
                                             std::to_string(retry) + " retries: " +
                                             status.message());
        }
        ++retry;
        auto to_sleep = options_.retry_interval * retry;
        QUARRY_LOG_WARN(LookupCache) << "Failed to load table into cache, will retry in "
                                     << to_sleep.count() << " ms: " << status.ToString();
        sleeper_(to_sleep);
    }
}

Status LookupCache::Lookup(const LookupKey& key,
                           std::vector<std::shared_ptr<arrow::RecordBatch>>* rows) {
    auto status = CheckCacheReload();
    if (!status.ok()) return status;

    rows->clear();
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        *rows = it->second;
    }
    return Status::OK();
}

} // namespace quarry
