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

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "quarry/file_group.h"
#include "quarry/file_system.h"
#include "quarry/status.h"

namespace quarry {

// JSON form of a file slice, shared by the spill file and tests.
Status SerializeFileSlices(const std::vector<FileSlice>& slices, std::string* out);
Status DeserializeFileSlices(const std::string& data, std::vector<FileSlice>* slices);

/**
 * @brief Partition to file-slice map bounded by an in-memory byte budget
 *
 * Entries are kept in memory until the estimated footprint would exceed the
 * budget; later entries are appended to a spill file under spill_directory and
 * located through an offset index. Overwriting a spilled entry appends a new
 * copy; the old bytes stay in the file until Clear().
 *
 * Not thread-safe.
 */
class SpillableFileSliceMap {
public:
    SpillableFileSliceMap(size_t max_in_memory_bytes, std::string spill_directory,
                          std::shared_ptr<FileSystem> fs = nullptr);
    ~SpillableFileSliceMap();

    SpillableFileSliceMap(const SpillableFileSliceMap&) = delete;
    SpillableFileSliceMap& operator=(const SpillableFileSliceMap&) = delete;

    Status Put(const std::string& key, const std::vector<FileSlice>& slices);
    Status Get(const std::string& key, std::vector<FileSlice>* slices) const;
    bool Contains(const std::string& key) const;

    std::vector<std::string> Keys() const;
    size_t Size() const { return in_memory_.size() + spilled_.size(); }
    size_t InMemoryCount() const { return in_memory_.size(); }
    size_t SpilledCount() const { return spilled_.size(); }
    size_t CurrentInMemoryBytes() const { return in_memory_bytes_; }

    const std::string& GetSpillFilePath() const { return spill_file_path_; }

    // Drops all entries and deletes the spill file.
    Status Clear();

    static size_t EstimateSize(const std::string& key, const std::vector<FileSlice>& slices);

private:
    struct SpillLocation {
        size_t offset = 0;
        size_t length = 0;
    };

    Status OpenSpillFile();
    Status Spill(const std::string& key, const std::vector<FileSlice>& slices);

    size_t max_in_memory_bytes_;
    std::string spill_directory_;
    std::shared_ptr<FileSystem> fs_;
    std::string spill_file_path_;

    std::map<std::string, std::vector<FileSlice>> in_memory_;
    std::map<std::string, size_t> in_memory_sizes_;
    size_t in_memory_bytes_ = 0;

    std::map<std::string, SpillLocation> spilled_;
    std::unique_ptr<FileHandle> spill_file_;
    size_t spill_file_size_ = 0;
};

} // namespace quarry
