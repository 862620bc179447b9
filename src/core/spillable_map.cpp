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


#include "quarry/spillable_map.h"

#include <atomic>
#include <chrono>

#include <nlohmann/json.hpp>

#include "quarry/logging.h"

namespace quarry {

QUARRY_LOG_TAG(SpillableMap);

using json = nlohmann::json;

namespace {

json FileSliceToJson(const FileSlice& slice) {
    json j = {{"partitionPath", slice.GetPartitionPath()},
              {"fileId", slice.GetFileId()},
              {"baseInstant", slice.GetBaseInstantTime()}};
    if (slice.GetBaseFile()) {
        const BaseFile& base = *slice.GetBaseFile();
        j["baseFile"] = {{"path", base.path},
                         {"fileId", base.file_id},
                         {"commitTime", base.commit_time},
                         {"size", base.size}};
    } else {
        j["baseFile"] = nullptr;
    }
    json logs = json::array();
    for (const auto& log_file : slice.GetLogFiles()) {
        logs.push_back({{"path", log_file.path},
                        {"fileId", log_file.file_id},
                        {"baseInstant", log_file.base_instant},
                        {"version", log_file.version},
                        {"writeToken", log_file.write_token},
                        {"size", log_file.size}});
    }
    j["logFiles"] = logs;
    return j;
}

FileSlice FileSliceFromJson(const json& j) {
    FileSlice slice(FileGroupId{j.at("partitionPath").get<std::string>(),
                                j.at("fileId").get<std::string>()},
                    j.at("baseInstant").get<std::string>());
    if (j.contains("baseFile") && !j.at("baseFile").is_null()) {
        const json& b = j.at("baseFile");
        BaseFile base;
        base.path = b.value("path", "");
        base.file_id = b.value("fileId", "");
        base.commit_time = b.value("commitTime", "");
        base.size = b.value("size", int64_t{0});
        slice.SetBaseFile(base);
    }
    for (const auto& l : j.value("logFiles", json::array())) {
        LogFile log_file;
        log_file.path = l.value("path", "");
        log_file.file_id = l.value("fileId", "");
        log_file.base_instant = l.value("baseInstant", "");
        log_file.version = l.value("version", 1);
        log_file.write_token = l.value("writeToken", "");
        log_file.size = l.value("size", int64_t{0});
        slice.AddLogFile(log_file);
    }
    return slice;
}

std::string MakeSpillFileName() {
    static std::atomic<uint64_t> counter{0};
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return "quarry_file_slices_" + std::to_string(now) + "_" +
           std::to_string(counter.fetch_add(1)) + ".spill";
}

}  // namespace

Status SerializeFileSlices(const std::vector<FileSlice>& slices, std::string* out) {
    try {
        json arr = json::array();
        for (const auto& slice : slices) {
            arr.push_back(FileSliceToJson(slice));
        }
        *out = arr.dump();
        return Status::OK();
    } catch (const json::exception& e) {
        return Status::InternalError(std::string("Failed to serialize file slices: ") + e.what());
    }
}

Status DeserializeFileSlices(const std::string& data, std::vector<FileSlice>* slices) {
    try {
        json arr = json::parse(data);
        if (!arr.is_array()) {
            return Status::Corruption("Spilled file slices are not a JSON array");
        }
        slices->clear();
        for (const auto& entry : arr) {
            slices->push_back(FileSliceFromJson(entry));
        }
        return Status::OK();
    } catch (const json::exception& e) {
        return Status::Corruption(std::string("Malformed spilled file slices: ") + e.what());
    }
}

//==============================================================================
// SpillableFileSliceMap
//==============================================================================

SpillableFileSliceMap::SpillableFileSliceMap(size_t max_in_memory_bytes,
                                             std::string spill_directory,
                                             std::shared_ptr<FileSystem> fs)
    : max_in_memory_bytes_(max_in_memory_bytes),
      spill_directory_(std::move(spill_directory)),
      fs_(fs ? std::move(fs) : std::shared_ptr<FileSystem>(FileSystem::CreateLocal())) {}

SpillableFileSliceMap::~SpillableFileSliceMap() {
    auto status = Clear();
    if (!status.ok()) {
        QUARRY_LOG_WARN(SpillableMap) << "Failed to remove spill file " << spill_file_path_
                                      << ": " << status.ToString();
    }
}

size_t SpillableFileSliceMap::EstimateSize(const std::string& key,
                                           const std::vector<FileSlice>& slices) {
    size_t size = key.size() + sizeof(std::vector<FileSlice>);
    for (const auto& slice : slices) {
        size += sizeof(FileSlice) + slice.GetPartitionPath().size() + slice.GetFileId().size() +
                slice.GetBaseInstantTime().size();
        if (slice.GetBaseFile()) {
            const BaseFile& base = *slice.GetBaseFile();
            size += sizeof(BaseFile) + base.path.size() + base.file_id.size() +
                    base.commit_time.size();
        }
        for (const auto& log_file : slice.GetLogFiles()) {
            size += sizeof(LogFile) + log_file.path.size() + log_file.file_id.size() +
                    log_file.base_instant.size() + log_file.write_token.size();
        }
    }
    return size;
}

Status SpillableFileSliceMap::OpenSpillFile() {
    if (spill_file_) return Status::OK();

    auto status = fs_->CreateDirectory(spill_directory_);
    if (!status.ok() && !status.IsAlreadyExists()) return status;

    spill_file_path_ = ConstructAbsolutePath(spill_directory_, MakeSpillFileName());
    status = fs_->OpenFile(spill_file_path_,
                           FileOpenFlags::kRead | FileOpenFlags::kWrite |
                               FileOpenFlags::kCreate | FileOpenFlags::kTruncate,
                           &spill_file_);
    if (!status.ok()) return status;
    spill_file_size_ = 0;
    QUARRY_LOG_INFO(SpillableMap) << "Spilling file slices to " << spill_file_path_;
    return Status::OK();
}

Status SpillableFileSliceMap::Spill(const std::string& key, const std::vector<FileSlice>& slices) {
    auto status = OpenSpillFile();
    if (!status.ok()) return status;

    std::string data;
    status = SerializeFileSlices(slices, &data);
    if (!status.ok()) return status;

    status = spill_file_->Seek(spill_file_size_);
    if (!status.ok()) return status;
    size_t written = 0;
    status = spill_file_->Write(data.data(), data.size(), &written);
    if (!status.ok()) return status;
    if (written != data.size()) {
        return Status::IOError("Incomplete spill write to " + spill_file_path_);
    }
    status = spill_file_->Sync();
    if (!status.ok()) return status;

    spilled_[key] = SpillLocation{spill_file_size_, data.size()};
    spill_file_size_ += data.size();
    return Status::OK();
}

Status SpillableFileSliceMap::Put(const std::string& key, const std::vector<FileSlice>& slices) {
    auto sized = in_memory_sizes_.find(key);
    if (sized != in_memory_sizes_.end()) {
        in_memory_bytes_ -= sized->second;
        in_memory_sizes_.erase(sized);
        in_memory_.erase(key);
    }

    size_t size = EstimateSize(key, slices);
    if (in_memory_bytes_ + size <= max_in_memory_bytes_) {
        spilled_.erase(key);
        in_memory_[key] = slices;
        in_memory_sizes_[key] = size;
        in_memory_bytes_ += size;
        return Status::OK();
    }
    return Spill(key, slices);
}

Status SpillableFileSliceMap::Get(const std::string& key, std::vector<FileSlice>* slices) const {
    auto it = in_memory_.find(key);
    if (it != in_memory_.end()) {
        *slices = it->second;
        return Status::OK();
    }

    auto spilled = spilled_.find(key);
    if (spilled == spilled_.end()) {
        return Status::NotFound("No file slices cached for partition: " + key);
    }

    std::string data(spilled->second.length, '\0');
    auto status = spill_file_->ReadAt(spilled->second.offset, &data[0], data.size());
    if (!status.ok()) return status;
    return DeserializeFileSlices(data, slices);
}

bool SpillableFileSliceMap::Contains(const std::string& key) const {
    return in_memory_.count(key) > 0 || spilled_.count(key) > 0;
}

std::vector<std::string> SpillableFileSliceMap::Keys() const {
    std::vector<std::string> keys;
    for (const auto& entry : in_memory_) keys.push_back(entry.first);
    for (const auto& entry : spilled_) keys.push_back(entry.first);
    return keys;
}

Status SpillableFileSliceMap::Clear() {
    in_memory_.clear();
    in_memory_sizes_.clear();
    in_memory_bytes_ = 0;
    spilled_.clear();

    if (!spill_file_) return Status::OK();

    auto status = spill_file_->Close();
    spill_file_.reset();
    spill_file_size_ = 0;
    if (!status.ok()) return status;
    return fs_->RemoveFile(spill_file_path_);
}

} // namespace quarry
