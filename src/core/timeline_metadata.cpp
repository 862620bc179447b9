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

#include "quarry/timeline_metadata.h"

#include <nlohmann/json.hpp>

namespace quarry {

using json = nlohmann::json;

namespace {

json WriteStatsToJson(const std::map<std::string, std::vector<WriteStat>>& stats) {
    json j = json::object();
    for (const auto& [partition, list] : stats) {
        json arr = json::array();
        for (const auto& stat : list) {
            arr.push_back({{"fileId", stat.file_id},
                           {"path", stat.path},
                           {"prevCommit", stat.prev_commit},
                           {"numWrites", stat.num_writes},
                           {"numDeletes", stat.num_deletes},
                           {"fileSizeInBytes", stat.file_size_in_bytes}});
        }
        j[partition] = arr;
    }
    return j;
}

std::map<std::string, std::vector<WriteStat>> WriteStatsFromJson(const json& j) {
    std::map<std::string, std::vector<WriteStat>> stats;
    for (auto it = j.begin(); it != j.end(); ++it) {
        auto& list = stats[it.key()];
        for (const auto& entry : it.value()) {
            WriteStat stat;
            stat.file_id = entry.value("fileId", "");
            stat.path = entry.value("path", "");
            stat.prev_commit = entry.value("prevCommit", "");
            stat.num_writes = entry.value("numWrites", int64_t{0});
            stat.num_deletes = entry.value("numDeletes", int64_t{0});
            stat.file_size_in_bytes = entry.value("fileSizeInBytes", int64_t{0});
            list.push_back(std::move(stat));
        }
    }
    return stats;
}

json RollbackToJson(const RollbackMetadata& metadata) {
    json partitions = json::object();
    for (const auto& [partition, stat] : metadata.partition_metadata) {
        partitions[partition] = {{"partitionPath", stat.partition_path},
                                 {"successDeleteFiles", stat.success_delete_files},
                                 {"failedDeleteFiles", stat.failed_delete_files}};
    }
    return {{"commitsRollback", metadata.commits_rollback},
            {"partitionMetadata", partitions}};
}

RollbackMetadata RollbackFromJson(const json& j) {
    RollbackMetadata metadata;
    metadata.commits_rollback =
        j.value("commitsRollback", std::vector<std::string>{});
    if (j.contains("partitionMetadata")) {
        const auto& partitions = j.at("partitionMetadata");
        for (auto it = partitions.begin(); it != partitions.end(); ++it) {
            PartitionRollbackStat stat;
            stat.partition_path = it.value().value("partitionPath", it.key());
            stat.success_delete_files =
                it.value().value("successDeleteFiles", std::vector<std::string>{});
            stat.failed_delete_files =
                it.value().value("failedDeleteFiles", std::vector<std::string>{});
            metadata.partition_metadata[it.key()] = std::move(stat);
        }
    }
    return metadata;
}

// Parse text and run fn over the document, mapping exceptions to Corruption.
template <typename Fn>
Status ParseDocument(const std::string& text, const char* what, Fn fn) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return Status::Corruption(std::string(what) + " is not a JSON object");
        }
        fn(j);
        return Status::OK();
    } catch (const json::exception& e) {
        return Status::Corruption(std::string("Malformed ") + what + ": " + e.what());
    }
}

}  // namespace

//==============================================================================
// Commit metadata
//==============================================================================

std::vector<std::string> CommitMetadata::GetWrittenPartitions() const {
    std::vector<std::string> partitions;
    for (const auto& entry : partition_to_write_stats) {
        partitions.push_back(entry.first);
    }
    return partitions;
}

Status CommitMetadata::ToJson(std::string* out) const {
    json j;
    j["partitionToWriteStats"] = WriteStatsToJson(partition_to_write_stats);
    j["operationType"] = operation_type;
    j["extraMetadata"] = extra_metadata;
    *out = j.dump();
    return Status::OK();
}

Status CommitMetadata::FromJson(const std::string& text, CommitMetadata* metadata) {
    CommitMetadata result;
    auto status = ParseDocument(text, "commit metadata", [&result](const json& j) {
        if (j.contains("partitionToWriteStats")) {
            result.partition_to_write_stats = WriteStatsFromJson(j.at("partitionToWriteStats"));
        }
        result.operation_type = j.value("operationType", "");
        result.extra_metadata =
            j.value("extraMetadata", std::map<std::string, std::string>{});
    });
    if (!status.ok()) return status;
    *metadata = std::move(result);
    return Status::OK();
}

Status ReplaceCommitMetadata::ToJson(std::string* out) const {
    json j;
    j["partitionToWriteStats"] = WriteStatsToJson(partition_to_write_stats);
    j["operationType"] = operation_type;
    j["extraMetadata"] = extra_metadata;
    j["partitionToReplaceFileIds"] = partition_to_replace_file_ids;
    *out = j.dump();
    return Status::OK();
}

Status ReplaceCommitMetadata::FromJson(const std::string& text, ReplaceCommitMetadata* metadata) {
    ReplaceCommitMetadata result;
    auto status = CommitMetadata::FromJson(text, &result);
    if (!status.ok()) return status;

    status = ParseDocument(text, "replace commit metadata", [&result](const json& j) {
        result.partition_to_replace_file_ids = j.value(
            "partitionToReplaceFileIds", std::map<std::string, std::vector<std::string>>{});
    });
    if (!status.ok()) return status;
    *metadata = std::move(result);
    return Status::OK();
}

//==============================================================================
// Clean / rollback / restore metadata
//==============================================================================

Status CleanMetadata::ToJson(std::string* out) const {
    json partitions = json::object();
    for (const auto& [partition, stat] : partition_metadata) {
        partitions[partition] = {{"partitionPath", stat.partition_path},
                                 {"successDeleteFiles", stat.success_delete_files},
                                 {"failedDeleteFiles", stat.failed_delete_files}};
    }
    json j = {{"earliestCommitToRetain", earliest_commit_to_retain},
              {"partitionMetadata", partitions}};
    *out = j.dump();
    return Status::OK();
}

Status CleanMetadata::FromJson(const std::string& text, CleanMetadata* metadata) {
    CleanMetadata result;
    auto status = ParseDocument(text, "clean metadata", [&result](const json& j) {
        result.earliest_commit_to_retain = j.value("earliestCommitToRetain", "");
        if (!j.contains("partitionMetadata")) return;
        const auto& partitions = j.at("partitionMetadata");
        for (auto it = partitions.begin(); it != partitions.end(); ++it) {
            PartitionCleanStat stat;
            stat.partition_path = it.value().value("partitionPath", it.key());
            stat.success_delete_files =
                it.value().value("successDeleteFiles", std::vector<std::string>{});
            stat.failed_delete_files =
                it.value().value("failedDeleteFiles", std::vector<std::string>{});
            result.partition_metadata[it.key()] = std::move(stat);
        }
    });
    if (!status.ok()) return status;
    *metadata = std::move(result);
    return Status::OK();
}

Status RollbackMetadata::ToJson(std::string* out) const {
    *out = RollbackToJson(*this).dump();
    return Status::OK();
}

Status RollbackMetadata::FromJson(const std::string& text, RollbackMetadata* metadata) {
    RollbackMetadata result;
    auto status = ParseDocument(text, "rollback metadata", [&result](const json& j) {
        result = RollbackFromJson(j);
    });
    if (!status.ok()) return status;
    *metadata = std::move(result);
    return Status::OK();
}

Status RestoreMetadata::ToJson(std::string* out) const {
    json restores = json::object();
    for (const auto& [instant, rollbacks] : restore_metadata) {
        json arr = json::array();
        for (const auto& rollback : rollbacks) {
            arr.push_back(RollbackToJson(rollback));
        }
        restores[instant] = arr;
    }
    json infos = json::array();
    for (const auto& info : restore_instant_info) {
        infos.push_back({{"commitTime", info.commit_time}, {"action", info.action}});
    }
    json j = {{"restoreMetadata", restores}, {"restoreInstantInfo", infos}};
    *out = j.dump();
    return Status::OK();
}

Status RestoreMetadata::FromJson(const std::string& text, RestoreMetadata* metadata) {
    RestoreMetadata result;
    auto status = ParseDocument(text, "restore metadata", [&result](const json& j) {
        if (j.contains("restoreMetadata")) {
            const auto& restores = j.at("restoreMetadata");
            for (auto it = restores.begin(); it != restores.end(); ++it) {
                auto& list = result.restore_metadata[it.key()];
                for (const auto& rollback : it.value()) {
                    list.push_back(RollbackFromJson(rollback));
                }
            }
        }
        if (j.contains("restoreInstantInfo")) {
            for (const auto& info : j.at("restoreInstantInfo")) {
                result.restore_instant_info.push_back(
                    {info.value("commitTime", ""), info.value("action", "")});
            }
        }
    });
    if (!status.ok()) return status;
    *metadata = std::move(result);
    return Status::OK();
}

//==============================================================================
// Compaction plan
//==============================================================================

Status CompactionPlan::ToJson(std::string* out) const {
    json ops = json::array();
    for (const auto& op : operations) {
        ops.push_back({{"partitionPath", op.partition_path},
                       {"fileId", op.file_id},
                       {"baseInstantTime", op.base_instant_time},
                       {"dataFilePath", op.data_file_path},
                       {"deltaFilePaths", op.delta_file_paths}});
    }
    json j = {{"operations", ops}};
    *out = j.dump();
    return Status::OK();
}

Status CompactionPlan::FromJson(const std::string& text, CompactionPlan* plan) {
    CompactionPlan result;
    auto status = ParseDocument(text, "compaction plan", [&result](const json& j) {
        if (!j.contains("operations")) return;
        for (const auto& entry : j.at("operations")) {
            CompactionOperation op;
            op.partition_path = entry.value("partitionPath", "");
            op.file_id = entry.value("fileId", "");
            op.base_instant_time = entry.value("baseInstantTime", "");
            op.data_file_path = entry.value("dataFilePath", "");
            op.delta_file_paths = entry.value("deltaFilePaths", std::vector<std::string>{});
            result.operations.push_back(std::move(op));
        }
    });
    if (!status.ok()) return status;
    *plan = std::move(result);
    return Status::OK();
}

} // namespace quarry
