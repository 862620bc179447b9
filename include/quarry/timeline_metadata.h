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

/**
 * JSON documents stored in timeline instant files.
 *
 * All paths are relative to the table base path unless noted otherwise.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "quarry/status.h"

namespace quarry {

struct WriteStat {
    std::string file_id;
    std::string path;          // <partition>/<file name>, relative to base
    std::string prev_commit;
    int64_t num_writes = 0;
    int64_t num_deletes = 0;
    int64_t file_size_in_bytes = 0;
};

/**
 * @brief Metadata of commit, deltacommit and completed compaction instants
 */
struct CommitMetadata {
    std::map<std::string, std::vector<WriteStat>> partition_to_write_stats;
    std::string operation_type;
    std::map<std::string, std::string> extra_metadata;

    std::vector<std::string> GetWrittenPartitions() const;

    Status ToJson(std::string* json) const;
    static Status FromJson(const std::string& json, CommitMetadata* metadata);
};

struct ReplaceCommitMetadata : public CommitMetadata {
    std::map<std::string, std::vector<std::string>> partition_to_replace_file_ids;

    Status ToJson(std::string* json) const;
    static Status FromJson(const std::string& json, ReplaceCommitMetadata* metadata);
};

struct PartitionCleanStat {
    std::string partition_path;
    std::vector<std::string> success_delete_files;  // file names only
    std::vector<std::string> failed_delete_files;
};

struct CleanMetadata {
    std::string earliest_commit_to_retain;
    std::map<std::string, PartitionCleanStat> partition_metadata;

    Status ToJson(std::string* json) const;
    static Status FromJson(const std::string& json, CleanMetadata* metadata);
};

struct PartitionRollbackStat {
    std::string partition_path;
    std::vector<std::string> success_delete_files;  // full paths
    std::vector<std::string> failed_delete_files;
};

struct RollbackMetadata {
    std::vector<std::string> commits_rollback;
    std::map<std::string, PartitionRollbackStat> partition_metadata;

    Status ToJson(std::string* json) const;
    static Status FromJson(const std::string& json, RollbackMetadata* metadata);
};

struct RestoreInstantInfo {
    std::string commit_time;
    std::string action;
};

struct RestoreMetadata {
    std::map<std::string, std::vector<RollbackMetadata>> restore_metadata;
    std::vector<RestoreInstantInfo> restore_instant_info;

    Status ToJson(std::string* json) const;
    static Status FromJson(const std::string& json, RestoreMetadata* metadata);
};

/**
 * @brief One file group to compact, as planned by a (log) compaction
 *
 * File paths are file names inside the partition directory.
 */
struct CompactionOperation {
    std::string partition_path;
    std::string file_id;
    std::string base_instant_time;
    std::string data_file_path;
    std::vector<std::string> delta_file_paths;
};

struct CompactionPlan {
    std::vector<CompactionOperation> operations;

    Status ToJson(std::string* json) const;
    static Status FromJson(const std::string& json, CompactionPlan* plan);
};

} // namespace quarry
