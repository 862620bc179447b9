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

#include <memory>
#include <mutex>
#include <string>

#include "quarry/file_system.h"
#include "quarry/status.h"
#include "quarry/table_config.h"
#include "quarry/timeline.h"
#include "quarry/timeline_metadata.h"

namespace quarry {

/**
 * @brief Source of timelines and instant metadata
 *
 * The file-system view and file index depend only on this interface so they
 * can run against a timeline that is not backed by the table directory.
 */
class TimelineProvider {
public:
    virtual ~TimelineProvider() = default;

    // Re-list the timeline directory and return every instant.
    virtual Status ReloadActiveTimeline(Timeline* timeline) = 0;

    virtual Status ReadCommitMetadata(const Instant& instant, CommitMetadata* metadata) = 0;
    virtual Status ReadReplaceCommitMetadata(const Instant& instant,
                                             ReplaceCommitMetadata* metadata) = 0;
    virtual Status ReadCleanMetadata(const Instant& instant, CleanMetadata* metadata) = 0;
    virtual Status ReadRollbackMetadata(const Instant& instant, RollbackMetadata* metadata) = 0;
    virtual Status ReadRestoreMetadata(const Instant& instant, RestoreMetadata* metadata) = 0;

    // Plans are read from the requested file whatever the instant's state.
    virtual Status ReadCompactionPlan(const std::string& requested_time, CompactionPlan* plan) = 0;
    virtual Status ReadLogCompactionPlan(const std::string& requested_time,
                                         CompactionPlan* plan) = 0;

    virtual const std::string& GetBasePath() const = 0;
    virtual TableVersion GetTableVersion() const = 0;
};

/**
 * @brief Table handle over a FileSystem
 *
 * Layout:
 *   <base>/.quarry/table.json
 *   <base>/.quarry/timeline/<req>.<action>.requested
 *   <base>/.quarry/timeline/<req>.<action>.inflight
 *   <base>/.quarry/timeline/<req>_<completion>.<action>
 *
 * The transition helpers exist for tooling and test fixtures; the library
 * itself never writes instants.
 */
class TableMetaClient : public TimelineProvider {
public:
    static Status Create(std::shared_ptr<FileSystem> fs, const std::string& base_path,
                         const TableConfig& config, std::unique_ptr<TableMetaClient>* client);
    static Status Load(std::shared_ptr<FileSystem> fs, const std::string& base_path,
                       std::unique_ptr<TableMetaClient>* client);

    Status ReloadActiveTimeline(Timeline* timeline) override;

    // Timeline as of the last reload.
    Timeline GetActiveTimeline() const;

    Status ReadCommitMetadata(const Instant& instant, CommitMetadata* metadata) override;
    Status ReadReplaceCommitMetadata(const Instant& instant,
                                     ReplaceCommitMetadata* metadata) override;
    Status ReadCleanMetadata(const Instant& instant, CleanMetadata* metadata) override;
    Status ReadRollbackMetadata(const Instant& instant, RollbackMetadata* metadata) override;
    Status ReadRestoreMetadata(const Instant& instant, RestoreMetadata* metadata) override;
    Status ReadCompactionPlan(const std::string& requested_time, CompactionPlan* plan) override;
    Status ReadLogCompactionPlan(const std::string& requested_time, CompactionPlan* plan) override;

    const std::string& GetBasePath() const override { return base_path_; }
    TableVersion GetTableVersion() const override { return config_.version; }

    const TableConfig& GetTableConfig() const { return config_; }
    std::shared_ptr<FileSystem> GetFileSystem() const { return fs_; }
    std::string GetTimelinePath() const;

    // Raw content of an instant file.
    Status ReadInstantContent(const Instant& instant, std::string* content);

    // Instant transitions.
    Status CreateRequestedInstant(const std::string& action, const std::string& requested_time,
                                  const std::string& content, Instant* instant);
    Status TransitionToInflight(const Instant& requested, const std::string& content,
                                Instant* inflight);
    Status SaveAsComplete(const Instant& inflight, const std::string& completion_time,
                          const std::string& content, Instant* completed);
    // Removes every state file of the instant's (requested time, action).
    Status DeleteInstant(const Instant& instant);

private:
    TableMetaClient(std::shared_ptr<FileSystem> fs, const std::string& base_path,
                    TableConfig config);

    Status WriteInstantFile(const Instant& instant, const std::string& content);
    Status ReadPlan(const std::string& action, const std::string& requested_time,
                    CompactionPlan* plan);

    std::shared_ptr<FileSystem> fs_;
    std::string base_path_;
    TableConfig config_;

    mutable std::mutex mutex_;
    Timeline active_timeline_;
};

} // namespace quarry
