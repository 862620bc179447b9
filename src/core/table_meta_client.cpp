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

#include "quarry/table_meta_client.h"

#include <map>

#include "quarry/logging.h"

namespace quarry {

QUARRY_LOG_TAG(MetaClient);

TableMetaClient::TableMetaClient(std::shared_ptr<FileSystem> fs, const std::string& base_path,
                                 TableConfig config)
    : fs_(std::move(fs)), base_path_(base_path), config_(std::move(config)) {}

Status TableMetaClient::Create(std::shared_ptr<FileSystem> fs, const std::string& base_path,
                               const TableConfig& config,
                               std::unique_ptr<TableMetaClient>* client) {
    bool exists = false;
    std::string config_path =
        ConstructAbsolutePath(MetaFolderPath(base_path), kTableConfigFileName);
    auto status = fs->FileExists(config_path, &exists);
    if (!status.ok()) return status;
    if (exists) {
        return Status::AlreadyExists("Table already initialized at " + base_path);
    }

    status = fs->CreateDirectory(base_path);
    if (!status.ok()) return status;
    status = fs->CreateDirectory(TimelineFolderPath(base_path));
    if (!status.ok()) return status;
    status = config.Save(fs.get(), base_path);
    if (!status.ok()) return status;

    QUARRY_LOG_INFO(MetaClient) << "Created table " << config.name << " at " << base_path;

    client->reset(new TableMetaClient(std::move(fs), base_path, config));
    Timeline timeline;
    return (*client)->ReloadActiveTimeline(&timeline);
}

Status TableMetaClient::Load(std::shared_ptr<FileSystem> fs, const std::string& base_path,
                             std::unique_ptr<TableMetaClient>* client) {
    TableConfig config;
    auto status = TableConfig::Load(fs.get(), base_path, &config);
    if (!status.ok()) return status;

    client->reset(new TableMetaClient(std::move(fs), base_path, std::move(config)));
    Timeline timeline;
    return (*client)->ReloadActiveTimeline(&timeline);
}

std::string TableMetaClient::GetTimelinePath() const {
    return TimelineFolderPath(base_path_);
}

Status TableMetaClient::ReloadActiveTimeline(Timeline* timeline) {
    std::vector<FileInfo> files;
    auto status = fs_->ListFiles(GetTimelinePath(), &files);
    if (status.IsNotFound()) {
        files.clear();
    } else if (!status.ok()) {
        return status;
    }

    // One instant per requested time: the most advanced state wins.
    std::map<std::string, Instant> latest;
    for (const auto& file : files) {
        if (file.is_directory) continue;
        Instant instant;
        if (!Instant::ParseFileName(file.FileName(), &instant).ok()) {
            QUARRY_LOG_DEBUG(MetaClient) << "Ignoring timeline file " << file.path;
            continue;
        }
        auto it = latest.find(instant.GetRequestedTime());
        if (it == latest.end() ||
            static_cast<int>(instant.GetState()) > static_cast<int>(it->second.GetState())) {
            latest[instant.GetRequestedTime()] = instant;
        }
    }

    std::vector<Instant> instants;
    instants.reserve(latest.size());
    for (auto& entry : latest) {
        instants.push_back(std::move(entry.second));
    }

    Timeline reloaded(std::move(instants));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_timeline_ = reloaded;
    }
    *timeline = std::move(reloaded);
    return Status::OK();
}

Timeline TableMetaClient::GetActiveTimeline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_timeline_;
}

Status TableMetaClient::ReadInstantContent(const Instant& instant, std::string* content) {
    std::string path = ConstructAbsolutePath(GetTimelinePath(), instant.GetFileName());
    std::unique_ptr<FileHandle> handle;
    auto status = fs_->OpenFile(path, FileOpenFlags::kRead, &handle);
    if (!status.ok()) return status;

    size_t size = 0;
    status = handle->GetSize(&size);
    if (!status.ok()) return status;

    content->assign(size, '\0');
    if (size > 0) {
        status = handle->ReadAt(0, &(*content)[0], size);
        if (!status.ok()) return status;
    }
    return handle->Close();
}

Status TableMetaClient::ReadCommitMetadata(const Instant& instant, CommitMetadata* metadata) {
    std::string content;
    auto status = ReadInstantContent(instant, &content);
    if (!status.ok()) return status;
    return CommitMetadata::FromJson(content, metadata);
}

Status TableMetaClient::ReadReplaceCommitMetadata(const Instant& instant,
                                                  ReplaceCommitMetadata* metadata) {
    std::string content;
    auto status = ReadInstantContent(instant, &content);
    if (!status.ok()) return status;
    return ReplaceCommitMetadata::FromJson(content, metadata);
}

Status TableMetaClient::ReadCleanMetadata(const Instant& instant, CleanMetadata* metadata) {
    std::string content;
    auto status = ReadInstantContent(instant, &content);
    if (!status.ok()) return status;
    return CleanMetadata::FromJson(content, metadata);
}

Status TableMetaClient::ReadRollbackMetadata(const Instant& instant, RollbackMetadata* metadata) {
    std::string content;
    auto status = ReadInstantContent(instant, &content);
    if (!status.ok()) return status;
    return RollbackMetadata::FromJson(content, metadata);
}

Status TableMetaClient::ReadRestoreMetadata(const Instant& instant, RestoreMetadata* metadata) {
    std::string content;
    auto status = ReadInstantContent(instant, &content);
    if (!status.ok()) return status;
    return RestoreMetadata::FromJson(content, metadata);
}

Status TableMetaClient::ReadPlan(const std::string& action, const std::string& requested_time,
                                 CompactionPlan* plan) {
    std::string content;
    auto status = ReadInstantContent(Instant(InstantState::kRequested, action, requested_time),
                                     &content);
    if (!status.ok()) return status;
    return CompactionPlan::FromJson(content, plan);
}

Status TableMetaClient::ReadCompactionPlan(const std::string& requested_time,
                                           CompactionPlan* plan) {
    return ReadPlan(actions::kCompaction, requested_time, plan);
}

Status TableMetaClient::ReadLogCompactionPlan(const std::string& requested_time,
                                              CompactionPlan* plan) {
    return ReadPlan(actions::kLogCompaction, requested_time, plan);
}

Status TableMetaClient::WriteInstantFile(const Instant& instant, const std::string& content) {
    auto status = fs_->CreateDirectory(GetTimelinePath());
    if (!status.ok()) return status;

    std::string path = ConstructAbsolutePath(GetTimelinePath(), instant.GetFileName());
    bool exists = false;
    status = fs_->FileExists(path, &exists);
    if (!status.ok()) return status;
    if (exists) {
        return Status::AlreadyExists("Instant file already exists: " + path);
    }

    std::unique_ptr<FileHandle> handle;
    status = fs_->OpenFile(path, FileOpenFlags::kWrite | FileOpenFlags::kCreate, &handle);
    if (!status.ok()) return status;

    size_t written = 0;
    status = handle->Write(content.data(), content.size(), &written);
    if (!status.ok()) return status;
    status = handle->Sync();
    if (!status.ok()) return status;
    return handle->Close();
}

Status TableMetaClient::CreateRequestedInstant(const std::string& action,
                                               const std::string& requested_time,
                                               const std::string& content, Instant* instant) {
    Instant requested(InstantState::kRequested, action, requested_time);
    auto status = WriteInstantFile(requested, content);
    if (!status.ok()) return status;
    *instant = requested;
    return Status::OK();
}

Status TableMetaClient::TransitionToInflight(const Instant& requested, const std::string& content,
                                             Instant* inflight) {
    if (!requested.IsRequested()) {
        return Status::InvalidArgument("Instant is not requested: " + requested.ToString());
    }
    Instant next(InstantState::kInflight, requested.GetAction(), requested.GetRequestedTime());
    auto status = WriteInstantFile(next, content);
    if (!status.ok()) return status;
    *inflight = next;
    return Status::OK();
}

Status TableMetaClient::SaveAsComplete(const Instant& inflight, const std::string& completion_time,
                                       const std::string& content, Instant* completed) {
    if (!inflight.IsInflight()) {
        return Status::InvalidArgument("Instant is not inflight: " + inflight.ToString());
    }

    // Compactions complete as commits, log compactions as delta commits.
    std::string action = inflight.GetAction();
    if (action == actions::kCompaction) {
        action = actions::kCommit;
    } else if (action == actions::kLogCompaction) {
        action = actions::kDeltaCommit;
    }

    Instant done(InstantState::kCompleted, action, inflight.GetRequestedTime(), completion_time);
    auto status = WriteInstantFile(done, content);
    if (!status.ok()) return status;

    QUARRY_LOG_DEBUG(MetaClient) << "Completed instant " << done.ToString();
    *completed = done;
    return Status::OK();
}

Status TableMetaClient::DeleteInstant(const Instant& instant) {
    std::vector<FileInfo> files;
    auto status = fs_->ListFiles(GetTimelinePath(), &files);
    if (!status.ok()) return status;

    bool removed = false;
    for (const auto& file : files) {
        Instant candidate;
        if (!Instant::ParseFileName(file.FileName(), &candidate).ok()) continue;
        if (candidate.GetRequestedTime() != instant.GetRequestedTime() ||
            candidate.GetAction() != instant.GetAction()) {
            continue;
        }
        status = fs_->RemoveFile(file.path);
        if (!status.ok()) return status;
        removed = true;
    }
    if (!removed) {
        return Status::NotFound("No timeline files for " + instant.ToString());
    }
    return Status::OK();
}

} // namespace quarry
