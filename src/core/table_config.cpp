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

#include "quarry/table_config.h"

#include <sstream>

#include <nlohmann/json.hpp>

#include "quarry/logging.h"

namespace quarry {

QUARRY_LOG_TAG(TableConfig);

namespace {

const char* kNameKey = "quarry.table.name";
const char* kTypeKey = "quarry.table.type";
const char* kVersionKey = "quarry.table.version";
const char* kPartitionFieldsKey = "quarry.table.partition.fields";
const char* kRecordKeyFieldsKey = "quarry.table.recordkey.fields";
const char* kOrderingFieldsKey = "quarry.table.ordering.fields";
const char* kMergeModeKey = "quarry.record.merge.mode";
const char* kMergeStrategyKey = "quarry.record.merge.strategy.id";
const char* kPayloadClassKey = "quarry.compaction.payload.class";
const char* kBaseFileFormatKey = "quarry.table.base.file.format";

std::string JoinFields(const std::vector<std::string>& fields) {
    std::string joined;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) joined += ",";
        joined += fields[i];
    }
    return joined;
}

RecordMergeMode ModeFromPayloadClass(const std::string& payload_class) {
    if (payload_class == kDefaultRecordPayload) {
        return RecordMergeMode::kEventTimeOrdering;
    }
    if (payload_class == kOverwriteWithLatestPayload) {
        return RecordMergeMode::kCommitTimeOrdering;
    }
    return RecordMergeMode::kCustom;
}

std::string StrategyForMode(RecordMergeMode mode, const std::string& strategy_id) {
    switch (mode) {
        case RecordMergeMode::kCommitTimeOrdering:
            return kCommitTimeStrategyId;
        case RecordMergeMode::kEventTimeOrdering:
            return kEventTimeStrategyId;
        case RecordMergeMode::kCustom:
            return strategy_id.empty() ? kPayloadBasedStrategyId : strategy_id;
    }
    return strategy_id;
}

std::string PayloadForMode(RecordMergeMode mode) {
    return mode == RecordMergeMode::kCommitTimeOrdering ? kOverwriteWithLatestPayload
                                                        : kDefaultRecordPayload;
}

Status Conflict(const std::optional<RecordMergeMode>& mode,
                const std::string& payload_class,
                const std::string& strategy_id) {
    return Status::InvalidArgument(
        std::string("Inconsistent merge configs: mode=") +
        (mode ? RecordMergeModeToString(*mode) : "<unset>") +
        ", payload=" + (payload_class.empty() ? "<unset>" : payload_class) +
        ", strategy=" + (strategy_id.empty() ? "<unset>" : strategy_id));
}

bool ModeAllows(const std::optional<RecordMergeMode>& mode, RecordMergeMode expected) {
    return !mode.has_value() || *mode == expected;
}

// Mode implied by a strategy id when no payload class is configured.
Status ModeFromStrategy(const std::optional<RecordMergeMode>& mode,
                        const std::string& payload_class,
                        const std::string& strategy_id,
                        RecordMergeMode* inferred) {
    if (strategy_id == kCommitTimeStrategyId) {
        if (!ModeAllows(mode, RecordMergeMode::kCommitTimeOrdering)) {
            return Conflict(mode, payload_class, strategy_id);
        }
        *inferred = RecordMergeMode::kCommitTimeOrdering;
    } else if (strategy_id == kEventTimeStrategyId) {
        if (!ModeAllows(mode, RecordMergeMode::kEventTimeOrdering)) {
            return Conflict(mode, payload_class, strategy_id);
        }
        *inferred = RecordMergeMode::kEventTimeOrdering;
    } else if (strategy_id == kPayloadBasedStrategyId) {
        // Payload-based merging needs a payload class to merge with.
        return Conflict(mode, payload_class, strategy_id);
    } else {
        if (!ModeAllows(mode, RecordMergeMode::kCustom)) {
            return Conflict(mode, payload_class, strategy_id);
        }
        *inferred = RecordMergeMode::kCustom;
    }
    return Status::OK();
}

}  // namespace

const char* RecordMergeModeToString(RecordMergeMode mode) {
    switch (mode) {
        case RecordMergeMode::kCommitTimeOrdering: return "COMMIT_TIME_ORDERING";
        case RecordMergeMode::kEventTimeOrdering: return "EVENT_TIME_ORDERING";
        case RecordMergeMode::kCustom: return "CUSTOM";
    }
    return "UNKNOWN";
}

Status ParseRecordMergeMode(const std::string& name, RecordMergeMode* mode) {
    if (name == "COMMIT_TIME_ORDERING") {
        *mode = RecordMergeMode::kCommitTimeOrdering;
    } else if (name == "EVENT_TIME_ORDERING") {
        *mode = RecordMergeMode::kEventTimeOrdering;
    } else if (name == "CUSTOM") {
        *mode = RecordMergeMode::kCustom;
    } else {
        return Status::InvalidArgument("Unknown record merge mode: " + name);
    }
    return Status::OK();
}

const char* TableTypeToString(TableType type) {
    return type == TableType::kCopyOnWrite ? "COPY_ON_WRITE" : "MERGE_ON_READ";
}

Status ParseTableType(const std::string& name, TableType* type) {
    if (name == "COPY_ON_WRITE") {
        *type = TableType::kCopyOnWrite;
    } else if (name == "MERGE_ON_READ") {
        *type = TableType::kMergeOnRead;
    } else {
        return Status::InvalidArgument("Unknown table type: " + name);
    }
    return Status::OK();
}

std::vector<std::string> SplitOrderingFields(const std::string& fields) {
    std::vector<std::string> result;
    std::stringstream ss(fields);
    std::string field;
    while (std::getline(ss, field, ',')) {
        auto begin = field.find_first_not_of(' ');
        auto end = field.find_last_not_of(' ');
        if (begin == std::string::npos) continue;
        result.push_back(field.substr(begin, end - begin + 1));
    }
    return result;
}

Status InferMergingBehavior(TableVersion version,
                            const std::optional<RecordMergeMode>& mode,
                            const std::string& payload_class,
                            const std::string& strategy_id,
                            const std::vector<std::string>& ordering_fields,
                            MergingBehavior* behavior) {
    bool has_ordering = false;
    for (const auto& field : ordering_fields) {
        if (!field.empty()) has_ordering = true;
    }

    RecordMergeMode inferred;
    std::string strategy;

    if (payload_class.empty()) {
        if (strategy_id.empty()) {
            if (mode.has_value()) {
                if (*mode == RecordMergeMode::kCustom) {
                    // CUSTOM needs either a payload class or a strategy.
                    return Conflict(mode, payload_class, strategy_id);
                }
                inferred = *mode;
            } else {
                inferred = has_ordering ? RecordMergeMode::kEventTimeOrdering
                                        : RecordMergeMode::kCommitTimeOrdering;
            }
        } else {
            auto status = ModeFromStrategy(mode, payload_class, strategy_id, &inferred);
            if (!status.ok()) return status;
        }
        strategy = StrategyForMode(inferred, strategy_id);
    } else {
        RecordMergeMode payload_mode = ModeFromPayloadClass(payload_class);

        if (strategy_id.empty() || version == TableVersion::kSix) {
            // Version 6 resolves the mode from the payload class only.
            if (!ModeAllows(mode, payload_mode)) {
                return Conflict(mode, payload_class, strategy_id);
            }
            inferred = payload_mode;
        } else if (strategy_id == kPayloadBasedStrategyId) {
            if (!ModeAllows(mode, RecordMergeMode::kCustom)) {
                return Conflict(mode, payload_class, strategy_id);
            }
            inferred = RecordMergeMode::kCustom;
        } else if (strategy_id == kCommitTimeStrategyId) {
            if (payload_mode != RecordMergeMode::kCommitTimeOrdering ||
                !ModeAllows(mode, RecordMergeMode::kCommitTimeOrdering)) {
                return Conflict(mode, payload_class, strategy_id);
            }
            inferred = RecordMergeMode::kCommitTimeOrdering;
        } else if (strategy_id == kEventTimeStrategyId) {
            if (payload_mode != RecordMergeMode::kEventTimeOrdering ||
                !ModeAllows(mode, RecordMergeMode::kEventTimeOrdering)) {
                return Conflict(mode, payload_class, strategy_id);
            }
            inferred = RecordMergeMode::kEventTimeOrdering;
        } else {
            if (!ModeAllows(mode, RecordMergeMode::kCustom)) {
                return Conflict(mode, payload_class, strategy_id);
            }
            inferred = RecordMergeMode::kCustom;
        }
        strategy = StrategyForMode(inferred, strategy_id);
    }

    behavior->mode = inferred;
    behavior->payload_class = payload_class.empty() ? PayloadForMode(inferred) : payload_class;
    behavior->strategy_id = strategy;

    QUARRY_LOG_DEBUG(TableConfig) << "Inferred merge mode " << RecordMergeModeToString(inferred)
                                  << " strategy " << strategy;
    return Status::OK();
}

std::string MetaFolderPath(const std::string& base_path) {
    return ConstructAbsolutePath(base_path, kMetaFolderName);
}

std::string TimelineFolderPath(const std::string& base_path) {
    return ConstructAbsolutePath(MetaFolderPath(base_path), kTimelineFolderName);
}

Status TableConfig::ToJson(std::string* json) const {
    nlohmann::json j;
    j[kNameKey] = name;
    j[kTypeKey] = TableTypeToString(type);
    j[kVersionKey] = static_cast<int>(version);
    j[kPartitionFieldsKey] = JoinFields(partition_fields);
    j[kRecordKeyFieldsKey] = JoinFields(record_key_fields);
    j[kOrderingFieldsKey] = JoinFields(ordering_fields);
    j[kMergeModeKey] = RecordMergeModeToString(merge_mode);
    j[kMergeStrategyKey] = merge_strategy_id;
    j[kPayloadClassKey] = payload_class;
    j[kBaseFileFormatKey] = base_file_format;
    *json = j.dump(2);
    return Status::OK();
}

Status TableConfig::FromJson(const std::string& json, TableConfig* config) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        return Status::Corruption(std::string("Invalid table config: ") + e.what());
    }

    TableConfig result;
    try {
        result.name = j.value(kNameKey, "");
        auto status = ParseTableType(j.value(kTypeKey, "MERGE_ON_READ"), &result.type);
        if (!status.ok()) return status;

        int version = j.value(kVersionKey, 8);
        if (version != 6 && version != 8) {
            return Status::NotSupported("Unsupported table version " + std::to_string(version));
        }
        result.version = static_cast<TableVersion>(version);

        result.partition_fields = SplitOrderingFields(j.value(kPartitionFieldsKey, ""));
        result.record_key_fields = SplitOrderingFields(j.value(kRecordKeyFieldsKey, ""));
        result.ordering_fields = SplitOrderingFields(j.value(kOrderingFieldsKey, ""));

        std::optional<RecordMergeMode> mode;
        std::string mode_name = j.value(kMergeModeKey, "");
        if (!mode_name.empty()) {
            RecordMergeMode parsed;
            status = ParseRecordMergeMode(mode_name, &parsed);
            if (!status.ok()) return status;
            mode = parsed;
        }

        // Older configs may carry only some of the merge keys.
        MergingBehavior behavior;
        status = InferMergingBehavior(result.version, mode,
                                      j.value(kPayloadClassKey, ""),
                                      j.value(kMergeStrategyKey, ""),
                                      result.ordering_fields, &behavior);
        if (!status.ok()) return status;
        result.merge_mode = behavior.mode;
        result.payload_class = behavior.payload_class;
        result.merge_strategy_id = behavior.strategy_id;

        result.base_file_format = j.value(kBaseFileFormatKey, "ARROW");
    } catch (const nlohmann::json::exception& e) {
        return Status::Corruption(std::string("Malformed table config: ") + e.what());
    }

    *config = std::move(result);
    return Status::OK();
}

Status TableConfig::Save(FileSystem* fs, const std::string& base_path) const {
    auto status = fs->CreateDirectory(MetaFolderPath(base_path));
    if (!status.ok()) return status;

    std::string json;
    status = ToJson(&json);
    if (!status.ok()) return status;

    std::string path = ConstructAbsolutePath(MetaFolderPath(base_path), kTableConfigFileName);
    std::unique_ptr<FileHandle> handle;
    status = fs->OpenFile(path,
                          FileOpenFlags::kWrite | FileOpenFlags::kCreate | FileOpenFlags::kTruncate,
                          &handle);
    if (!status.ok()) return status;

    size_t written = 0;
    status = handle->Write(json.data(), json.size(), &written);
    if (!status.ok()) return status;
    return handle->Close();
}

Status TableConfig::Load(FileSystem* fs, const std::string& base_path, TableConfig* config) {
    std::string path = ConstructAbsolutePath(MetaFolderPath(base_path), kTableConfigFileName);
    std::unique_ptr<FileHandle> handle;
    auto status = fs->OpenFile(path, FileOpenFlags::kRead, &handle);
    if (!status.ok()) return status;

    size_t size = 0;
    status = handle->GetSize(&size);
    if (!status.ok()) return status;

    std::string json(size, '\0');
    if (size > 0) {
        status = handle->ReadAt(0, &json[0], size);
        if (!status.ok()) return status;
    }
    status = handle->Close();
    if (!status.ok()) return status;

    QUARRY_LOG_DEBUG(TableConfig) << "Loaded table config from " << path;
    return FromJson(json, config);
}

} // namespace quarry
