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

#include <optional>
#include <string>
#include <vector>

#include "quarry/file_system.h"
#include "quarry/status.h"

namespace quarry {

enum class TableVersion {
    kSix = 6,
    kEight = 8,
};

enum class TableType {
    kCopyOnWrite,
    kMergeOnRead,
};

enum class RecordMergeMode {
    kCommitTimeOrdering,
    kEventTimeOrdering,
    kCustom,
};

// Well-known merge strategy identifiers persisted in table configuration.
constexpr const char* kCommitTimeStrategyId = "ce9acb64-bde0-424c-9b91-f6ebba25356d";
constexpr const char* kEventTimeStrategyId = "eeb8d96f-b1e4-49fd-bbf8-28ac514178e5";
constexpr const char* kPayloadBasedStrategyId = "00000000-0000-0000-0000-000000000000";

// Payload classes that map onto the built-in merge modes.
constexpr const char* kOverwriteWithLatestPayload = "OverwriteWithLatestPayload";
constexpr const char* kDefaultRecordPayload = "DefaultRecordPayload";

// Metadata folder and file names under the table base path.
constexpr const char* kMetaFolderName = ".quarry";
constexpr const char* kTableConfigFileName = "table.json";
constexpr const char* kTimelineFolderName = "timeline";

const char* RecordMergeModeToString(RecordMergeMode mode);
Status ParseRecordMergeMode(const std::string& name, RecordMergeMode* mode);

const char* TableTypeToString(TableType type);
Status ParseTableType(const std::string& name, TableType* type);

/**
 * @brief Resolved (merge mode, payload class, strategy id) triple
 */
struct MergingBehavior {
    RecordMergeMode mode = RecordMergeMode::kCommitTimeOrdering;
    std::string payload_class;
    std::string strategy_id;
};

/**
 * @brief Infer a consistent merging behaviour from partially specified configs
 *
 * Empty strings count as unset. Version 6 tables let the payload class decide
 * the merge mode; version 8 tables let the strategy id decide and treat
 * payload-based merging as CUSTOM. Contradictory combinations return
 * InvalidArgument.
 */
Status InferMergingBehavior(TableVersion version,
                            const std::optional<RecordMergeMode>& mode,
                            const std::string& payload_class,
                            const std::string& strategy_id,
                            const std::vector<std::string>& ordering_fields,
                            MergingBehavior* behavior);

// Comma-separated ordering field names; blank entries are dropped.
std::vector<std::string> SplitOrderingFields(const std::string& fields);

/**
 * @brief Persistent table configuration stored at <base>/.quarry/table.json
 */
struct TableConfig {
    std::string name;
    TableType type = TableType::kMergeOnRead;
    TableVersion version = TableVersion::kEight;
    std::vector<std::string> partition_fields;
    std::vector<std::string> record_key_fields;
    std::vector<std::string> ordering_fields;
    RecordMergeMode merge_mode = RecordMergeMode::kCommitTimeOrdering;
    std::string merge_strategy_id = kCommitTimeStrategyId;
    std::string payload_class = kOverwriteWithLatestPayload;
    std::string base_file_format = "ARROW";

    Status ToJson(std::string* json) const;
    static Status FromJson(const std::string& json, TableConfig* config);

    Status Save(FileSystem* fs, const std::string& base_path) const;
    static Status Load(FileSystem* fs, const std::string& base_path, TableConfig* config);
};

std::string MetaFolderPath(const std::string& base_path);
std::string TimelineFolderPath(const std::string& base_path);

} // namespace quarry
