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

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "quarry/log_record.h"
#include "quarry/status.h"
#include "quarry/table_config.h"

namespace quarry {

// Strategy id of the built-in partial update merger.
constexpr const char* kPartialUpdateStrategyId = "5a2b6f1c-8d4e-4f3a-9c7b-1e0d2a3b4c5d";

enum class RecordType {
    kArrow,
};

/**
 * @brief Properties handed to every merge call
 */
struct MergeProps {
    std::string ordering_field;
    std::map<std::string, std::string> properties;
};

/**
 * @brief Resolves two versions of the same record key into one
 *
 * older was written before newer in log order. Either side may be a delete.
 * The result is one of the inputs, or for partial updates a new row built
 * from both.
 */
class RecordMerger {
public:
    virtual ~RecordMerger() = default;

    virtual Status Merge(const LogRecord& older, const LogRecord& newer,
                         const MergeProps& props, LogRecord* result) const = 0;

    virtual RecordType GetRecordType() const { return RecordType::kArrow; }

    // Strategy id persisted in the table configuration.
    virtual const char* GetMergingStrategy() const = 0;

    // Event-time mergers let an old delete lose against a newer ordering value.
    virtual bool IsEventTimeOrdering() const { return false; }
};

// Latest write in log order wins.
class CommitTimeOrderingMerger : public RecordMerger {
public:
    Status Merge(const LogRecord& older, const LogRecord& newer,
                 const MergeProps& props, LogRecord* result) const override;

    const char* GetMergingStrategy() const override { return kCommitTimeStrategyId; }
};

// Highest ordering value wins; ties go to the later write.
class EventTimeOrderingMerger : public RecordMerger {
public:
    Status Merge(const LogRecord& older, const LogRecord& newer,
                 const MergeProps& props, LogRecord* result) const override;

    const char* GetMergingStrategy() const override { return kEventTimeStrategyId; }
    bool IsEventTimeOrdering() const override { return true; }
};

/**
 * @brief Event-time choice with null columns filled from the losing row
 *
 * Columns are matched by name. A loser column of a different type is not
 * used.
 */
class PartialUpdateMerger : public EventTimeOrderingMerger {
public:
    Status Merge(const LogRecord& older, const LogRecord& newer,
                 const MergeProps& props, LogRecord* result) const override;

    const char* GetMergingStrategy() const override { return kPartialUpdateStrategyId; }
};

/**
 * @brief Creates mergers from the table's merge mode and strategy id
 */
class RecordMergerFactory {
public:
    using Creator = std::function<std::shared_ptr<RecordMerger>()>;

    // Make a custom strategy available to Create(kCustom, strategy_id, ...).
    static Status Register(const std::string& strategy_id, Creator creator);
    static bool IsRegistered(const std::string& strategy_id);

    static Status Create(RecordMergeMode mode, const std::string& strategy_id,
                         std::shared_ptr<RecordMerger>* merger);

    // Resolves payload-based behaviours through the payload class.
    static Status Create(const MergingBehavior& behavior, std::shared_ptr<RecordMerger>* merger);
};

} // namespace quarry
