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


#include "quarry/record_merger.h"

#include <mutex>

#include <arrow/api.h>

namespace quarry {

namespace {

const LogRecord& PickByOrdering(const LogRecord& older, const LogRecord& newer) {
    // A delete without an ordering value always applies.
    if (newer.is_delete && newer.ordering_value == 0) {
        return newer;
    }
    return newer.ordering_value >= older.ordering_value ? newer : older;
}

std::mutex& RegistryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::map<std::string, RecordMergerFactory::Creator>& Registry() {
    static std::map<std::string, RecordMergerFactory::Creator> registry = {
        {kPartialUpdateStrategyId, [] { return std::make_shared<PartialUpdateMerger>(); }},
    };
    return registry;
}

}  // namespace

Status CommitTimeOrderingMerger::Merge(const LogRecord& older, const LogRecord& newer,
                                       const MergeProps& props, LogRecord* result) const {
    (void)older;
    (void)props;
    *result = newer;
    return Status::OK();
}

Status EventTimeOrderingMerger::Merge(const LogRecord& older, const LogRecord& newer,
                                      const MergeProps& props, LogRecord* result) const {
    (void)props;
    *result = PickByOrdering(older, newer);
    return Status::OK();
}

Status PartialUpdateMerger::Merge(const LogRecord& older, const LogRecord& newer,
                                  const MergeProps& props, LogRecord* result) const {
    (void)props;
    const LogRecord& winner = PickByOrdering(older, newer);
    const LogRecord& loser = (&winner == &newer) ? older : newer;

    if (winner.is_delete || loser.is_delete || !winner.batch || !loser.batch) {
        *result = winner;
        return Status::OK();
    }

    auto schema = winner.batch->schema();
    std::vector<std::shared_ptr<arrow::Array>> columns;
    columns.reserve(schema->num_fields());

    for (int i = 0; i < schema->num_fields(); ++i) {
        const auto& field = schema->field(i);
        auto scalar_result = winner.batch->column(i)->GetScalar(winner.row);
        if (!scalar_result.ok()) {
            return Status::InternalError("Failed to read column " + field->name() + ": " +
                                         scalar_result.status().ToString());
        }
        std::shared_ptr<arrow::Scalar> scalar = *scalar_result;

        if (!scalar->is_valid) {
            auto fallback = loser.batch->GetColumnByName(field->name());
            if (fallback && fallback->type()->Equals(field->type())) {
                auto fallback_result = fallback->GetScalar(loser.row);
                if (!fallback_result.ok()) {
                    return Status::InternalError("Failed to read column " + field->name() + ": " +
                                                 fallback_result.status().ToString());
                }
                if ((*fallback_result)->is_valid) {
                    scalar = *fallback_result;
                }
            }
        }

        auto array_result = arrow::MakeArrayFromScalar(*scalar, 1);
        if (!array_result.ok()) {
            return Status::InternalError("Failed to build merged column " + field->name() + ": " +
                                         array_result.status().ToString());
        }
        columns.push_back(*array_result);
    }

    *result = winner;
    result->batch = arrow::RecordBatch::Make(schema, 1, std::move(columns));
    result->row = 0;
    return Status::OK();
}

//==============================================================================
// RecordMergerFactory
//==============================================================================

Status RecordMergerFactory::Register(const std::string& strategy_id, Creator creator) {
    if (strategy_id.empty() || !creator) {
        return Status::InvalidArgument("A merge strategy needs an id and a creator");
    }
    if (strategy_id == kCommitTimeStrategyId || strategy_id == kEventTimeStrategyId ||
        strategy_id == kPayloadBasedStrategyId) {
        return Status::InvalidArgument("Strategy id is reserved: " + strategy_id);
    }
    std::lock_guard<std::mutex> lock(RegistryMutex());
    Registry()[strategy_id] = std::move(creator);
    return Status::OK();
}

bool RecordMergerFactory::IsRegistered(const std::string& strategy_id) {
    std::lock_guard<std::mutex> lock(RegistryMutex());
    return Registry().count(strategy_id) > 0;
}

Status RecordMergerFactory::Create(RecordMergeMode mode, const std::string& strategy_id,
                                   std::shared_ptr<RecordMerger>* merger) {
    switch (mode) {
        case RecordMergeMode::kCommitTimeOrdering:
            *merger = std::make_shared<CommitTimeOrderingMerger>();
            return Status::OK();
        case RecordMergeMode::kEventTimeOrdering:
            *merger = std::make_shared<EventTimeOrderingMerger>();
            return Status::OK();
        case RecordMergeMode::kCustom:
            break;
    }

    if (strategy_id == kCommitTimeStrategyId) {
        *merger = std::make_shared<CommitTimeOrderingMerger>();
        return Status::OK();
    }
    if (strategy_id == kEventTimeStrategyId) {
        *merger = std::make_shared<EventTimeOrderingMerger>();
        return Status::OK();
    }

    Creator creator;
    {
        std::lock_guard<std::mutex> lock(RegistryMutex());
        auto it = Registry().find(strategy_id);
        if (it == Registry().end()) {
            return Status::NotFound("No record merger registered for strategy " + strategy_id);
        }
        creator = it->second;
    }
    *merger = creator();
    if (!*merger) {
        return Status::InternalError("Merger creator returned null for strategy " + strategy_id);
    }
    return Status::OK();
}

Status RecordMergerFactory::Create(const MergingBehavior& behavior,
                                   std::shared_ptr<RecordMerger>* merger) {
    if (behavior.mode == RecordMergeMode::kCustom &&
        behavior.strategy_id == kPayloadBasedStrategyId) {
        if (behavior.payload_class == kOverwriteWithLatestPayload) {
            *merger = std::make_shared<CommitTimeOrderingMerger>();
            return Status::OK();
        }
        if (behavior.payload_class == kDefaultRecordPayload) {
            *merger = std::make_shared<EventTimeOrderingMerger>();
            return Status::OK();
        }
        return Status::NotSupported("Unsupported payload class: " + behavior.payload_class);
    }
    return Create(behavior.mode, behavior.strategy_id, merger);
}

} // namespace quarry
