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


#include "quarry/timeline_diff.h"

#include <sstream>

#include "quarry/logging.h"

namespace quarry {

QUARRY_LOG_TAG(TimelineDiff);

namespace {

std::vector<std::pair<Instant, std::optional<Instant>>> PendingTransitions(
    const Timeline& pending, const Timeline& new_timeline, const char* completed_action,
    const char* pending_action) {
    std::vector<std::pair<Instant, std::optional<Instant>>> transitions;
    for (const auto& instant : pending.GetInstants()) {
        if (new_timeline.ContainsInstant(instant)) {
            transitions.emplace_back(instant, instant);
            continue;
        }
        Instant completed(InstantState::kCompleted, completed_action, instant.GetRequestedTime());
        if (new_timeline.ContainsInstant(completed)) {
            transitions.emplace_back(instant, completed);
            continue;
        }
        Instant inflight(InstantState::kInflight, pending_action, instant.GetRequestedTime());
        if (new_timeline.ContainsInstant(inflight)) {
            transitions.emplace_back(instant, inflight);
            continue;
        }
        transitions.emplace_back(instant, std::nullopt);
    }
    return transitions;
}

void AppendInstants(std::ostringstream& out, const char* label,
                    const std::vector<Instant>& instants) {
    out << label << "=[";
    for (size_t i = 0; i < instants.size(); ++i) {
        if (i > 0) out << ", ";
        out << instants[i].ToString();
    }
    out << "]";
}

}  // namespace

std::string TimelineDiffResult::ToString() const {
    std::ostringstream out;
    out << "TimelineDiffResult{";
    AppendInstants(out, "newInstants", new_instants);
    out << ", ";
    AppendInstants(out, "finishedCompactions", finished_compaction_instants);
    out << ", ";
    AppendInstants(out, "finishedOrRemovedLogCompactions",
                   finished_or_removed_log_compaction_instants);
    out << ", canSyncIncrementally=" << (can_sync_incrementally ? "true" : "false") << "}";
    return out.str();
}

std::vector<std::pair<Instant, std::optional<Instant>>>
TimelineDiffHelper::GetPendingCompactionTransitions(const Timeline& old_timeline,
                                                    const Timeline& new_timeline) {
    return PendingTransitions(old_timeline.FilterPendingCompactionTimeline(), new_timeline,
                              actions::kCommit, actions::kCompaction);
}

std::vector<std::pair<Instant, std::optional<Instant>>>
TimelineDiffHelper::GetPendingLogCompactionTransitions(const Timeline& old_timeline,
                                                       const Timeline& new_timeline) {
    return PendingTransitions(old_timeline.FilterPendingLogCompactionTimeline(), new_timeline,
                              actions::kDeltaCommit, actions::kLogCompaction);
}

TimelineDiffResult TimelineDiffHelper::GetNewInstantsForIncrementalSync(
    const Timeline& old_timeline, const Timeline& new_timeline) {
    Timeline old_t = old_timeline.FilterCompletedAndCompactionInstants();
    Timeline new_t = new_timeline.FilterCompletedAndCompactionInstants();

    auto last_seen = old_t.LastInstant();
    auto first_new = new_t.FirstInstant();
    if (!last_seen || !first_new) {
        QUARRY_LOG_WARN(TimelineDiff) << "One or more timelines is empty";
        return TimelineDiffResult::Unsafe();
    }
    if (last_seen->GetRequestedTime() < first_new->GetRequestedTime()) {
        QUARRY_LOG_INFO(TimelineDiff) << "Last seen instant " << last_seen->ToString()
                                      << " is no longer in the active timeline";
        return TimelineDiffResult::Unsafe();
    }

    TimelineDiffResult result;

    for (const auto& [old_instant, new_instant] : GetPendingCompactionTransitions(old_t, new_t)) {
        if (!new_instant) {
            QUARRY_LOG_WARN(TimelineDiff) << "Pending compaction " << old_instant.ToString()
                                          << " is lost, incremental sync is not possible";
            return TimelineDiffResult::Unsafe();
        }
        if (new_instant->GetAction() == actions::kCommit && new_instant->IsCompleted()) {
            result.finished_compaction_instants.push_back(old_instant);
        }
    }

    for (const auto& [old_instant, new_instant] :
         GetPendingLogCompactionTransitions(old_t, new_t)) {
        if (!old_instant.IsCompleted() && (!new_instant || new_instant->IsCompleted())) {
            result.finished_or_removed_log_compaction_instants.push_back(old_instant);
        }
    }

    for (const auto& instant : new_t.GetInstants()) {
        if (!old_t.ContainsInstant(instant)) {
            result.new_instants.push_back(instant);
        }
    }
    return result;
}

} // namespace quarry
