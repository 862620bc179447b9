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
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "quarry/status.h"

namespace quarry {

namespace actions {
constexpr const char* kCommit = "commit";
constexpr const char* kDeltaCommit = "deltacommit";
constexpr const char* kCompaction = "compaction";
constexpr const char* kLogCompaction = "logcompaction";
constexpr const char* kClean = "clean";
constexpr const char* kRollback = "rollback";
constexpr const char* kRestore = "restore";
constexpr const char* kReplaceCommit = "replacecommit";
}  // namespace actions

enum class InstantState {
    kRequested = 0,
    kInflight = 1,
    kCompleted = 2,
};

const char* InstantStateToString(InstantState state);

/**
 * @brief One table-changing operation on the timeline
 *
 * Instant times are fixed-width numeric strings (yyyyMMddHHmmssSSS or any
 * other fixed width) so lexicographic order is chronological order.
 * Equality compares requested time, action and state.
 */
class Instant {
public:
    Instant() = default;
    Instant(InstantState state, const std::string& action,
            const std::string& requested_time,
            const std::string& completion_time = "");

    const std::string& GetAction() const { return action_; }
    const std::string& GetRequestedTime() const { return requested_time_; }
    const std::string& GetCompletionTime() const { return completion_time_; }
    InstantState GetState() const { return state_; }

    bool IsCompleted() const { return state_ == InstantState::kCompleted; }
    bool IsInflight() const { return state_ == InstantState::kInflight; }
    bool IsRequested() const { return state_ == InstantState::kRequested; }

    // Name of the timeline file holding this instant.
    std::string GetFileName() const;

    // Parse a timeline file name; InvalidArgument for foreign files.
    static Status ParseFileName(const std::string& file_name, Instant* instant);

    bool operator==(const Instant& other) const;
    bool operator!=(const Instant& other) const { return !(*this == other); }

    std::string ToString() const;

private:
    InstantState state_ = InstantState::kCompleted;
    std::string action_;
    std::string requested_time_;
    std::string completion_time_;
};

/**
 * @brief Immutable ordered view of instants
 *
 * Every filter returns a new Timeline; instants stay ordered by requested time.
 */
class Timeline {
public:
    Timeline() = default;
    explicit Timeline(std::vector<Instant> instants);

    // State filters
    Timeline FilterCompletedInstants() const;
    Timeline FilterInflights() const;
    Timeline FilterInflightsAndRequested() const;
    Timeline FilterCompletedAndCompactionInstants() const;
    Timeline FilterPendingCompactionTimeline() const;
    Timeline FilterPendingLogCompactionTimeline() const;

    // Action filters
    Timeline GetCommitsTimeline() const;
    Timeline GetCommitsAndCompactionTimeline() const;
    Timeline GetWriteTimeline() const;
    Timeline GetCleanerTimeline() const;
    Timeline FilterByActions(const std::set<std::string>& actions) const;
    Timeline Filter(const std::function<bool(const Instant&)>& predicate) const;

    // Range queries: start exclusive, end inclusive.
    Timeline FindInstantsInRange(const std::string& start, const std::string& end) const;
    Timeline FindInstantsInRangeByCompletionTime(const std::string& start,
                                                 const std::string& end) const;
    Timeline FindInstantsAfter(const std::string& time) const;
    Timeline FindInstantsBeforeOrEquals(const std::string& time) const;

    bool ContainsInstant(const std::string& requested_time) const;
    bool ContainsInstant(const Instant& instant) const;
    bool IsBeforeTimelineStarts(const std::string& time) const;
    bool IsBeforeTimelineStartsByCompletionTime(const std::string& time) const;
    bool ContainsOrBeforeTimelineStarts(const std::string& time) const;

    std::optional<Instant> FirstInstant() const;
    std::optional<Instant> LastInstant() const;
    std::optional<Instant> FindInstant(const std::string& requested_time) const;

    bool Empty() const { return instants_.empty(); }
    size_t CountInstants() const { return instants_.size(); }
    const std::vector<Instant>& GetInstants() const { return instants_; }

    bool operator==(const Timeline& other) const { return instants_ == other.instants_; }

private:
    std::vector<Instant> instants_;
};

} // namespace quarry
