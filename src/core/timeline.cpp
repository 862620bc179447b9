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

#include "quarry/timeline.h"

#include <algorithm>
#include <cctype>

namespace quarry {

namespace {

bool IsInstantTime(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool IsKnownAction(const std::string& action) {
    static const std::set<std::string> kActions = {
        actions::kCommit, actions::kDeltaCommit, actions::kCompaction,
        actions::kLogCompaction, actions::kClean, actions::kRollback,
        actions::kRestore, actions::kReplaceCommit};
    return kActions.count(action) > 0;
}

}  // namespace

const char* InstantStateToString(InstantState state) {
    switch (state) {
        case InstantState::kRequested: return "REQUESTED";
        case InstantState::kInflight: return "INFLIGHT";
        case InstantState::kCompleted: return "COMPLETED";
    }
    return "UNKNOWN";
}

//==============================================================================
// Instant
//==============================================================================

Instant::Instant(InstantState state, const std::string& action,
                 const std::string& requested_time,
                 const std::string& completion_time)
    : state_(state), action_(action), requested_time_(requested_time),
      completion_time_(completion_time) {}

std::string Instant::GetFileName() const {
    switch (state_) {
        case InstantState::kRequested:
            return requested_time_ + "." + action_ + ".requested";
        case InstantState::kInflight:
            return requested_time_ + "." + action_ + ".inflight";
        case InstantState::kCompleted:
            return requested_time_ + "_" + completion_time_ + "." + action_;
    }
    return requested_time_;
}

Status Instant::ParseFileName(const std::string& file_name, Instant* instant) {
    auto first_dot = file_name.find('.');
    if (first_dot == std::string::npos || first_dot == 0) {
        return Status::InvalidArgument("Not a timeline file: " + file_name);
    }
    std::string time_part = file_name.substr(0, first_dot);
    std::string rest = file_name.substr(first_dot + 1);

    auto second_dot = rest.find('.');
    if (second_dot == std::string::npos) {
        // <req>_<completion>.<action>
        auto underscore = time_part.find('_');
        if (underscore == std::string::npos) {
            return Status::InvalidArgument("Completed instant without completion time: " + file_name);
        }
        std::string requested = time_part.substr(0, underscore);
        std::string completion = time_part.substr(underscore + 1);
        if (!IsInstantTime(requested) || !IsInstantTime(completion) || !IsKnownAction(rest)) {
            return Status::InvalidArgument("Not a timeline file: " + file_name);
        }
        *instant = Instant(InstantState::kCompleted, rest, requested, completion);
        return Status::OK();
    }

    std::string action = rest.substr(0, second_dot);
    std::string suffix = rest.substr(second_dot + 1);
    if (!IsInstantTime(time_part) || !IsKnownAction(action)) {
        return Status::InvalidArgument("Not a timeline file: " + file_name);
    }
    if (suffix == "requested") {
        *instant = Instant(InstantState::kRequested, action, time_part);
    } else if (suffix == "inflight") {
        *instant = Instant(InstantState::kInflight, action, time_part);
    } else {
        return Status::InvalidArgument("Unknown instant state in " + file_name);
    }
    return Status::OK();
}

bool Instant::operator==(const Instant& other) const {
    return state_ == other.state_ && action_ == other.action_ &&
           requested_time_ == other.requested_time_;
}

std::string Instant::ToString() const {
    std::string s = "[" + requested_time_;
    if (!completion_time_.empty()) {
        s += "__" + completion_time_;
    }
    s += "__" + action_ + "__" + InstantStateToString(state_) + "]";
    return s;
}

//==============================================================================
// Timeline
//==============================================================================

Timeline::Timeline(std::vector<Instant> instants) : instants_(std::move(instants)) {
    std::stable_sort(instants_.begin(), instants_.end(),
                     [](const Instant& a, const Instant& b) {
                         return a.GetRequestedTime() < b.GetRequestedTime();
                     });
}

Timeline Timeline::Filter(const std::function<bool(const Instant&)>& predicate) const {
    std::vector<Instant> result;
    for (const auto& instant : instants_) {
        if (predicate(instant)) {
            result.push_back(instant);
        }
    }
    return Timeline(std::move(result));
}

Timeline Timeline::FilterCompletedInstants() const {
    return Filter([](const Instant& i) { return i.IsCompleted(); });
}

Timeline Timeline::FilterInflights() const {
    return Filter([](const Instant& i) { return i.IsInflight(); });
}

Timeline Timeline::FilterInflightsAndRequested() const {
    return Filter([](const Instant& i) { return !i.IsCompleted(); });
}

Timeline Timeline::FilterCompletedAndCompactionInstants() const {
    return Filter([](const Instant& i) {
        return i.IsCompleted() || i.GetAction() == actions::kCompaction ||
               i.GetAction() == actions::kLogCompaction;
    });
}

Timeline Timeline::FilterPendingCompactionTimeline() const {
    return Filter([](const Instant& i) {
        return i.GetAction() == actions::kCompaction && !i.IsCompleted();
    });
}

Timeline Timeline::FilterPendingLogCompactionTimeline() const {
    return Filter([](const Instant& i) {
        return i.GetAction() == actions::kLogCompaction && !i.IsCompleted();
    });
}

Timeline Timeline::FilterByActions(const std::set<std::string>& action_set) const {
    return Filter([&action_set](const Instant& i) { return action_set.count(i.GetAction()) > 0; });
}

Timeline Timeline::GetCommitsTimeline() const {
    return FilterByActions({actions::kCommit, actions::kDeltaCommit, actions::kReplaceCommit});
}

Timeline Timeline::GetCommitsAndCompactionTimeline() const {
    return FilterByActions({actions::kCommit, actions::kDeltaCommit, actions::kReplaceCommit,
                            actions::kCompaction, actions::kLogCompaction});
}

Timeline Timeline::GetWriteTimeline() const {
    return FilterByActions({actions::kCommit, actions::kDeltaCommit, actions::kReplaceCommit,
                            actions::kCompaction, actions::kLogCompaction});
}

Timeline Timeline::GetCleanerTimeline() const {
    return FilterByActions({actions::kClean});
}

Timeline Timeline::FindInstantsInRange(const std::string& start, const std::string& end) const {
    return Filter([&](const Instant& i) {
        return i.GetRequestedTime() > start && i.GetRequestedTime() <= end;
    });
}

Timeline Timeline::FindInstantsInRangeByCompletionTime(const std::string& start,
                                                       const std::string& end) const {
    return Filter([&](const Instant& i) {
        return i.IsCompleted() && i.GetCompletionTime() > start && i.GetCompletionTime() <= end;
    });
}

Timeline Timeline::FindInstantsAfter(const std::string& time) const {
    return Filter([&](const Instant& i) { return i.GetRequestedTime() > time; });
}

Timeline Timeline::FindInstantsBeforeOrEquals(const std::string& time) const {
    return Filter([&](const Instant& i) { return i.GetRequestedTime() <= time; });
}

bool Timeline::ContainsInstant(const std::string& requested_time) const {
    return std::any_of(instants_.begin(), instants_.end(), [&](const Instant& i) {
        return i.GetRequestedTime() == requested_time;
    });
}

bool Timeline::ContainsInstant(const Instant& instant) const {
    return std::find(instants_.begin(), instants_.end(), instant) != instants_.end();
}

bool Timeline::IsBeforeTimelineStarts(const std::string& time) const {
    return !instants_.empty() && time < instants_.front().GetRequestedTime();
}

bool Timeline::IsBeforeTimelineStartsByCompletionTime(const std::string& time) const {
    for (const auto& instant : instants_) {
        if (instant.IsCompleted()) {
            return time < instant.GetCompletionTime();
        }
    }
    return false;
}

bool Timeline::ContainsOrBeforeTimelineStarts(const std::string& time) const {
    return ContainsInstant(time) || IsBeforeTimelineStarts(time);
}

std::optional<Instant> Timeline::FirstInstant() const {
    if (instants_.empty()) return std::nullopt;
    return instants_.front();
}

std::optional<Instant> Timeline::LastInstant() const {
    if (instants_.empty()) return std::nullopt;
    return instants_.back();
}

std::optional<Instant> Timeline::FindInstant(const std::string& requested_time) const {
    for (const auto& instant : instants_) {
        if (instant.GetRequestedTime() == requested_time) {
            return instant;
        }
    }
    return std::nullopt;
}

} // namespace quarry
