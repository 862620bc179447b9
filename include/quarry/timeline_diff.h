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
#include <utility>
#include <vector>

#include "quarry/timeline.h"

namespace quarry {

/**
 * @brief What changed between two pinned timelines
 *
 * When can_sync_incrementally is false the other fields are empty and the
 * caller must rebuild from a full listing.
 */
struct TimelineDiffResult {
    std::vector<Instant> new_instants;
    std::vector<Instant> finished_compaction_instants;
    std::vector<Instant> finished_or_removed_log_compaction_instants;
    bool can_sync_incrementally = true;

    static TimelineDiffResult Unsafe() {
        TimelineDiffResult result;
        result.can_sync_incrementally = false;
        return result;
    }

    std::string ToString() const;
};

class TimelineDiffHelper {
public:
    // Both timelines are reduced to completed and compaction instants first.
    static TimelineDiffResult GetNewInstantsForIncrementalSync(const Timeline& old_timeline,
                                                               const Timeline& new_timeline);

    // (old pending instant, its state in the new timeline). second is empty when lost.
    static std::vector<std::pair<Instant, std::optional<Instant>>> GetPendingCompactionTransitions(
        const Timeline& old_timeline, const Timeline& new_timeline);
    static std::vector<std::pair<Instant, std::optional<Instant>>>
    GetPendingLogCompactionTransitions(const Timeline& old_timeline, const Timeline& new_timeline);
};

} // namespace quarry
