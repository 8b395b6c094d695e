#pragma once

#include "chunkscribe/fragment_store.hpp"
#include "chunkscribe/identity.hpp"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace chunkscribe {

enum class GroupState {
    Empty,
    Incomplete,
    Complete
};

const char* to_string(GroupState state);

constexpr std::size_t kMissingReportLimit = 32;

struct Evaluation {
    GroupState state = GroupState::Empty;
    std::vector<Fragment> fragments;   // ascending by sequence, one per number
    std::set<uint32_t> missing;        // lowest missing numbers, at most kMissingReportLimit
    uint64_t missing_count = 0;        // all missing numbers
    uint32_t highest = 0;

    bool complete() const { return state == GroupState::Complete; }
};

/**
 * Decides whether a group may be merged.
 *
 * Complete iff the fragment numbers are exactly {1..M} with M the highest
 * number present. A single gap blocks completion no matter how many higher
 * parts exist. Duplicate numbers are collapsed before the gap check.
 *
 * pending holds the numbers of source segments that exist but have no
 * fragment yet; they extend the expected range so a group is never declared
 * complete while one of its segments still waits for transcription.
 *
 * The result is a snapshot; callers hold the group claim across evaluate and
 * merge.
 */
class CompletionDetector {
public:
    explicit CompletionDetector(const FragmentStore& store);

    Evaluation evaluate(const GroupKey& key, const std::set<uint32_t>& pending = {}) const;

    static Evaluation evaluate_fragments(std::vector<Fragment> fragments,
                                         const std::set<uint32_t>& pending = {});

private:
    const FragmentStore& store_;
};

// "{2, 5, 6}"
std::string format_sequence_set(const std::set<uint32_t>& numbers);

} // namespace chunkscribe
