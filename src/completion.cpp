#include "chunkscribe/completion.hpp"

#include <algorithm>
#include <sstream>

namespace chunkscribe {

const char* to_string(GroupState state) {
    switch (state) {
        case GroupState::Empty: return "empty";
        case GroupState::Incomplete: return "incomplete";
        case GroupState::Complete: return "complete";
    }
    return "unknown";
}

CompletionDetector::CompletionDetector(const FragmentStore& store) : store_(store) {}

Evaluation CompletionDetector::evaluate(const GroupKey& key, const std::set<uint32_t>& pending) const {
    return evaluate_fragments(store_.list(key), pending);
}

Evaluation CompletionDetector::evaluate_fragments(std::vector<Fragment> fragments,
                                                  const std::set<uint32_t>& pending) {
    Evaluation result;

    std::sort(fragments.begin(), fragments.end(),
              [](const Fragment& a, const Fragment& b) { return a.sequence < b.sequence; });
    fragments.erase(std::unique(fragments.begin(), fragments.end(),
                                [](const Fragment& a, const Fragment& b) { return a.sequence == b.sequence; }),
                    fragments.end());

    if (fragments.empty()) {
        return result;
    }

    result.highest = fragments.back().sequence;
    uint32_t expected_top = result.highest;
    if (!pending.empty()) {
        expected_top = std::max(expected_top, *pending.rbegin());
    }

    // Gaps are counted arithmetically; only the first few numbers are listed.
    auto note_gap = [&result](uint64_t from, uint64_t to) {
        result.missing_count += to - from;
        for (uint64_t n = from; n < to && result.missing.size() < kMissingReportLimit; ++n) {
            result.missing.insert(static_cast<uint32_t>(n));
        }
    };
    uint64_t next = 1;
    for (const auto& fragment : fragments) {
        if (fragment.sequence > next) {
            note_gap(next, fragment.sequence);
        }
        next = uint64_t{fragment.sequence} + 1;
    }
    if (expected_top >= next) {
        note_gap(next, uint64_t{expected_top} + 1);
    }

    result.state = result.missing_count == 0 ? GroupState::Complete : GroupState::Incomplete;
    result.fragments = std::move(fragments);
    return result;
}

std::string format_sequence_set(const std::set<uint32_t>& numbers) {
    std::ostringstream out;
    out << '{';
    bool first = true;
    for (uint32_t n : numbers) {
        if (!first) out << ", ";
        out << n;
        first = false;
    }
    out << '}';
    return out.str();
}

} // namespace chunkscribe
