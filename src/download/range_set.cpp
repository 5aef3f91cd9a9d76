#include "download/range_set.h"

#include <algorithm>

namespace paca {

std::string ByteRange::toHttpHeader() const {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end - 1);
}

RangeSet::RangeSet(const std::vector<ByteRange>& ranges) {
    for (const auto& r : ranges) add(r);
}

void RangeSet::add(ByteRange range) {
    if (range.empty()) return;

    // First range whose end reaches the new start (touching ranges merge too).
    auto first = std::lower_bound(ranges_.begin(), ranges_.end(), range.start,
                                  [](const ByteRange& r, uint64_t start) { return r.end < start; });
    auto last = first;
    while (last != ranges_.end() && last->start <= range.end) {
        range.start = std::min(range.start, last->start);
        range.end = std::max(range.end, last->end);
        ++last;
    }
    first = ranges_.erase(first, last);
    ranges_.insert(first, range);
}

uint64_t RangeSet::covered() const {
    uint64_t total = 0;
    for (const auto& r : ranges_) total += r.length();
    return total;
}

bool RangeSet::containsAll(uint64_t total) const {
    if (total == 0) return true;
    return ranges_.size() == 1 && ranges_.front().start == 0 && ranges_.front().end >= total;
}

bool RangeSet::contains(ByteRange range) const {
    if (range.empty()) return true;
    auto it = std::upper_bound(ranges_.begin(), ranges_.end(), range.start,
                               [](uint64_t start, const ByteRange& r) { return start < r.start; });
    if (it == ranges_.begin()) return false;
    --it;
    return it->start <= range.start && it->end >= range.end;
}

std::vector<ByteRange> RangeSet::complement(uint64_t total) const {
    std::vector<ByteRange> gaps;
    uint64_t cursor = 0;
    for (const auto& r : ranges_) {
        if (r.start >= total) break;
        if (r.start > cursor) gaps.push_back({cursor, r.start});
        cursor = std::max(cursor, r.end);
    }
    if (cursor < total) gaps.push_back({cursor, total});
    return gaps;
}

std::vector<ByteRange> splitRanges(const std::vector<ByteRange>& ranges, uint64_t chunk_size) {
    std::vector<ByteRange> out;
    if (chunk_size == 0) return ranges;
    for (const auto& r : ranges) {
        for (uint64_t start = r.start; start < r.end; start += chunk_size) {
            out.push_back({start, std::min(r.end, start + chunk_size)});
        }
    }
    return out;
}

}  // namespace paca
