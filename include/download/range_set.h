#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace paca {

// Half-open byte interval [start, end).
struct ByteRange {
    uint64_t start{0};
    uint64_t end{0};

    uint64_t length() const { return end > start ? end - start : 0; }
    bool empty() const { return end <= start; }

    bool operator==(const ByteRange& other) const { return start == other.start && end == other.end; }
    bool operator!=(const ByteRange& other) const { return !(*this == other); }

    // "bytes=start-(end-1)" for a Range header.
    std::string toHttpHeader() const;
};

// Ordered set of disjoint, non-adjacent ranges. Adding a range merges it with
// any range it overlaps or touches.
class RangeSet {
public:
    RangeSet() = default;
    explicit RangeSet(const std::vector<ByteRange>& ranges);

    void add(ByteRange range);
    void clear() { ranges_.clear(); }

    const std::vector<ByteRange>& ranges() const { return ranges_; }
    bool empty() const { return ranges_.empty(); }

    // Total number of bytes covered.
    uint64_t covered() const;

    // True when [0, total) is covered without gaps.
    bool containsAll(uint64_t total) const;

    // True when every byte of range is covered.
    bool contains(ByteRange range) const;

    // Gaps of [0, total) not covered by the set, in order.
    std::vector<ByteRange> complement(uint64_t total) const;

    bool operator==(const RangeSet& other) const { return ranges_ == other.ranges_; }

private:
    std::vector<ByteRange> ranges_;
};

// Split ranges into consecutive pieces of at most chunk_size bytes.
std::vector<ByteRange> splitRanges(const std::vector<ByteRange>& ranges, uint64_t chunk_size);

}  // namespace paca
