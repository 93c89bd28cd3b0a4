#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace tbinfo {

// One displayed histogram row: either a bar for a ply or a marker standing
// in for `empty` consecutive zero rows.
struct HistogramRow {
    int empty = 0;
    int ply = 0;
    std::uint64_t num = 0;
    double width = 0.0;     // percent of the widest bar
    bool active = false;    // ply of the position being shown

    bool isEmptyRun() const noexcept { return empty > 0; }
};

struct HistogramPolicy {
    // Zero runs at least this long collapse into one marker; shorter runs are
    // listed row by row. Values below 1 behave like 1.
    int emptyRunThreshold = 5;
    // Smallest width given to a nonzero count.
    double minWidth = 0.5;
    // Bars are sized by log(count) instead of count.
    bool logScale = true;
};

// Natural log of each nonzero count, 0 for zero counts.
std::vector<double> logWeights(const std::vector<std::uint64_t> &counts);

// Linear width mapping of weights plus zero-run compression. weights must
// have the same length as counts. The active ply always keeps a row of its
// own, even inside a collapsed zero run.
std::vector<HistogramRow> compressHistogram(const std::vector<std::uint64_t> &counts,
                                            const std::vector<double> &weights,
                                            const HistogramPolicy &policy,
                                            std::optional<int> activePly = std::nullopt);

// Applies the policy's scale, then compressHistogram().
std::vector<HistogramRow> buildHistogram(const std::vector<std::uint64_t> &counts,
                                         const HistogramPolicy &policy,
                                         std::optional<int> activePly = std::nullopt);

} // namespace tbinfo
