#pragma once

#include "histogram.hpp"
#include "stats_store.hpp"
#include "../report/report.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tbinfo {

struct WdlPercentages {
    double white = 0.0;
    double cursed = 0.0;
    double draws = 0.0;
    double blessed = 0.0;
    double black = 0.0;
};

// Longest example for one (winning side, frustrated) combination.
struct LongestLine {
    std::string epd;
    int ply = 0;
    int wdl = 0;
    Side turn = Side::White;
    Side winner = Side::White;
    bool frustrated = false;
    std::string label;
};

struct SideHistogramRows {
    std::vector<HistogramRow> win;
    std::vector<HistogramRow> loss;
};

struct EndgameStatsRecord {
    std::string material;
    WdlCounts counts;
    std::uint64_t total = 0;
    WdlPercentages pct;
    bool consistent = true;   // counts sum to total
    std::vector<LongestLine> longest;
    std::optional<SideHistogramRows> white;
    std::optional<SideHistogramRows> black;
    std::optional<std::uint64_t> wdlBytes;
    std::optional<std::uint64_t> dtzBytes;
};

// Histogram of the series that matches a position: its side's win series
// when winning, loss series when losing.
struct PositionHistogram {
    Side side = Side::White;
    std::string materialSide;
    std::string materialOther;
    std::string verb;
    std::vector<HistogramRow> rows;
};

// round(count / total * 100, 1), ties to even; 0.0 when total is 0.
double percentage(std::uint64_t count, std::uint64_t total) noexcept;

WdlPercentages percentages(const WdlCounts &counts, std::uint64_t total) noexcept;

// Keeps the maximal-ply entry per (winning side, frustrated). Draws and
// missing combinations are left out. Ordered white before black, then
// unfrustrated before frustrated.
std::vector<LongestLine> selectLongest(const std::vector<LongestEntry> &entries);

EndgameStatsRecord aggregate(const std::string &material, const EndgameData &data,
                             const HistogramPolicy &policy);

class StatsAggregator {
public:
    explicit StatsAggregator(const StatsStore &store, HistogramPolicy policy = {})
        : store_(store), policy_(policy) {}

    // material may be given in any side order or case.
    std::optional<EndgameStatsRecord> statsFor(const std::string &material) const;

    std::optional<PositionHistogram> histogramFor(const Report &report) const;

    const HistogramPolicy &policy() const noexcept { return policy_; }

private:
    const StatsStore &store_;
    HistogramPolicy policy_;
};

} // namespace tbinfo
