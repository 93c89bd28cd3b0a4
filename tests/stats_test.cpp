#include "check.hpp"
#include "format/bytes.hpp"
#include "stats/endgame_index.hpp"
#include "stats/histogram.hpp"
#include "stats/stats_aggregator.hpp"
#include "stats/stats_store.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace tbinfo;
using tbinfo_test::check;
using tbinfo_test::checkEq;

namespace {

// Every ply index is represented exactly once, in order.
bool coversEveryPly(const std::vector<HistogramRow> &rows, std::size_t size) {
    std::size_t next = 0;
    for (const auto &row : rows) {
        if (row.isEmptyRun()) {
            next += static_cast<std::size_t>(row.empty);
            continue;
        }
        if (row.ply != static_cast<int>(next)) return false;
        ++next;
    }
    return next == size;
}

void testPercentages() {
    const WdlCounts counts{2959977091ULL, 0, 1333429189ULL, 103306ULL, 162344388ULL};
    const WdlPercentages p = percentages(counts, counts.sum());
    const double sum = p.white + p.cursed + p.draws + p.blessed + p.black;
    check("pct-sum-near-100", std::fabs(sum - 100.0) <= 0.1 + 1e-9);
    checkEq("pct-white", p.white, 66.4);
    checkEq("pct-cursed", p.cursed, 0.0);
    checkEq("pct-draws", p.draws, 29.9);

    const WdlPercentages zero = percentages(WdlCounts{}, 0);
    check("pct-total-zero", zero.white == 0.0 && zero.cursed == 0.0 && zero.draws == 0.0 &&
                            zero.blessed == 0.0 && zero.black == 0.0);
    checkEq("pct-one-decimal", percentage(1, 3), 33.3);
    checkEq("pct-all", percentage(7, 7), 100.0);
    checkEq("pct-tie-even-down", percentage(1, 16), 6.2);
    checkEq("pct-tie-even-up", percentage(3, 16), 18.8);
}

void testConsistency() {
    EndgameData data;
    data.counts = WdlCounts{10, 0, 5, 0, 5};
    data.total = 20;
    check("consistent", aggregate("KRvKN", data, HistogramPolicy{}).consistent);

    data.total = 25;
    const EndgameStatsRecord bad = aggregate("KRvKN", data, HistogramPolicy{});
    check("inconsistent", !bad.consistent);
    checkEq("inconsistent-keeps-total", bad.total, std::uint64_t(25));
    checkEq("inconsistent-pct", bad.pct.white, 40.0);
}

void testLongest() {
    const std::vector<LongestEntry> entries = {
        {"6k1/5n2/8/8/8/5n2/1RK5/1N6 w - -", 485, 1},
        {"8/8/8/8/8/2k5/1n1n4/K1R5 b - -", 300, 2},
        {"8/8/8/8/8/2k5/1n1n4/K1R5 b - -", 200, 2},
        {"8/8/8/8/8/2k5/2n5/K1R1n3 b - -", 250, -2},
        {"8/8/8/8/8/2k5/2n5/K1R1n3 w - -", 900, 0},
    };
    const std::vector<LongestLine> lines = selectLongest(entries);
    checkEq("longest-count", lines.size(), std::size_t(3));
    if (lines.size() != 3) return;

    check("longest-0-winner", lines[0].winner == Side::White && !lines[0].frustrated);
    checkEq("longest-0-ply", lines[0].ply, 250);
    checkEq("longest-0-label", lines[0].label, std::string("Black to move, loss with DTZ 250"));

    check("longest-1-winner", lines[1].winner == Side::White && lines[1].frustrated);
    checkEq("longest-1-ply", lines[1].ply, 485);
    checkEq("longest-1-label", lines[1].label, std::string("White to move, win with DTZ 485 (frustrated)"));

    check("longest-2-winner", lines[2].winner == Side::Black && !lines[2].frustrated);
    checkEq("longest-2-ply", lines[2].ply, 300);
    check("longest-2-turn", lines[2].turn == Side::Black);

    check("longest-empty", selectLongest({}).empty());
}

void testHistogram() {
    const std::vector<std::uint64_t> counts = {0, 10, 0, 0, 0, 0, 0, 0, 5, 0, 0, 3};
    const std::vector<HistogramRow> rows = buildHistogram(counts, HistogramPolicy{}, 8);
    check("hist-covers", coversEveryPly(rows, counts.size()));
    checkEq("hist-rows", rows.size(), std::size_t(7));
    if (rows.size() == 7) {
        check("hist-short-zero-row", !rows[0].isEmptyRun() && rows[0].ply == 0 && rows[0].num == 0);
        checkEq("hist-max-width", rows[1].width, 100.0);
        checkEq("hist-empty-run", rows[2].empty, 6);
        checkEq("hist-log-width", rows[3].width, 69.9);
        check("hist-active", rows[3].active && rows[3].ply == 8);
        check("hist-single-active", !rows[1].active && !rows[6].active);
        checkEq("hist-last-width", rows[6].width, 47.7);
    }

    const std::vector<std::uint64_t> small = {0, 1, 100};
    const auto minRows = buildHistogram(small, HistogramPolicy{});
    check("hist-min-width", minRows.size() == 3 && minRows[1].width == 0.5);

    const std::vector<std::uint64_t> trailing = {3, 0, 0, 0, 0, 0, 0};
    const auto tail = buildHistogram(trailing, HistogramPolicy{});
    check("hist-trailing-flush", tail.size() == 2 && tail[1].empty == 6);
    check("hist-trailing-covers", coversEveryPly(tail, trailing.size()));

    HistogramPolicy tight;
    tight.emptyRunThreshold = 2;
    const std::vector<std::uint64_t> gap = {1, 0, 0, 1};
    const auto gapRows = buildHistogram(gap, tight);
    check("hist-threshold", gapRows.size() == 3 && gapRows[1].empty == 2);

    HistogramPolicy linear;
    linear.logScale = false;
    const std::vector<std::uint64_t> lin = {10, 5};
    const auto linRows = buildHistogram(lin, linear);
    check("hist-linear", linRows.size() == 2 && linRows[0].width == 100.0 && linRows[1].width == 50.0);

    check("hist-empty-input", buildHistogram({}, HistogramPolicy{}).empty());

    const std::vector<std::uint64_t> zeros(12, 0);
    const auto zeroRows = buildHistogram(zeros, HistogramPolicy{});
    check("hist-all-zero", zeroRows.size() == 1 && zeroRows[0].empty == 12);

    const std::vector<std::uint64_t> split = {5, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 7};
    const auto splitRows = buildHistogram(split, HistogramPolicy{}, 7);
    check("hist-active-in-run-covers", coversEveryPly(splitRows, split.size()));
    checkEq("hist-active-in-run-rows", splitRows.size(), std::size_t(5));
    if (splitRows.size() == 5) {
        checkEq("hist-active-run-before", splitRows[1].empty, 6);
        check("hist-active-kept", splitRows[2].active && splitRows[2].ply == 7 && splitRows[2].num == 0);
        checkEq("hist-active-run-after", splitRows[3].empty, 5);
    }

    const std::vector<std::uint64_t> shortRun = {5, 0, 0, 0, 0, 0, 0, 7};
    const auto shortRows = buildHistogram(shortRun, HistogramPolicy{}, 3);
    checkEq("hist-active-short-rows", shortRows.size(), std::size_t(8));
    if (shortRows.size() == 8) check("hist-active-short", shortRows[3].active && shortRows[3].ply == 3);

    // Mismatched weights fall back to linear widths.
    const auto fallback = compressHistogram(lin, {1.0}, HistogramPolicy{});
    check("hist-weight-fallback", fallback.size() == 2 && fallback[1].width == 50.0);
}

StatsStore sampleStore() {
    EndgameData data;
    data.counts = WdlCounts{2959977091ULL, 0, 1333429189ULL, 103306ULL, 162344388ULL};
    data.total = data.counts.sum();
    data.white = SideHistogram{{0, 100, 0, 40, 7}, {98698, 144, 3810}};
    data.black = SideHistogram{{0, 5, 9}, {0, 0, 1000, 20}};
    StatsStore store;
    check("sample-store-add", store.add("KRNvKNN", data));
    return store;
}

void testPositionHistogram() {
    const StatsStore store = sampleStore();
    const StatsAggregator agg(store);

    Report r;
    r.material = "KRNvKNN";
    r.normalizedMaterial = "KRNvKNN";
    r.turn = Side::White;
    r.status = PositionStatus{Status::Win, false};
    r.dtz = 3;

    const auto win = agg.histogramFor(r);
    check("pos-hist-win", win.has_value());
    if (win) {
        checkEq("pos-hist-verb", win->verb, std::string("winning"));
        checkEq("pos-hist-side", win->materialSide, std::string("KRN"));
        checkEq("pos-hist-other", win->materialOther, std::string("KNN"));
        check("pos-hist-covers", coversEveryPly(win->rows, 5));
        bool active = false;
        for (const auto &row : win->rows) {
            if (row.active) active = row.ply == 3;
        }
        check("pos-hist-active", active);
    }

    r.status = PositionStatus{Status::Loss, false};
    r.dtz = -2;
    const auto loss = agg.histogramFor(r);
    check("pos-hist-loss", loss && loss->verb == "losing" && coversEveryPly(loss->rows, 3));

    // Black holds the stronger pieces; the store lists them as white.
    Report m;
    m.material = "KNNvKRN";
    m.normalizedMaterial = "KRNvKNN";
    m.turn = Side::Black;
    m.status = PositionStatus{Status::Win, false};
    const auto mirrored = agg.histogramFor(m);
    check("pos-hist-mirrored", mirrored && coversEveryPly(mirrored->rows, 5));
    if (mirrored) {
        checkEq("pos-hist-mirrored-side", mirrored->materialSide, std::string("KRN"));
        check("pos-hist-mirrored-turn", mirrored->side == Side::Black);
    }

    m.turn = Side::White;
    m.status = PositionStatus{Status::Loss, false};
    const auto weaker = agg.histogramFor(m);
    check("pos-hist-weaker-side", weaker && coversEveryPly(weaker->rows, 4));
    if (weaker) checkEq("pos-hist-weaker-material", weaker->materialSide, std::string("KNN"));

    r.status = PositionStatus{Status::Draw, false};
    check("pos-hist-draw", !agg.histogramFor(r).has_value());

    r.status = PositionStatus{Status::Win, false};
    r.normalizedMaterial = "KQvK";
    check("pos-hist-missing", !agg.histogramFor(r).has_value());
}

void testStatsFor() {
    const StatsStore store = sampleStore();
    const StatsAggregator agg(store);

    const auto rec = agg.statsFor("knnvkrn");
    check("stats-for-normalizes", rec.has_value());
    if (rec) {
        checkEq("stats-for-material", rec->material, std::string("KRNvKNN"));
        check("stats-for-consistent", rec->consistent);
        check("stats-for-white-rows", rec->white.has_value() && !rec->white->win.empty());
        check("stats-for-no-files", !rec->wdlBytes.has_value());
    }
    check("stats-for-missing", !agg.statsFor("KQvK").has_value());
}

StatsStore indexStore() {
    StatsStore store;
    auto add = [&store](const std::string &key, std::vector<LongestEntry> longest) {
        EndgameData data;
        data.longest = std::move(longest);
        check("index-add-" + key, store.add(key, std::move(data)));
    };
    add("KQvK", {{"8/8/8/8/8/8/8/KQ5k w - -", 20, 2}});
    add("KRvK", {{"8/8/8/8/8/8/8/KR5k w - -", 10, -2}, {"k7/8/8/8/8/8/8/KR6 w - -", 32, 2}});
    add("KPvK", {{"8/8/8/8/8/8/P7/K6k w - -", 38, 2}});
    add("KBNvK", {{"8/8/8/8/8/8/8/KBN4k w - -", 66, 2}});
    add("KRNvKR", {{"8/8/8/8/8/8/8/KRN2kr1 w - -", 100, 2}});
    add("KRPvKR", {{"8/8/8/8/8/8/P7/KR3kr1 w - -", 140, 2}});
    add("KNNvK", {});
    return store;
}

void testEndgameIndex() {
    const std::vector<EndgameIndexGroup> groups = endgameIndex(indexStore());
    checkEq("index-groups", groups.size(), std::size_t(4));
    if (groups.size() != 4) return;

    const EndgameIndexGroup &three = groups[0];
    check("index-three", three.pieces == 3 && !three.pawns.has_value());
    checkEq("index-three-size", three.entries.size(), std::size_t(3));
    if (three.entries.size() == 3) {
        checkEq("index-three-order", three.entries[0].material, std::string("KPvK"));
        check("index-three-maximal", three.entries[0].maximal && !three.entries[1].maximal &&
                                     !three.entries[2].maximal);
        checkEq("index-longest-ply", three.entries[2].ply, 32);
        checkEq("index-longest-epd", three.entries[2].epd, std::string("k7/8/8/8/8/8/8/KR6 w - -"));
    }

    check("index-four", groups[1].pieces == 4 && !groups[1].pawns && groups[1].entries.size() == 1 &&
                        groups[1].entries[0].maximal);

    check("index-five-no-pawns", groups[2].pieces == 5 && groups[2].pawns == 0 &&
                                 groups[2].entries.size() == 1 && !groups[2].entries[0].maximal);
    check("index-five-one-pawn", groups[3].pieces == 5 && groups[3].pawns == 1 &&
                                 groups[3].entries.size() == 1 && groups[3].entries[0].maximal);

    check("index-empty-store", endgameIndex(StatsStore{}).empty());
}

void testBytes() {
    checkEq("bytes-below-mib", formatKib(1023.9), std::string("1023.9 KiB"));
    checkEq("bytes-mib", formatKib(1024), std::string("1.0 MiB"));
    checkEq("bytes-zero", formatKib(0), std::string("0.0 KiB"));
    checkEq("bytes-gib", formatKib(1024.0 * 1024.0 * 1.5), std::string("1.5 GiB"));
    checkEq("bytes-raw-kib", formatBytes(2048), std::string("2.0 KiB"));
    checkEq("bytes-raw-mib", formatBytes(1024ULL * 1024ULL), std::string("1.0 MiB"));
    checkEq("bytes-raw-small", formatBytes(512), std::string("0.5 KiB"));
    checkEq("bytes-negative-mib", formatKib(-2048), std::string("-2.0 MiB"));
    checkEq("bytes-negative-kib", formatKib(-1023.9), std::string("-1023.9 KiB"));
    checkEq("bytes-yib-cap", formatKib(std::pow(1024.0, 8)), std::string("1024.0 YiB"));
}

} // namespace

int main() {
    testPercentages();
    testConsistency();
    testLongest();
    testHistogram();
    testPositionHistogram();
    testStatsFor();
    testEndgameIndex();
    testBytes();
    return tbinfo_test::finish("stats");
}
