#include "stats_aggregator.hpp"

#include "../material.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>

namespace tbinfo {

namespace {

Side turnOfEpd(const std::string &epd) {
    std::istringstream iss(epd);
    std::string board, turn;
    iss >> board >> turn;
    return turn == "b" ? Side::Black : Side::White;
}

std::string longestLabel(const LongestLine &l) {
    std::ostringstream oss;
    oss << sideTitle(l.turn) << " to move, " << (l.wdl > 0 ? "win" : "loss")
        << " with DTZ " << l.ply;
    if (l.frustrated) oss << " (frustrated)";
    return oss.str();
}

SideHistogramRows rowsFor(const SideHistogram &h, const HistogramPolicy &policy) {
    return SideHistogramRows{buildHistogram(h.win, policy), buildHistogram(h.loss, policy)};
}

} // namespace

double percentage(std::uint64_t count, std::uint64_t total) noexcept {
    if (total == 0) return 0.0;
    const double pct = static_cast<double>(count) * 100.0 / static_cast<double>(total);
    // Ties go to the even tenth (6.25 -> 6.2).
    return std::nearbyint(pct * 10.0) / 10.0;
}

WdlPercentages percentages(const WdlCounts &counts, std::uint64_t total) noexcept {
    WdlPercentages p;
    p.white = percentage(counts.white, total);
    p.cursed = percentage(counts.cursed, total);
    p.draws = percentage(counts.draws, total);
    p.blessed = percentage(counts.blessed, total);
    p.black = percentage(counts.black, total);
    return p;
}

std::vector<LongestLine> selectLongest(const std::vector<LongestEntry> &entries) {
    // (winner, frustrated) -> best so far; map order gives the output order.
    std::map<std::pair<int, bool>, LongestLine> best;
    for (const auto &e : entries) {
        if (e.wdl == 0) continue;
        LongestLine line;
        line.epd = e.epd;
        line.ply = e.ply;
        line.wdl = e.wdl;
        line.turn = turnOfEpd(e.epd);
        line.winner = e.wdl > 0 ? line.turn : opposite(line.turn);
        line.frustrated = std::abs(e.wdl) == 1;

        const auto key = std::make_pair(line.winner == Side::White ? 0 : 1, line.frustrated);
        const auto it = best.find(key);
        if (it == best.end() || line.ply > it->second.ply) best[key] = std::move(line);
    }

    std::vector<LongestLine> out;
    out.reserve(best.size());
    for (auto &kv : best) {
        kv.second.label = longestLabel(kv.second);
        out.push_back(std::move(kv.second));
    }
    return out;
}

EndgameStatsRecord aggregate(const std::string &material, const EndgameData &data,
                             const HistogramPolicy &policy) {
    EndgameStatsRecord rec;
    rec.material = material;
    rec.counts = data.counts;
    rec.total = data.total;
    rec.pct = percentages(data.counts, data.total);
    rec.consistent = data.counts.sum() == data.total;
    if (!rec.consistent) {
        std::cerr << "[StatsAggregator] " << material << ": counts sum to " << data.counts.sum()
                  << " but total is " << data.total << '\n';
    }
    rec.longest = selectLongest(data.longest);
    if (data.white) rec.white = rowsFor(*data.white, policy);
    if (data.black) rec.black = rowsFor(*data.black, policy);
    rec.wdlBytes = data.wdlBytes;
    rec.dtzBytes = data.dtzBytes;
    return rec;
}

std::optional<EndgameStatsRecord> StatsAggregator::statsFor(const std::string &material) const {
    const std::string key = normalizeMaterial(material);
    const EndgameData *data = store_.find(key);
    if (!data) return std::nullopt;
    return aggregate(key, *data, policy_);
}

std::optional<PositionHistogram> StatsAggregator::histogramFor(const Report &report) const {
    const EndgameData *data = store_.find(report.normalizedMaterial);
    if (!data) return std::nullopt;

    bool winning = false;
    switch (report.status.status) {
        case Status::Win:
        case Status::CursedWin:
            winning = true;
            break;
        case Status::Loss:
        case Status::BlessedLoss:
            winning = false;
            break;
        default:
            return std::nullopt;
    }

    // The store lists the canonical first side as white.
    const bool mirrored = report.material != report.normalizedMaterial;
    const Side storeSide = mirrored ? opposite(report.turn) : report.turn;
    const std::optional<SideHistogram> &hist = storeSide == Side::White ? data->white : data->black;
    if (!hist) return std::nullopt;

    const std::string ours = report.turn == Side::White ? report.material : mirrorMaterial(report.material);
    const auto sep = ours.find('v');

    PositionHistogram out;
    out.side = report.turn;
    out.materialSide = ours.substr(0, sep);
    out.materialOther = sep == std::string::npos ? std::string() : ours.substr(sep + 1);
    out.verb = winning ? "winning" : "losing";

    std::optional<int> active;
    if (report.dtz) active = std::abs(*report.dtz);
    out.rows = buildHistogram(winning ? hist->win : hist->loss, policy_, active);
    return out;
}

} // namespace tbinfo
