#include "serialize.hpp"

#include "../format/bytes.hpp"
#include "../material.hpp"
#include "../probe/probe_result.hpp"

#include <sstream>

namespace tbinfo::json {

namespace {

constexpr Category kCategories[] = {
    Category::Winning, Category::Cursed, Category::Drawing,
    Category::Blessed, Category::Losing, Category::Unknown,
};

const char *listName(Category c) noexcept {
    switch (c) {
        case Category::Winning: return "winningMoves";
        case Category::Cursed:  return "cursedMoves";
        case Category::Drawing: return "drawingMoves";
        case Category::Blessed: return "blessedMoves";
        case Category::Losing:  return "losingMoves";
        case Category::Unknown: break;
    }
    return "unknownMoves";
}

void writeSideRows(Writer &w, const std::string &name, const std::optional<SideHistogramRows> &rows) {
    w.key(name);
    if (!rows) {
        w.null();
        return;
    }
    w.beginObject();
    w.key("win");
    writeHistogramRows(w, rows->win);
    w.key("loss");
    writeHistogramRows(w, rows->loss);
    w.endObject();
}

void writeRange(Writer &w, const std::string &name, const DtzRange &r) {
    w.key(name).beginObject();
    w.field("low", r.low);
    w.field("high", r.high);
    w.endObject();
}

// Zeroing distance as a range, plus the later-phase distance when past the
// fifty-move threshold.
void writeDtzRanges(Writer &w, const std::optional<int> &dtz) {
    if (!dtz || *dtz == 0) return;
    writeRange(w, "zeroing", zeroingRange(*dtz));
    if (dtzIsFrustrated(*dtz)) writeRange(w, "laterPhase", laterPhaseRange(*dtz));
}

void writeFileSize(Writer &w, const std::string &name, const std::optional<std::uint64_t> &bytes) {
    w.key(name);
    if (!bytes) {
        w.null();
        return;
    }
    w.beginObject();
    w.field("bytes", *bytes);
    w.field("text", formatBytes(*bytes));
    w.endObject();
}

} // namespace

const char *terminalName(Terminal t) noexcept {
    switch (t) {
        case Terminal::Checkmate:            return "checkmate";
        case Terminal::Stalemate:            return "stalemate";
        case Terminal::InsufficientMaterial: return "insufficient-material";
        case Terminal::None:                 break;
    }
    return "none";
}

void writeMove(Writer &w, const RenderMove &move) {
    w.beginObject();
    w.field("uci", move.uci);
    w.field("san", move.san);
    w.field("fen", move.fen);
    w.field("dtz", move.dtz);
    writeDtzRanges(w, move.dtz);
    w.field("category", categoryName(move.category));
    w.field("after", terminalName(move.after));
    w.field("badge", move.badge);
    w.endObject();
}

void writeHistogramRows(Writer &w, const std::vector<HistogramRow> &rows) {
    w.beginArray();
    for (const auto &row : rows) {
        w.beginObject();
        if (row.isEmptyRun()) {
            w.field("empty", row.empty);
        } else {
            w.field("ply", row.ply);
            w.field("num", row.num);
            w.key("width").value(row.width, 1);
            if (row.active) w.field("active", true);
        }
        w.endObject();
    }
    w.endArray();
}

void writeStats(Writer &w, const EndgameStatsRecord &stats) {
    w.beginObject();
    w.field("material", stats.material);
    w.field("total", stats.total);
    w.field("consistent", stats.consistent);

    w.key("counts").beginObject();
    w.field("white", stats.counts.white);
    w.field("cursed", stats.counts.cursed);
    w.field("draws", stats.counts.draws);
    w.field("blessed", stats.counts.blessed);
    w.field("black", stats.counts.black);
    w.endObject();

    w.key("pct").beginObject();
    w.key("white").value(stats.pct.white, 1);
    w.key("cursed").value(stats.pct.cursed, 1);
    w.key("draws").value(stats.pct.draws, 1);
    w.key("blessed").value(stats.pct.blessed, 1);
    w.key("black").value(stats.pct.black, 1);
    w.endObject();

    w.key("longest").beginArray();
    for (const auto &l : stats.longest) {
        w.beginObject();
        w.field("epd", l.epd);
        w.field("ply", l.ply);
        w.field("wdl", l.wdl);
        w.field("winner", sideName(l.winner));
        w.field("frustrated", l.frustrated);
        w.field("label", l.label);
        w.endObject();
    }
    w.endArray();

    w.key("histogram").beginObject();
    writeSideRows(w, "white", stats.white);
    writeSideRows(w, "black", stats.black);
    w.endObject();

    w.key("files").beginObject();
    writeFileSize(w, "rtbw", stats.wdlBytes);
    writeFileSize(w, "rtbz", stats.dtzBytes);
    w.endObject();

    w.endObject();
}

void writePositionHistogram(Writer &w, const PositionHistogram &hist) {
    w.beginObject();
    w.field("side", sideName(hist.side));
    w.field("materialSide", hist.materialSide);
    w.field("materialOther", hist.materialOther);
    w.field("verb", hist.verb);
    w.key("rows");
    writeHistogramRows(w, hist.rows);
    w.endObject();
}

std::string reportToJson(const Report &report, const EndgameStatsRecord *stats,
                         const PositionHistogram *histogram) {
    Writer w;
    w.beginObject();
    w.field("fen", report.fen);
    w.field("turn", sideName(report.turn));
    w.field("material", report.material);
    w.field("normalizedMaterial", report.normalizedMaterial);
    w.field("status", statusName(report.status.status));
    w.field("frustrated", report.status.frustrated);
    w.key("winningSide");
    if (report.winningSide) w.value(sideName(*report.winningSide));
    else w.null();
    w.field("statusText", report.statusText);
    w.field("dtz", report.dtz);
    writeDtzRanges(w, report.dtz);

    for (Category c : kCategories) {
        w.key(listName(c)).beginArray();
        for (const auto &m : report.movesIn(c)) writeMove(w, m);
        w.endArray();
    }

    if (stats) {
        w.key("stats");
        writeStats(w, *stats);
    }
    if (histogram) {
        w.key("histogram");
        writePositionHistogram(w, *histogram);
    }
    w.endObject();
    return w.str();
}

std::string statsToJson(const EndgameStatsRecord &stats) {
    Writer w;
    writeStats(w, stats);
    return w.str();
}

std::string dependenciesToJson(const std::string &material,
                               const std::vector<std::string> &direct,
                               const std::vector<std::string> &transitive) {
    Writer w;
    w.beginObject();
    w.field("material", material);
    w.key("dependencies").beginArray();
    for (const auto &d : direct) w.value(d);
    w.endArray();
    w.key("transitive").beginArray();
    for (const auto &d : transitive) w.value(d);
    w.endArray();
    w.endObject();
    return w.str();
}

std::string endgamesToJson(const std::vector<EndgameIndexGroup> &groups) {
    Writer w;
    w.beginObject();
    w.key("groups").beginArray();
    for (const auto &g : groups) {
        w.beginObject();
        w.field("pieces", g.pieces);
        w.field("pawns", g.pawns);
        w.key("endgames").beginArray();
        for (const auto &e : g.entries) {
            w.beginObject();
            w.field("material", e.material);
            w.field("epd", e.epd);
            w.field("ply", e.ply);
            w.field("wdl", e.wdl);
            w.field("maximal", e.maximal);
            w.endObject();
        }
        w.endArray();
        w.endObject();
    }
    w.endArray();
    w.endObject();
    return w.str();
}

std::string errorToJson(const std::string &message) {
    Writer w;
    w.beginObject().field("error", message).endObject();
    return w.str();
}

std::string dependencyGraphDot(const std::string &material) {
    const std::string root = normalizeMaterial(material);
    std::vector<std::string> nodes{root};
    for (auto &d : transitiveDependencies(root)) nodes.push_back(std::move(d));

    std::ostringstream oss;
    oss << "digraph \"" << root << "\" {\n";
    for (const auto &n : nodes) {
        oss << "  \"" << n << "\";\n";
    }
    for (const auto &n : nodes) {
        for (const auto &d : dependencies(n)) {
            oss << "  \"" << n << "\" -> \"" << d << "\";\n";
        }
    }
    oss << "}\n";
    return oss.str();
}

} // namespace tbinfo::json
