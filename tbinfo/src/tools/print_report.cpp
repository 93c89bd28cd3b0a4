#include "options.hpp"
#include "probe/probe_result.hpp"
#include "probe/syzygy_probe.hpp"
#include "report/position_analyzer.hpp"
#include "rules/chess_rules.hpp"
#include "stats/stats_aggregator.hpp"
#include "stats/stats_store.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

void printMoves(const char *title, const std::vector<tbinfo::RenderMove> &moves) {
    if (moves.empty()) return;
    std::cout << title << " (" << moves.size() << "):" << '\n';
    for (const auto &m : moves) {
        std::cout << "  " << m.san << "  " << m.uci << "  " << m.badge << '\n';
    }
}

void printRows(const std::vector<tbinfo::HistogramRow> &rows) {
    for (const auto &row : rows) {
        if (row.isEmptyRun()) {
            std::cout << "  ... " << row.empty << " empty rows" << '\n';
            continue;
        }
        std::cout << (row.active ? "> " : "  ") << row.ply << ": " << row.num
                  << " (" << row.width << "%)" << '\n';
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: tbinfo_report <FEN...>\n";
        std::cerr << "Example: tbinfo_report '6k1/5n2/8/8/8/5n2/1RK5/1N6 w - - 0 1'\n";
        std::cerr << "Environment: TBINFO_SYZYGY_PATH, TBINFO_STATS\n";
        return 1;
    }

    // Join all args as a FEN string to allow spaces without quoting
    std::ostringstream oss;
    for (int i = 1; i < argc; ++i) {
        if (i > 1) oss << ' ';
        oss << argv[i];
    }
    const std::string fen = oss.str();

    try {
        tbinfo::Options options;
        if (const char *p = std::getenv("TBINFO_SYZYGY_PATH")) options.set("syzygypath", p);
        if (const char *p = std::getenv("TBINFO_STATS")) options.set("stats", p);

        tbinfo::ChessRules rules;
        tbinfo::syzygy::SyzygyProbe probe(options.get("syzygypath", ""));
        tbinfo::PositionAnalyzer analyzer(rules, probe);

        const tbinfo::Report report = analyzer.analyze(fen);

        std::cout << "FEN: " << report.fen << '\n';
        std::cout << "material: " << report.material << " (" << report.normalizedMaterial << ")" << '\n';
        std::cout << "status: " << tbinfo::statusName(report.status.status)
                  << (report.status.frustrated ? " (frustrated)" : "") << '\n';
        std::cout << report.statusText << '\n';
        if (report.dtz) {
            std::cout << "DTZ: " << *report.dtz;
            if (*report.dtz != 0) {
                const tbinfo::DtzRange z = tbinfo::zeroingRange(*report.dtz);
                std::cout << " (zeroing in " << z.low << " or " << z.high << " plies)";
            }
            std::cout << '\n';
        }

        printMoves("winning", report.winningMoves);
        printMoves("cursed", report.cursedMoves);
        printMoves("drawing", report.drawingMoves);
        printMoves("blessed", report.blessedMoves);
        printMoves("losing", report.losingMoves);
        printMoves("unknown", report.unknownMoves);

        const std::string statsPath = options.get("stats", "");
        if (!statsPath.empty() && !report.normalizedMaterial.empty()) {
            const auto store = tbinfo::StatsStore::loadFile(statsPath);
            if (!store) throw std::runtime_error("cannot load statistics from " + statsPath);
            tbinfo::StatsAggregator aggregator(*store);
            if (const auto hist = aggregator.histogramFor(report)) {
                std::cout << "histogram (" << hist->materialSide << " " << hist->verb
                          << " against " << hist->materialOther << "):" << '\n';
                printRows(hist->rows);
            }
        }
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 2;
    }

    return 0;
}
