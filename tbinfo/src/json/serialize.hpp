#pragma once

#include "json_writer.hpp"
#include "../report/report.hpp"
#include "../stats/endgame_index.hpp"
#include "../stats/stats_aggregator.hpp"

#include <string>
#include <vector>

namespace tbinfo::json {

const char *terminalName(Terminal t) noexcept;

void writeMove(Writer &w, const RenderMove &move);
void writeHistogramRows(Writer &w, const std::vector<HistogramRow> &rows);
void writeStats(Writer &w, const EndgameStatsRecord &stats);
void writePositionHistogram(Writer &w, const PositionHistogram &hist);

// Report object. stats and histogram are added as "stats" / "histogram"
// members when given.
std::string reportToJson(const Report &report,
                         const EndgameStatsRecord *stats = nullptr,
                         const PositionHistogram *histogram = nullptr);

std::string statsToJson(const EndgameStatsRecord &stats);

// {"material":..., "dependencies":[...], "transitive":[...]}
std::string dependenciesToJson(const std::string &material,
                               const std::vector<std::string> &direct,
                               const std::vector<std::string> &transitive);

// {"groups":[{"pieces":5,"pawns":1,"endgames":[{"material","epd","ply","wdl","maximal"}]}]}
// pawns is null for groups not split by pawn count.
std::string endgamesToJson(const std::vector<EndgameIndexGroup> &groups);

// {"error":...}
std::string errorToJson(const std::string &message);

// Graphviz digraph of material and everything it depends on. Every node is
// linked to its direct dependencies.
std::string dependencyGraphDot(const std::string &material);

} // namespace tbinfo::json
