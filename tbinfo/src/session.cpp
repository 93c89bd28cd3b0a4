#include "session.hpp"

#include "material.hpp"
#include "json/serialize.hpp"
#include "parallel/batch_analyzer.hpp"
#include "probe/syzygy_probe.hpp"
#include "report/mainline.hpp"
#include "report/position_analyzer.hpp"
#include "stats/endgame_index.hpp"
#include "stats/stats_aggregator.hpp"
#include "stats/stats_store.hpp"

#include <cctype>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace tbinfo {

namespace {

std::vector<std::string> split(const std::string &line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    return tokens;
}

// Everything after the command word, with surrounding blanks removed.
std::string argumentOf(const std::string &line) {
    const auto ws = line.find_first_of(" \t");
    if (ws == std::string::npos) return "";
    const auto start = line.find_first_not_of(" \t", ws);
    if (start == std::string::npos) return "";
    const auto end = line.find_last_not_of(" \t\r");
    return line.substr(start, end - start + 1);
}

std::vector<std::string> splitBatch(const std::string &arg) {
    std::vector<std::string> out;
    std::size_t begin = 0;
    while (begin <= arg.size()) {
        const auto bar = arg.find('|', begin);
        const std::string part = arg.substr(begin, bar == std::string::npos ? std::string::npos : bar - begin);
        const auto s = part.find_first_not_of(" \t");
        if (s != std::string::npos) out.push_back(part.substr(s, part.find_last_not_of(" \t") - s + 1));
        if (bar == std::string::npos) break;
        begin = bar + 1;
    }
    return out;
}

HistogramPolicy histogramPolicyFrom(const Options &options) {
    HistogramPolicy policy;
    policy.emptyRunThreshold = options.getInt("histogram-empty-run", policy.emptyRunThreshold);
    policy.minWidth = options.getDouble("histogram-min-width", policy.minWidth);
    policy.logScale = options.getBool("histogram-log-scale", policy.logScale);
    return policy;
}

} // namespace

Session::Session(Options &options, std::ostream &out) : options_(options), out_(out) {}

Session::~Session() = default;

void Session::run(std::istream &in) {
    std::string line;
    while (std::getline(in, line)) {
        if (!handle(line)) break;
    }
}

bool Session::handle(const std::string &line) {
    const std::vector<std::string> tokens = split(line);
    if (tokens.empty()) return true;
    try {
        return dispatch(tokens[0], line);
    } catch (const std::exception &ex) {
        out_ << json::errorToJson(ex.what()) << '\n' << std::flush;
        return true;
    }
}

bool Session::dispatch(const std::string &cmd, const std::string &line) {
    if (cmd == "isready") {
        try {
            analyzer();
            aggregator();
        } catch (const std::exception &ex) {
            out_ << json::errorToJson(ex.what()) << '\n';
        }
        if (probe_ && probe_->isAvailable()) {
            out_ << "info string tablebases up to " << probe_->largest() << " pieces" << '\n';
        }
        out_ << "readyok" << '\n' << std::flush;
    } else if (cmd == "probe") {
        const Report report = analyzer().analyze(argumentOf(line));
        out_ << reportJson(report) << '\n' << std::flush;
    } else if (cmd == "batch") {
        auto &b = batch();
        const std::uint64_t hitsBefore = b.cacheHits();
        const std::vector<Report> reports = b.analyzeAll(splitBatch(argumentOf(line)));
        for (const auto &r : reports) out_ << reportJson(r) << '\n';
        out_ << "info string batch " << reports.size() << " positions, "
             << (b.cacheHits() - hitsBefore) << " cached" << '\n' << std::flush;
    } else if (cmd == "stats") {
        const std::string material = argumentOf(line);
        if (!checkMaterial(material)) return true;
        const auto stats = aggregator().statsFor(material);
        if (stats) {
            out_ << json::statsToJson(*stats) << '\n' << std::flush;
        } else {
            out_ << json::errorToJson("no statistics for " + normalizeMaterial(material)) << '\n' << std::flush;
        }
    } else if (cmd == "endgames") {
        out_ << json::endgamesToJson(endgameIndex(store())) << '\n' << std::flush;
    } else if (cmd == "deps") {
        const std::string material = argumentOf(line);
        if (!checkMaterial(material)) return true;
        const std::string key = normalizeMaterial(material);
        out_ << json::dependenciesToJson(key, dependencies(key), transitiveDependencies(key))
             << '\n' << std::flush;
    } else if (cmd == "graph") {
        const std::string material = argumentOf(line);
        if (!checkMaterial(material)) return true;
        out_ << json::dependencyGraphDot(material) << std::flush;
    } else if (cmd == "pgn") {
        const auto mainline = dtzMainline(analyzer(), argumentOf(line));
        if (mainline) {
            out_ << mainlinePgn(*mainline) << std::flush;
        } else {
            out_ << json::errorToJson("not a legal position: " + argumentOf(line)) << '\n' << std::flush;
        }
    } else if (cmd == "clearcache") {
        const std::size_t dropped = batch_ ? batch_->cacheSize() : 0;
        if (batch_) batch_->clearCache();
        out_ << "info string cleared " << dropped << " cached reports" << '\n' << std::flush;
    } else if (cmd == "setoption") {
        setoption(line);
    } else if (cmd == "options") {
        // Keys are stored lowercase
        options_.forEach([this](const std::string &k, const std::string &v) {
            out_ << k << '=' << v << '\n';
        });
        out_ << std::flush;
    } else if (cmd == "quit") {
        return false;
    } else {
        out_ << "info string unknown command: " << cmd << '\n' << std::flush;
    }
    return true;
}

void Session::optionChanged(const std::string &name) {
    std::string key;
    for (char c : name) key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (key == "syzygypath") {
        batch_.reset();
        analyzer_.reset();
        probe_.reset();
    } else if (key == "stats") {
        aggregator_.reset();
        store_.reset();
    } else if (key.rfind("histogram-", 0) == 0) {
        aggregator_.reset();
    } else if (key == "threads") {
        batch_.reset();
    }
}

void Session::setoption(const std::string &line) {
    // setoption name <id> [value <x>]
    const std::vector<std::string> tokens = split(line);
    std::size_t name_index = std::string::npos;
    std::size_t value_index = std::string::npos;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        if (tokens[i] == "name" && name_index == std::string::npos) name_index = i + 1;
        if (tokens[i] == "value" && value_index == std::string::npos) value_index = i + 1;
    }
    if (name_index == std::string::npos) return;

    const std::size_t name_end = value_index == std::string::npos ? tokens.size() : value_index - 1;
    std::string name;
    for (std::size_t i = name_index; i < name_end && i < tokens.size(); ++i) {
        if (!name.empty()) name.push_back(' ');
        name += tokens[i];
    }
    std::string value;
    if (value_index != std::string::npos) {
        for (std::size_t i = value_index; i < tokens.size(); ++i) {
            if (!value.empty()) value.push_back(' ');
            value += tokens[i];
        }
    }
    options_.set(name, value);
    optionChanged(name);
}

bool Session::checkMaterial(const std::string &material) {
    if (isValidMaterial(normalizeMaterial(material))) return true;
    out_ << json::errorToJson("invalid material: " + material) << '\n' << std::flush;
    return false;
}

const PositionAnalyzer &Session::analyzer() {
    if (!analyzer_) {
        if (!probe_) {
            const std::string path = options_.get("syzygypath", "");
            probe_ = std::make_unique<syzygy::SyzygyProbe>(path);
            if (!path.empty() && !probe_->isAvailable()) {
                out_ << "info string no tablebases found in " << path << '\n';
            }
        }
        analyzer_ = std::make_unique<PositionAnalyzer>(rules_, *probe_);
    }
    return *analyzer_;
}

const StatsStore &Session::store() {
    if (!store_) {
        const std::string path = options_.get("stats", "");
        if (path.empty()) {
            store_ = std::make_unique<StatsStore>();
        } else {
            auto loaded = StatsStore::loadFile(path);
            if (!loaded) throw std::runtime_error("cannot load statistics from " + path);
            store_ = std::make_unique<StatsStore>(std::move(*loaded));
            out_ << "info string loaded statistics for " << store_->size() << " endgames" << '\n';
        }
    }
    return *store_;
}

const StatsAggregator &Session::aggregator() {
    if (!aggregator_) {
        aggregator_ = std::make_unique<StatsAggregator>(store(), histogramPolicyFrom(options_));
    }
    return *aggregator_;
}

tbinfo_parallel::BatchAnalyzer &Session::batch() {
    if (!batch_) {
        batch_ = std::make_unique<tbinfo_parallel::BatchAnalyzer>(
            analyzer(), tbinfo_parallel::BatchAnalyzer::threadCountFromOptions(options_));
    }
    return *batch_;
}

std::string Session::reportJson(const Report &report) {
    const auto &agg = aggregator();
    std::optional<EndgameStatsRecord> stats;
    std::optional<PositionHistogram> hist;
    if (report.status.status != Status::Illegal && !report.normalizedMaterial.empty()) {
        stats = agg.statsFor(report.normalizedMaterial);
        hist = agg.histogramFor(report);
    }
    return json::reportToJson(report, stats ? &*stats : nullptr, hist ? &*hist : nullptr);
}

} // namespace tbinfo
