#pragma once

#include "options.hpp"
#include "rules/chess_rules.hpp"

#include <iosfwd>
#include <memory>
#include <string>

namespace tbinfo_parallel {
class BatchAnalyzer;
}

namespace tbinfo {

class PositionAnalyzer;
class StatsAggregator;
class StatsStore;
struct Report;

namespace syzygy {
class SyzygyProbe;
}

// Line-oriented command front-end. Components are built on first use so that
// options given by setoption take effect; changing an option drops whatever
// depends on it. A failing command prints {"error":...} and the session goes on.
class Session {
public:
    Session(Options &options, std::ostream &out);
    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    // Returns false once "quit" is read.
    bool handle(const std::string &line);

    // Handles lines until end of input or "quit".
    void run(std::istream &in);

private:
    Options &options_;
    std::ostream &out_;
    ChessRules rules_;
    std::unique_ptr<syzygy::SyzygyProbe> probe_;
    std::unique_ptr<PositionAnalyzer> analyzer_;
    std::unique_ptr<StatsStore> store_;
    std::unique_ptr<StatsAggregator> aggregator_;
    std::unique_ptr<tbinfo_parallel::BatchAnalyzer> batch_;

    bool dispatch(const std::string &cmd, const std::string &line);
    void optionChanged(const std::string &name);
    void setoption(const std::string &line);
    bool checkMaterial(const std::string &material);

    const PositionAnalyzer &analyzer();
    const StatsStore &store();
    const StatsAggregator &aggregator();
    tbinfo_parallel::BatchAnalyzer &batch();

    // Report plus the stats of its endgame and the histogram for its side.
    std::string reportJson(const Report &report);
};

} // namespace tbinfo
