#include "check.hpp"
#include "fake_collaborators.hpp"
#include "options.hpp"
#include "parallel/batch_analyzer.hpp"
#include "report/position_analyzer.hpp"

#include <string>
#include <vector>

using namespace tbinfo;
using tbinfo_test::check;
using tbinfo_test::checkEq;
using tbinfo_test::FakePosition;
using tbinfo_test::FakeProbe;
using tbinfo_test::FakeRules;
using tbinfo_test::makeMove;

int main() {
    FakeRules rules;
    FakeProbe probe;

    const std::vector<std::string> names = {"p0", "p1", "p2", "p3", "p4", "p5", "p6", "p7"};
    for (std::size_t i = 0; i < names.size(); ++i) {
        FakePosition p;
        p.material = "KRvK";
        p.moves = {makeMove("a1a2", "Ra2"), makeMove("a1b1", "Rb1")};
        rules.add(names[i], p);
        // Even positions are won, odd ones have no data.
        if (i % 2 == 0) probe.moves[names[i]] = MoveProbes{{"a1a2", ProbeResult{Win{static_cast<int>(i) + 1}}}};
    }

    PositionAnalyzer analyzer(rules, probe);
    tbinfo_parallel::BatchAnalyzer batch(analyzer, 4);
    checkEq("threads", batch.threads(), std::size_t(4));

    std::vector<std::string> input = names;
    input.push_back("not a position");
    const std::vector<Report> reports = batch.analyzeAll(input);
    checkEq("report-count", reports.size(), input.size());

    for (std::size_t i = 0; i < names.size() && i < reports.size(); ++i) {
        checkEq("order-" + names[i], reports[i].fen, names[i]);
        const Status expected = i % 2 == 0 ? Status::Win : Status::Unknown;
        check("status-" + names[i], reports[i].status.status == expected);
        checkEq("moves-" + names[i], reports[i].moveCount(), std::size_t(2));
    }
    if (reports.size() == input.size()) {
        check("garbage-illegal", reports.back().status.status == Status::Illegal);
    }
    checkEq("cache-size", batch.cacheSize(), input.size());
    checkEq("probe-calls", probe.probeCalls.load(), static_cast<int>(names.size()));

    // Second batch is served from the cache.
    const std::vector<Report> again = batch.analyzeAll({"p0", "p1", "p0"});
    checkEq("again-count", again.size(), std::size_t(3));
    checkEq("cache-hits", batch.cacheHits(), std::uint64_t(3));
    checkEq("no-new-probes", probe.probeCalls.load(), static_cast<int>(names.size()));
    if (again.size() == 3) check("again-status", again[2].status.status == Status::Win);

    batch.clearCache();
    checkEq("cleared", batch.cacheSize(), std::size_t(0));

    check("empty-batch", batch.analyzeAll({}).empty());

    Options options;
    options.set("threads", "3");
    checkEq("threads-option", tbinfo_parallel::BatchAnalyzer::threadCountFromOptions(options), std::size_t(3));
    options.set("threads", "0");
    checkEq("threads-min", tbinfo_parallel::BatchAnalyzer::threadCountFromOptions(options), std::size_t(1));
    options.set("threads", "100000");
    checkEq("threads-max", tbinfo_parallel::BatchAnalyzer::threadCountFromOptions(options), std::size_t(512));

    return tbinfo_test::finish("batch_analyzer");
}
