#pragma once

#include "report.hpp"
#include "../probe/probe_backend.hpp"
#include "../rules/rules.hpp"

#include <string>

namespace tbinfo {

// Builds the full report for a position from the rules and probe
// capabilities. Holds no mutable state; collaborators are not owned and must
// outlive the analyzer.
class PositionAnalyzer {
public:
    PositionAnalyzer(const Rules &rules, const ProbeBackend &probe) : rules_(rules), probe_(probe) {}

    // Unparsable text yields an Illegal report, never an error.
    Report analyze(const std::string &fen) const;

    Report analyze(const Position &pos) const;

    const Rules &rules() const noexcept { return rules_; }

private:
    const Rules &rules_;
    const ProbeBackend &probe_;
};

} // namespace tbinfo
