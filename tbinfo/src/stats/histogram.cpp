#include "histogram.hpp"

#include <algorithm>
#include <cmath>

namespace tbinfo {

namespace {

double roundTenth(double v) { return std::round(v * 10.0) / 10.0; }

} // namespace

std::vector<double> logWeights(const std::vector<std::uint64_t> &counts) {
    std::vector<double> out;
    out.reserve(counts.size());
    for (auto num : counts) out.push_back(num ? std::log(static_cast<double>(num)) : 0.0);
    return out;
}

std::vector<HistogramRow> compressHistogram(const std::vector<std::uint64_t> &counts,
                                            const std::vector<double> &weights,
                                            const HistogramPolicy &policy,
                                            std::optional<int> activePly) {
    std::vector<double> linear;
    const std::vector<double> *w = &weights;
    if (weights.size() != counts.size()) {
        linear.assign(counts.begin(), counts.end());
        w = &linear;
    }

    double maxWeight = 0.0;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        if (counts[i]) maxWeight = std::max(maxWeight, (*w)[i]);
    }

    const int threshold = std::max(1, policy.emptyRunThreshold);
    std::vector<HistogramRow> rows;
    int run = 0;

    // Zero rows [start, end), none of them active.
    auto emitZeros = [&](int start, int end) {
        const int len = end - start;
        if (len <= 0) return;
        if (len >= threshold) {
            HistogramRow row;
            row.empty = len;
            rows.push_back(row);
            return;
        }
        for (int ply = start; ply < end; ++ply) {
            HistogramRow row;
            row.ply = ply;
            rows.push_back(row);
        }
    };

    // Emits the zero run that ends just before `end`. An active ply inside
    // the run keeps its own row.
    auto flush = [&](int end) {
        if (run == 0) return;
        const int start = end - run;
        if (activePly && *activePly >= start && *activePly < end) {
            emitZeros(start, *activePly);
            HistogramRow row;
            row.ply = *activePly;
            row.active = true;
            rows.push_back(row);
            emitZeros(*activePly + 1, end);
        } else {
            emitZeros(start, end);
        }
        run = 0;
    };

    for (std::size_t i = 0; i < counts.size(); ++i) {
        const int ply = static_cast<int>(i);
        if (counts[i] == 0) {
            ++run;
            continue;
        }
        flush(ply);

        double width = maxWeight > 0.0 ? (*w)[i] / maxWeight * 100.0 : 0.0;
        width = std::min(100.0, std::max(width, policy.minWidth));

        HistogramRow row;
        row.ply = ply;
        row.num = counts[i];
        row.width = roundTenth(width);
        row.active = activePly && *activePly == ply;
        rows.push_back(row);
    }
    flush(static_cast<int>(counts.size()));

    return rows;
}

std::vector<HistogramRow> buildHistogram(const std::vector<std::uint64_t> &counts,
                                         const HistogramPolicy &policy,
                                         std::optional<int> activePly) {
    if (policy.logScale) return compressHistogram(counts, logWeights(counts), policy, activePly);
    std::vector<double> linear(counts.begin(), counts.end());
    return compressHistogram(counts, linear, policy, activePly);
}

} // namespace tbinfo
