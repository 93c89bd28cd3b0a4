#pragma once

#include "../options.hpp"
#include "../report/position_analyzer.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <tbb/concurrent_hash_map.h>

// cppcoro headers must be included at global scope
#include <cppcoro/task.hpp>
#include <cppcoro/sync_wait.hpp>
#include <cppcoro/static_thread_pool.hpp>
#include <cppcoro/when_all_ready.hpp>

namespace tbinfo_parallel {

// Analyzes many positions on a coroutine thread pool. Finished reports are
// memoized by FEN so repeated positions across batches are analyzed once.
class BatchAnalyzer {
public:
    BatchAnalyzer(const tbinfo::PositionAnalyzer &analyzer, std::size_t threads)
        : analyzer_(analyzer),
          threads_(threads == 0 ? 1 : threads),
          pool_(std::make_unique<cppcoro::static_thread_pool>(static_cast<std::uint32_t>(threads_))) {}

    // Reports in input order.
    std::vector<tbinfo::Report> analyzeAll(const std::vector<std::string> &fens) {
        if (fens.empty()) return {};

        std::vector<cppcoro::task<tbinfo::Report>> tasks;
        tasks.reserve(fens.size());
        for (const auto &fen : fens) tasks.push_back(analyzeOne(fen));

        auto ready = cppcoro::sync_wait(cppcoro::when_all_ready(std::move(tasks)));

        std::vector<tbinfo::Report> out;
        out.reserve(ready.size());
        for (auto &t : ready) out.push_back(std::move(t).result());
        return out;
    }

    std::size_t threads() const noexcept { return threads_; }
    std::size_t cacheSize() const { return cache_.size(); }
    std::uint64_t cacheHits() const noexcept { return cacheHits_.load(std::memory_order_relaxed); }
    void clearCache() { cache_.clear(); }

    // "threads" option, clamped to [1, 512]; hardware concurrency by default.
    static std::size_t threadCountFromOptions(const tbinfo::Options &options) {
        unsigned int hc = std::thread::hardware_concurrency();
        if (hc == 0u) hc = 8u;
        int t = options.getInt("threads", static_cast<int>(hc));
        if (t < 1) t = 1;
        if (t > 512) t = 512;
        return static_cast<std::size_t>(t);
    }

private:
    struct StringHashCompare {
        std::size_t hash(const std::string &s) const noexcept {
            return std::hash<std::string>{}(s);
        }
        bool equal(const std::string &lhs, const std::string &rhs) const noexcept {
            return lhs == rhs;
        }
    };

    using ReportCache = tbb::concurrent_hash_map<std::string, tbinfo::Report, StringHashCompare>;

    const tbinfo::PositionAnalyzer &analyzer_;
    std::size_t threads_;
    std::unique_ptr<cppcoro::static_thread_pool> pool_;
    ReportCache cache_;
    std::atomic<std::uint64_t> cacheHits_{0};

    cppcoro::task<tbinfo::Report> analyzeOne(const std::string &fen) {
        co_await pool_->schedule();

        // Parsed positions are keyed by their normalized FEN, garbage by its text.
        const auto pos = analyzer_.rules().parse(fen);
        const std::string key = pos ? pos->fen : fen;

        {
            ReportCache::const_accessor acc;
            if (cache_.find(acc, key)) {
                cacheHits_.fetch_add(1, std::memory_order_relaxed);
                co_return acc->second;
            }
        }

        tbinfo::Report report = pos ? analyzer_.analyze(*pos) : analyzer_.analyze(fen);
        {
            ReportCache::accessor acc;
            if (cache_.insert(acc, key)) acc->second = report;
        }
        co_return report;
    }
};

} // namespace tbinfo_parallel
