#pragma once

#include "probe_backend.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tbinfo::syzygy {

// SyzygyProbe answers WDL (+2..-2) and DTZ50'' queries through Fathom.
// Positions with castling rights or more pieces than the largest loaded
// table are reported as "no data".
class SyzygyProbe : public ProbeBackend {
public:
    // tbPath: directory (or ':'-separated list) containing .rtbw and .rtbz files.
    explicit SyzygyProbe(const std::string &tbPath = "");
    ~SyzygyProbe() override;

    SyzygyProbe(const SyzygyProbe &) = delete;
    SyzygyProbe &operator=(const SyzygyProbe &) = delete;

    bool isAvailable() const noexcept override;

    // Largest piece count covered by the loaded tables (0 if none).
    unsigned largest() const noexcept { return largest_; }

    MoveProbes probe(const Position &pos) const override;

    std::optional<ProbeResult> probeRoot(const Position &pos) const override;

private:
    struct RootProbe {
        unsigned root = 0;
        std::vector<unsigned> moves;
    };

    std::string tbPath_;
    bool available_ = false;
    unsigned largest_ = 0;

    // Fathom's root probe keeps internal state and is not reentrant.
    mutable std::mutex probeMutex_;

    std::optional<RootProbe> probeRootImpl(const Position &pos) const;
};

} // namespace tbinfo::syzygy
