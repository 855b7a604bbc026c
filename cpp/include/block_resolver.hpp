#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "chain_state.hpp"

namespace clmm {

struct BlockSearchOptions {
    std::optional<double> approx_block_time;  // seconds per block; narrows the initial bracket
    int64_t tolerance_seconds{5};
    int max_tries{50};
};

// Maps wall-clock time to the first block whose timestamp is >= the target,
// by bisection over block numbers. Each probe is one provider read.
class BlockResolver {
public:
    explicit BlockResolver(ChainStateProvider& chain, bool verbose = false)
        : chain_(chain), verbose_(verbose) {}

    uint64_t resolve(int64_t target_ts, const BlockSearchOptions& opts = {}) const;

    // ISO-8601 calendar time; must carry a zone designator.
    uint64_t resolve(const std::string& target_time, const BlockSearchOptions& opts = {}) const;

    // Probes spent by the most recent resolve() call.
    int last_probe_count() const { return last_probes_; }

private:
    ChainStateProvider& chain_;
    bool verbose_;
    mutable int last_probes_{0};
};

} // namespace clmm
