#include "block_resolver.hpp"

#include <algorithm>
#include <iostream>

#include "errors.hpp"
#include "time_utils.hpp"

namespace clmm {

uint64_t BlockResolver::resolve(const std::string& target_time, const BlockSearchOptions& opts) const {
    return resolve(time_utils::to_epoch_utc(target_time), opts);
}

uint64_t BlockResolver::resolve(int64_t target_ts, const BlockSearchOptions& opts) const {
    last_probes_ = 0;

    const BlockHeader latest = chain_.latest_block();
    if (target_ts > latest.timestamp) {
        throw FutureTarget("target time " + time_utils::format_utc(target_ts) +
                           " is after the latest block (" + std::to_string(latest.number) +
                           " at " + time_utils::format_utc(latest.timestamp) + ")");
    }

    if (latest.timestamp - target_ts <= opts.tolerance_seconds) {
        return latest.number;
    }

    // Signed arithmetic so the window can be clamped at zero.
    const int64_t latest_num = static_cast<int64_t>(latest.number);
    int64_t low = 0;
    int64_t high = latest_num;
    if (opts.approx_block_time && *opts.approx_block_time > 0.0) {
        const int64_t blocks_back = static_cast<int64_t>(
            static_cast<double>(latest.timestamp - target_ts) / *opts.approx_block_time);
        const int64_t guess = std::clamp<int64_t>(latest_num - blocks_back, 0, latest_num);
        low = std::max<int64_t>(0, guess - 2 * blocks_back);
        high = std::min<int64_t>(latest_num, guess + 2 * blocks_back);
        if (low >= high) {
            low = 0;
            high = latest_num;
        }
    }

    int tries = 0;
    while (low < high && tries < opts.max_tries) {
        const int64_t mid = low + (high - low) / 2;
        const int64_t ts = chain_.block_timestamp(static_cast<uint64_t>(mid));
        ++last_probes_;

        if (ts < target_ts) {
            low = mid + 1;
        } else {
            high = mid;
        }
        if (verbose_) {
            std::cout << "  probe " << (tries + 1) << ": block " << mid << " ts=" << ts
                      << " -> [" << low << ", " << high << "]\n";
        }

        const int64_t err = ts > target_ts ? ts - target_ts : target_ts - ts;
        if (err <= opts.tolerance_seconds) {
            return static_cast<uint64_t>(mid);
        }
        ++tries;
    }

    if (low < high) {
        throw NoConvergence("block search for " + time_utils::format_utc(target_ts) +
                            " did not converge within " + std::to_string(opts.max_tries) +
                            " probes (bracket [" + std::to_string(low) + ", " +
                            std::to_string(high) + "])");
    }
    return static_cast<uint64_t>(low);
}

} // namespace clmm
