#include <boost/json.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "backtest.hpp"
#include "chain_state.hpp"
#include "config.hpp"
#include "fee_accrual.hpp"
#include "position_manager.hpp"
#include "price_source.hpp"
#include "recorder.hpp"
#include "time_utils.hpp"

namespace json = boost::json;
namespace fs = std::filesystem;

namespace {

struct RunJob {
    std::string tag;
    clmm::SimConfig cfg;
};

struct Options {
    fs::path config_path;
    std::optional<fs::path> prices_path;
    std::optional<fs::path> chain_path;
    std::optional<fs::path> out_path;
    std::optional<std::string> start;
    std::optional<std::string> end;
    std::optional<double> capital;
    bool fees_only{false};
    bool with_series{false};
    bool quiet{false};
    size_t limit{0};
    size_t threads{std::max<size_t>(1, std::thread::hardware_concurrency())};
};

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <config.json> --prices <prices.json> --chain <chain_state.json>\n"
              << "       [--start ISO] [--end ISO] [--limit N] [--threads N] [--series] [--quiet] [--out file]\n"
              << "       " << argv0 << " <config.json> --fees --chain <chain_state.json> --start ISO --end ISO [--capital USD]\n";
}

Options parse_cli(int argc, char** argv) {
    if (argc < 2 || argv[1][0] == '-') {
        usage(argv[0]);
        throw std::runtime_error("missing config path");
    }
    Options opts;
    opts.config_path = fs::absolute(fs::path(argv[1]));
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::runtime_error("missing value for " + arg);
            return argv[++i];
        };
        if (arg == "--prices") {
            opts.prices_path = fs::absolute(fs::path(next()));
        } else if (arg == "--chain") {
            opts.chain_path = fs::absolute(fs::path(next()));
        } else if (arg == "--out") {
            opts.out_path = fs::path(next());
        } else if (arg == "--start") {
            opts.start = next();
        } else if (arg == "--end") {
            opts.end = next();
        } else if (arg == "--capital") {
            opts.capital = std::strtod(next().c_str(), nullptr);
        } else if (arg == "--limit") {
            opts.limit = static_cast<size_t>(std::stoll(next()));
        } else if (arg == "--threads") {
            opts.threads = static_cast<size_t>(std::stoll(next()));
            if (opts.threads == 0) opts.threads = 1;
        } else if (arg == "--fees") {
            opts.fees_only = true;
        } else if (arg == "--series") {
            opts.with_series = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else {
            throw std::runtime_error("unknown argument: " + arg);
        }
    }
    if (!opts.chain_path) throw std::runtime_error("--chain is required");
    return opts;
}

// A config file is either one configuration or a base configuration with a
// "runs" array of per-run overrides.
std::vector<RunJob> load_runs(const fs::path& path, bool quiet) {
    const json::value root = json::parse(clmm::read_file(path));
    if (!root.is_object()) throw std::runtime_error("config must be a JSON object: " + path.string());
    const auto& obj = root.as_object();

    clmm::SimConfig base;
    clmm::apply_config(obj, base);
    if (quiet) base.verbose = false;

    std::vector<RunJob> runs;
    if (auto* arr = obj.if_contains("runs")) {
        for (const auto& entry : arr->as_array()) {
            RunJob job;
            job.cfg = base;
            clmm::apply_config(entry.as_object(), job.cfg);
            if (quiet) job.cfg.verbose = false;
            if (auto* t = entry.as_object().if_contains("tag")) job.tag = t->as_string().c_str();
            if (job.tag.empty()) job.tag = "run_" + std::to_string(runs.size());
            job.cfg.validate();
            runs.push_back(std::move(job));
        }
    }
    if (runs.empty()) {
        base.validate();
        runs.push_back({"run_0", base});
    }
    return runs;
}

json::object fee_result_to_json(const clmm::FeeResult& r) {
    json::object out;
    out["start_block"] = r.start_block;
    out["end_block"] = r.end_block;
    out["fees_token0_raw"] = r.fees_token0_raw;
    out["fees_token1_raw"] = r.fees_token1_raw;
    out["total_fees_usd"] = r.total_fees_usd;
    out["simulated_liquidity"] = r.liquidity;
    out["period_seconds"] = r.period_seconds;
    out["apr_percent"] = r.apr_percent;
    return out;
}

json::object run_fees(const RunJob& job, const Options& opts) {
    if (!opts.start || !opts.end) throw std::runtime_error("--fees needs --start and --end");
    auto recorded = clmm::RecordedChainState::load(*opts.chain_path);
    clmm::RetryingChainStateProvider chain(recorded, job.cfg.retry);
    clmm::FeeAccrualCalculator fees(chain, job.cfg);

    const int64_t start_ts = clmm::time_utils::to_epoch_utc(*opts.start);
    const int64_t end_ts = clmm::time_utils::to_epoch_utc(*opts.end);
    const double capital = opts.capital.value_or(job.cfg.initial_capital);
    const clmm::FeeResult r = fees.calculate_fees(start_ts, end_ts, capital);

    json::object run;
    run["tag"] = job.tag;
    run["capital"] = capital;
    run["fees"] = fee_result_to_json(r);
    return run;
}

json::object run_backtest(const RunJob& job, const Options& opts, const clmm::PriceSeries& prices) {
    auto recorded = clmm::RecordedChainState::load(*opts.chain_path);
    clmm::RetryingChainStateProvider chain(recorded, job.cfg.retry);
    clmm::FeeAccrualCalculator fees(chain, job.cfg);
    clmm::PositionLifecycleManager manager(job.cfg, fees);
    clmm::SeriesRecorder recorder;
    clmm::BacktestLoop loop(job.cfg, manager, recorder);

    const clmm::BacktestResult result = loop.run(prices);

    json::object run;
    run["tag"] = job.tag;
    run["pool"] = job.cfg.pool_name;
    run["base_asset"] = job.cfg.base_asset();
    run["quote_asset"] = job.cfg.quote_asset();
    run["config"] = clmm::config_to_json(job.cfg);
    run["result"] = result.to_json();
    run["chain_reads"] = static_cast<uint64_t>(recorded.reads());
    run["chain_retries"] = static_cast<uint64_t>(chain.retries());
    if (opts.with_series) run["series"] = recorder.to_json();
    return run;
}

} // namespace

int main(int argc, char** argv) {
    std::cout.setf(std::ios::unitbuf);
    try {
        const Options opts = parse_cli(argc, argv);
        const std::vector<RunJob> runs = load_runs(opts.config_path, opts.quiet);

        clmm::PriceSeries prices;
        if (!opts.fees_only) {
            if (!opts.prices_path) throw std::runtime_error("--prices is required for a backtest");
            if (!fs::exists(*opts.prices_path)) {
                throw std::runtime_error("price file not found: " + opts.prices_path->string());
            }
            prices = clmm::PriceSeries::load(*opts.prices_path, opts.limit);
            if (opts.start || opts.end) {
                const int64_t lo = opts.start ? clmm::time_utils::to_epoch_assume_utc(*opts.start) : INT64_MIN;
                const int64_t hi = opts.end ? clmm::time_utils::to_epoch_assume_utc(*opts.end) : INT64_MAX;
                prices = prices.window(lo, hi);
            }
            if (prices.samples().empty()) throw std::runtime_error("no price samples loaded");
            if (!opts.quiet) {
                std::cout << "Loaded " << runs.size() << " runs and " << prices.samples().size()
                          << " price samples from " << *opts.prices_path << "\n";
            }
        }

        const size_t thread_count = std::min(std::max<size_t>(1, opts.threads), runs.size());
        std::vector<json::object> summaries(runs.size());
        std::vector<std::string> failures(runs.size());
        std::atomic<size_t> next_idx{0};
        std::mutex io_mu;

        auto worker = [&]() {
            while (true) {
                const size_t idx = next_idx.fetch_add(1);
                if (idx >= runs.size()) break;
                const auto& job = runs[idx];
                try {
                    summaries[idx] = opts.fees_only ? run_fees(job, opts) : run_backtest(job, opts, prices);
                } catch (const std::exception& e) {
                    failures[idx] = e.what();
                }
                if (!opts.quiet) {
                    std::lock_guard<std::mutex> lk(io_mu);
                    std::cout << (failures[idx].empty() ? "completed " : "failed ") << job.tag
                              << " (" << (idx + 1) << "/" << runs.size() << ")\n";
                }
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (size_t t = 0; t < thread_count; ++t) threads.emplace_back(worker);
        for (auto& th : threads) th.join();

        for (size_t i = 0; i < runs.size(); ++i) {
            if (!failures[i].empty()) {
                throw std::runtime_error(runs[i].tag + ": " + failures[i]);
            }
        }

        json::object meta;
        meta["config"] = opts.config_path.string();
        meta["chain_state"] = opts.chain_path->string();
        if (opts.prices_path) meta["prices"] = opts.prices_path->string();
        meta["samples"] = static_cast<uint64_t>(prices.samples().size());
        meta["threads"] = static_cast<uint64_t>(thread_count);
        meta["mode"] = opts.fees_only ? "fees" : "backtest";

        json::object output;
        output["metadata"] = meta;
        json::array out_runs;
        out_runs.reserve(summaries.size());
        for (auto& r : summaries) out_runs.push_back(std::move(r));
        output["runs"] = std::move(out_runs);

        const std::string text = json::serialize(output);
        if (opts.out_path) {
            std::ofstream out(*opts.out_path);
            if (!out) throw std::runtime_error("failed to open output file: " + opts.out_path->string());
            out << text << "\n";
        } else {
            std::cout << text << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    }
}
