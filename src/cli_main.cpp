#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "gearopt/core/gear_tree.h"
#include "gearopt/core/heuristics.h"
#include "gearopt/core/optimizer.h"
#include "gearopt/core/result.h"
#include "gearopt/core/result_analysis.h"
#include "gearopt/core/serialization.h"
#include "gearopt/util/file_io.h"
#include "gearopt/util/json.h"
#include "gearopt/util/log.h"
#include "gearopt/util/strings.h"

namespace {

#ifndef GEAROPT_VERSION
#define GEAROPT_VERSION "unknown"
#endif

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

bool is_digits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Non-negative integer flag. Returns false on a malformed value.
bool get_uint_arg(int argc, char** argv, const std::string& key, std::uint64_t def, std::uint64_t& out) {
  const std::string raw = get_str_arg(argc, argv, key, "");
  if (raw.empty()) {
    out = def;
    return true;
  }
  if (!is_digits(raw) || raw.size() > 19) return false;
  out = std::stoull(raw);
  return true;
}

void print_usage(const char* exe) {
  std::cout << "gearopt CLI v" << GEAROPT_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "gearopt_cli") << " --job PATH [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --job PATH         Job JSON (settings, combinations, optional chunks)\n";
  std::cout << "  --out PATH         Write results JSON to PATH (default: stdout)\n";
  std::cout << "  --heuristics       Benchmark combinations and drop unpromising ones first\n";
  std::cout << "  --seed N           RNG seed for --heuristics (default: 1)\n";
  std::cout << "  --threads N        Worker threads over chunks (default: 1)\n";
  std::cout << "  --split-depth N    Chunk prefix length when the job has no chunks (default: 1)\n";
  std::cout << "  --progress         Print PROGRESS JSON lines to stderr\n";
  std::cout << "  --analyze          Attach stat analysis to each result\n";
  std::cout << "  --log-level LVL    debug|info|warn|error|off (default: info)\n";
  std::cout << "  --quiet            Suppress the summary line\n";
  std::cout << "  --version          Print version and exit\n";
  std::cout << "  --help             Show this help\n";
}

// Serializes snapshots from all workers onto stderr, one JSON document per line.
class StderrProgressSink : public gearopt::ProgressSink {
 public:
  explicit StderrProgressSink(std::uint64_t total) : total_(total) {}

  void on_progress(const gearopt::ProgressSnapshot& snapshot) override {
    gearopt::ProgressSnapshot s = snapshot;
    s.total = total_;
    const std::string line = gearopt::json::stringify(gearopt::progress_to_json(s), 0);
    std::lock_guard<std::mutex> lock(mu_);
    std::cerr << line << "\n";
  }

 private:
  std::uint64_t total_{0};
  std::mutex mu_;
};

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << GEAROPT_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string job_path = get_str_arg(argc, argv, "--job", "");
    const std::string out_path = get_str_arg(argc, argv, "--out", "");
    const bool quiet = has_flag(argc, argv, "--quiet");
    const bool use_heuristics = has_flag(argc, argv, "--heuristics");
    const bool show_progress = has_flag(argc, argv, "--progress");
    const bool analyze = has_flag(argc, argv, "--analyze");

    std::uint64_t seed = 1;
    std::uint64_t threads = 1;
    std::uint64_t split_depth = 1;
    if (!get_uint_arg(argc, argv, "--seed", 1, seed) || !get_uint_arg(argc, argv, "--threads", 1, threads) ||
        !get_uint_arg(argc, argv, "--split-depth", 1, split_depth)) {
      std::cerr << "--seed, --threads and --split-depth expect non-negative integers\n\n";
      print_usage(argv[0]);
      return 2;
    }
    if (threads == 0) threads = 1;

    const std::string level_raw = get_str_arg(argc, argv, "--log-level", "");
    if (!level_raw.empty()) {
      gearopt::log::Level lvl = gearopt::log::Level::Info;
      if (!gearopt::log::parse_level(level_raw, lvl)) {
        std::cerr << "Unknown --log-level: " << level_raw << "\n\n";
        print_usage(argv[0]);
        return 2;
      }
      gearopt::log::set_level(lvl);
    }

    if (job_path.empty()) {
      std::cerr << "--job is required\n\n";
      print_usage(argv[0]);
      return 2;
    }

    gearopt::SearchJob job = gearopt::search_job_from_json_text(gearopt::read_text_file(job_path));
    const gearopt::Settings& settings = job.settings;

    std::vector<gearopt::Combination> combinations = job.combinations;
    if (use_heuristics) {
      gearopt::HeuristicOptions hopts;
      hopts.seed = seed;
      const auto picked = gearopt::select_combinations_by_heuristic(settings, combinations, hopts);
      if (picked.empty()) {
        gearopt::log::warn("Heuristics picked no combination; searching all of them");
      } else {
        std::vector<gearopt::Combination> kept;
        kept.reserve(picked.size());
        for (const std::uint32_t idx : picked) kept.push_back(combinations[idx]);
        combinations = std::move(kept);
      }
    }

    const std::vector<gearopt::Gear> chunks =
        job.has_chunks ? job.chunks
                       : gearopt::make_chunks(settings.affixes_array, static_cast<std::size_t>(settings.slots),
                                              static_cast<std::size_t>(split_depth));

    const auto errors = gearopt::validate_search_inputs(chunks, settings, combinations);
    if (!errors.empty()) {
      std::cerr << "Job validation failed:\n";
      for (const auto& e : errors) std::cerr << "  - " << e << "\n";
      return 1;
    }

    const std::uint64_t total = gearopt::total_evaluations(chunks, settings, combinations.size());
    StderrProgressSink sink(total);
    gearopt::ProgressSink* sink_ptr = show_progress ? &sink : nullptr;

    const auto buckets = gearopt::split_chunks_round_robin(chunks, static_cast<std::size_t>(threads));
    std::vector<gearopt::SearchOutcome> outcomes(
        buckets.size(),
        gearopt::SearchOutcome{gearopt::ResultCollector(static_cast<std::size_t>(settings.max_results), settings.rankby)});
    std::vector<std::exception_ptr> failures(buckets.size());

    if (buckets.size() <= 1) {
      if (!buckets.empty()) outcomes[0] = gearopt::run_search(buckets[0], settings, combinations, {}, sink_ptr);
    } else {
      std::vector<std::thread> workers;
      workers.reserve(buckets.size());
      for (std::size_t w = 0; w < buckets.size(); ++w) {
        workers.emplace_back([&, w]() {
          try {
            outcomes[w] = gearopt::run_search(buckets[w], settings, combinations, {}, sink_ptr);
          } catch (...) {
            failures[w] = std::current_exception();
          }
        });
      }
      for (auto& t : workers) t.join();
      for (const auto& f : failures) {
        if (f) std::rethrow_exception(f);
      }
    }

    gearopt::ResultCollector merged(static_cast<std::size_t>(settings.max_results), settings.rankby);
    std::uint64_t evaluations = 0;
    std::uint64_t invalid = 0;
    std::uint64_t anomalies = 0;
    for (const auto& o : outcomes) {
      merged.merge(o.results);
      evaluations += o.evaluations;
      invalid += o.invalid;
      anomalies += o.anomalies;
    }

    const gearopt::CompactedResults compacted = gearopt::compact_results(merged.characters(), combinations);
    std::vector<gearopt::CharacterAnalysis> analyses;
    if (analyze) {
      analyses.reserve(compacted.characters.size());
      for (const auto& c : compacted.characters) {
        analyses.push_back(gearopt::analyze_character(c, settings, compacted.combinations[c.combination_id]));
      }
    }

    const std::string out = gearopt::json::stringify(gearopt::results_to_json(compacted, analyses), 2) + "\n";
    if (out_path.empty()) {
      std::cout << out;
    } else {
      gearopt::write_text_file(out_path, out);
    }

    if (!quiet) {
      std::cerr << "Evaluated " << evaluations << " of " << total << " (invalid " << invalid << ", anomalies "
                << anomalies << "); kept " << merged.size() << " result(s) from " << combinations.size()
                << " combination(s)";
      if (!merged.empty()) {
        std::cerr << "; best " << gearopt::attribute_to_string(settings.rankby) << " "
                  << gearopt::format_fixed(merged.characters().front().rank_value(), 2);
      }
      if (!out_path.empty()) std::cerr << "; written to " << out_path;
      std::cerr << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    gearopt::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
