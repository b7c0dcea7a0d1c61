// main.cpp
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>
#include "utils.h"
#include "types.h"
#include "roster_generator.h"
#include "roster_io.h"

using json = nlohmann::json;
namespace fs = std::filesystem;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string request_path;       // required
  std::string config_path;        // required
  std::string out_path;           // optional, overrides RESULT_OUT
  std::string mode;               // optional, overrides request "mode" and OPTIMIZATION_MODE
  bool verbose = true;            // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  rota_cli --request request.json --config config.json [--out result.json] [--mode MODE] [--quiet]

Required:
  --request PATH
  --config PATH

Optional:
  --out PATH          Result file (default: RESULT_OUT from config, else result.json)
  --mode MODE         {ratio|min_staff|tasks|anneal}
  --quiet             Less logging
  --help

Exit codes:
  0 ok, 1 cannot load inputs, 2 usage, 3 configuration error,
  4 cannot write result, 5 generation failure
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--request") f.request_path = need("--request");
    else if (a == "--config")  f.config_path = need("--config");
    else if (a == "--out")     f.out_path = need("--out");
    else if (a == "--mode")    f.mode = need("--mode");
    else if (a == "--quiet")   f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.request_path.empty() || f.config_path.empty()) {
    std::cerr << "Missing required --request/--config.\n"; print_usage(); std::exit(2);
  }
  return f;
}

// ---------------- Small utils ----------------
static json load_json(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open file: " + path);
  json j; in >> j; return j;
}
static void save_json(const std::string& path, const json& j) {
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write file: " + path);
  out << std::setw(2) << j << "\n";
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  if (flags.verbose) std::cout << "🗓️  Rota generator\n";

  json request_json, cfg_json;
  try {
    request_json = load_json(flags.request_path);
    cfg_json = load_json(flags.config_path);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }

  rota::RosterRequest req;
  rota::EngineOptions opts;
  std::string result_out;
  try {
    opts = rota::parse_engine_options(cfg_json);
    if (!flags.verbose) opts.verbose = false;
    result_out = flags.out_path.empty() ? cfg_json.value("RESULT_OUT", std::string("result.json"))
                                        : flags.out_path;
    req = rota::parse_request(request_json, rota::parse_default_mode(cfg_json));
    if (!flags.mode.empty()) req.mode = rota::mode_from_string(flags.mode);
  } catch (const rota::ConfigError& e) {
    std::cerr << "Config error: " << e.what() << "\n"; return 3;
  } catch (const json::exception& e) {
    std::cerr << "Malformed input: " << e.what() << "\n"; return 3;
  }

  if (flags.verbose) {
    std::cout << "Mode: " << rota::to_string(req.mode)
              << " horizon=" << req.start_date << ".." << req.end_date
              << " people=" << req.people.size() << "\n";
  }

  rota::RosterResult result;
  const long long t0 = rota::NowMillis();
  try {
    result = rota::generate_roster(req, opts);
  } catch (const rota::ConfigError& e) {
    std::cerr << "Config error: " << e.what() << "\n"; return 3;
  } catch (const std::exception& e) {
    std::cerr << "Roster generation failed: " << e.what() << "\n"; return 5;
  }

  if (flags.verbose) {
    std::cout << "📋 Roster: " << result.roster.size() << " cells"
              << " floor=" << result.min_staff
              << " avg_staff=" << result.stats.avg_staff_per_day
              << " constraints=" << result.stats.constraint_stats.percentage << "%"
              << " (" << (rota::NowMillis() - t0) << " ms)\n";
    for (const auto& w : result.warnings) std::cout << "   ! " << w << "\n";
  }

  try { save_json(result_out, rota::result_to_json(result)); }
  catch (const std::exception& e) { std::cerr << "Failed to write result: " << e.what() << "\n"; return 4; }

  if (flags.verbose) std::cout << "✅ Result written to " << result_out << "\n";
  return 0;
}
