#include "courtline/config.h"
#include "courtline/game_record.h"
#include "courtline/log.h"
#include "courtline/result_json.h"
#include "courtline/tracker.h"
#include "courtlinectl/cli_api.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
courtline::TrackerConfig resolve_config(const std::optional<fs::path>& path, bool verbose_flag) {
  courtline::TrackerConfig cfg;
  if (path.has_value()) {
    cfg = courtline::load_tracker_config(*path);
  }
  if (verbose_flag) {
    cfg.verbose = true;
  }
  courtline::log::set_verbose(cfg.verbose);
  return cfg;
}

bool run_tracker(const fs::path& game_path, courtline::LineupTracker& tracker) {
  courtline::GameRecord game;
  std::string error;
  if (!courtline::load_game_record(game_path, game, error)) {
    courtline::log::error("load failed: " + error);
    return false;
  }
  if (!tracker.process(game, error)) {
    courtline::log::error("game " + game.game_id + " failed: " + error);
    return false;
  }
  return true;
}

bool write_json_file(const fs::path& path, const json& value) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if (!out) return false;
  out << value.dump(2) << "\n";
  return static_cast<bool>(out);
}

bool parse_int(const std::string& text, int& out) {
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto result = std::from_chars(begin, end, out);
  return result.ec == std::errc() && result.ptr == end;
}
} // namespace

int track_game(const TrackOptions& opts, std::ostream& out) {
  const auto cfg = resolve_config(opts.config_path, opts.verbose);
  courtline::LineupTracker tracker(cfg);
  if (!run_tracker(opts.game_path, tracker)) {
    return 1;
  }

  const json doc = courtline::tracking_result_json(tracker.result());
  if (opts.out_path.has_value()) {
    if (!write_json_file(*opts.out_path, doc)) {
      courtline::log::error("could not write " + opts.out_path->string());
      return 1;
    }
    courtline::log::info("wrote " + opts.out_path->string());
  } else {
    out << doc.dump(2) << "\n";
  }

  const size_t lossy = tracker.result().lossy_count();
  if ((opts.strict || cfg.strict) && lossy > 0) {
    courtline::log::warn("strict: " + std::to_string(lossy) + " substitutions dropped or without effect");
    return 2;
  }
  return 0;
}

int query_game(const QueryOptions& opts, std::ostream& out) {
  const auto cfg = resolve_config(opts.config_path, opts.verbose);
  courtline::LineupTracker tracker(cfg);
  if (!run_tracker(opts.game_path, tracker)) {
    return 1;
  }

  courtline::OnCourtResult on_court;
  std::string error;
  if (!tracker.players_on_court(opts.period, opts.clock, on_court, error)) {
    courtline::log::error("query failed: " + error);
    return 1;
  }
  out << courtline::to_json(on_court).dump(2) << "\n";
  return 0;
}

void print_usage(std::ostream& out) {
  out << "Usage:\n"
      << "  courtlinectl track --game <file> [--config <file>] [--out <file>] [--strict] [--verbose]\n"
      << "  courtlinectl query --game <file> --period <n> --clock <PT..> [--config <file>] [--verbose]\n";
}

int run_cli(int argc, const char* const* argv, std::ostream& out) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 1;
  }

  const std::string command = argv[1];

  if (command == "track") {
    TrackOptions opts;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--game" && i + 1 < argc) {
        opts.game_path = fs::path(argv[++i]);
      } else if (arg == "--config" && i + 1 < argc) {
        opts.config_path = fs::path(argv[++i]);
      } else if (arg == "--out" && i + 1 < argc) {
        opts.out_path = fs::path(argv[++i]);
      } else if (arg == "--strict") {
        opts.strict = true;
      } else if (arg == "--verbose") {
        opts.verbose = true;
      } else {
        courtline::log::error("unknown argument: " + arg);
        print_usage(std::cerr);
        return 1;
      }
    }
    if (opts.game_path.empty()) {
      print_usage(std::cerr);
      return 1;
    }
    return track_game(opts, out);
  }

  if (command == "query") {
    QueryOptions opts;
    bool have_period = false;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--game" && i + 1 < argc) {
        opts.game_path = fs::path(argv[++i]);
      } else if (arg == "--config" && i + 1 < argc) {
        opts.config_path = fs::path(argv[++i]);
      } else if (arg == "--period" && i + 1 < argc) {
        have_period = parse_int(argv[++i], opts.period);
      } else if (arg == "--clock" && i + 1 < argc) {
        opts.clock = argv[++i];
      } else if (arg == "--verbose") {
        opts.verbose = true;
      } else {
        courtline::log::error("unknown argument: " + arg);
        print_usage(std::cerr);
        return 1;
      }
    }
    if (opts.game_path.empty() || !have_period || opts.clock.empty()) {
      print_usage(std::cerr);
      return 1;
    }
    return query_game(opts, out);
  }

  print_usage(std::cerr);
  return 1;
}

#ifndef COURTLINECTL_LIB
int main(int argc, char** argv) {
  courtline::log::init("courtlinectl", fs::current_path());
  courtline::log::install_crash_handlers();
  const int rc = run_cli(argc, argv, std::cout);
  courtline::log::shutdown();
  return rc;
}
#endif
