#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

struct TrackOptions {
  std::filesystem::path game_path;
  std::optional<std::filesystem::path> config_path;
  std::optional<std::filesystem::path> out_path;
  bool strict = false;
  bool verbose = false;
};

struct QueryOptions {
  std::filesystem::path game_path;
  std::optional<std::filesystem::path> config_path;
  int period = 0;
  std::string clock;
  bool verbose = false;
};

// Exit codes: 0 ok, 1 usage/load/structural failure, 2 strict mode with
// lossy diagnostics.
int track_game(const TrackOptions& opts, std::ostream& out);
int query_game(const QueryOptions& opts, std::ostream& out);
int run_cli(int argc, const char* const* argv, std::ostream& out);
void print_usage(std::ostream& out);
