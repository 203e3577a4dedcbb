#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <cleanmarkers/config.hpp>

namespace cleanmarkers {

struct Options {
  Config config;
  std::vector<std::filesystem::path> roots;
  int verbosity = 0;
  std::optional<std::filesystem::path> log_file;
  size_t log_rotate_max = 10 * 1024 * 1024;
  size_t log_rotate_files = 3;
  bool help = false;
  bool version = false;
};

struct ParseResult {
  std::optional<Options> opts;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

void print_usage(const char *argv0);

std::vector<std::string> split_csv(const std::string &s);

} // namespace cleanmarkers
