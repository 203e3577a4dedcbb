#include <cleanmarkers/age.hpp>
#include <cleanmarkers/cli.hpp>
#include <cleanmarkers/filter.hpp>

#include <fmt/format.h>

#include <cctype>
#include <string_view>

namespace cleanmarkers {

void print_usage(const char *argv0) {
  fmt::print(
      "Usage:\n"
      "  {} [options] <root-path>...\n"
      "\n"
      "Removes every block between a '{}' line and the next '{}' line.\n"
      "\n"
      "Options:\n"
      "  --ext=<csv>            extensions to process (default: md)\n"
      "  --exclude=<name>       directory names to prune, repeatable or csv (default: .git)\n"
      "  --age=<duration>       only files modified within e.g. 30m, 2h, 1d, 2.5w\n"
      "  --dry-run              report what would change, write nothing\n"
      "  --follow-symlinks      descend symlinked directories that stay under the root\n"
      "  --fail-fast            stop at the first file error\n"
      "  --jobs=<n>             worker threads (0 = all cores, default 1)\n"
      "  --log-file=<path>      log to a rotating file instead of stderr\n"
      "  --log-rotate-max=<n>   rotate after n bytes (default 10485760)\n"
      "  --log-rotate-files=<n> rotated files to keep (default 3)\n"
      "  -v, --verbose          more output, repeat for trace\n"
      "  -h, --help             show this help\n"
      "  --version              print version\n"
      "\n",
      argv0, ".......... START ..........", ".......... END ..........");
}

std::vector<std::string> split_csv(const std::string &s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) {
        out.push_back(cur);
        cur.clear();
      }
    } else if (!std::isspace(static_cast<unsigned char>(c))) {
      cur.push_back(c);
    }
  }
  if (!cur.empty())
    out.push_back(cur);
  return out;
}

static std::optional<unsigned long long> parse_uint(const std::string &s) {
  if (s.empty())
    return std::nullopt;
  unsigned long long v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return std::nullopt;
    v = v * 10 + static_cast<unsigned long long>(c - '0');
    if (v > 0xFFFFFFFFull)
      return std::nullopt;
  }
  return v;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  Options o;
  bool ext_given = false;
  bool exclude_given = false;
  bool options_done = false;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];

    if (options_done || a.empty() || a[0] != '-' || a == "-") {
      o.roots.emplace_back(a);
      continue;
    }
    if (a == "--") {
      options_done = true;
      continue;
    }

    std::string name = a;
    std::optional<std::string> value;
    auto eq = a.find('=');
    if (a.rfind("--", 0) == 0 && eq != std::string::npos) {
      name = a.substr(0, eq);
      value = a.substr(eq + 1);
    }

    auto take_value = [&]() -> std::optional<std::string> {
      if (value)
        return value;
      if (i + 1 < argc)
        return std::string(argv[++i]);
      return std::nullopt;
    };
    auto flag_only = [&]() -> bool {
      if (value) {
        r.error = name + ": takes no value";
        return false;
      }
      return true;
    };

    if (name == "-h" || name == "--help") {
      o.help = true;
    } else if (name == "--version") {
      o.version = true;
    } else if (name == "--dry-run") {
      if (!flag_only())
        return r;
      o.config.dry_run = true;
    } else if (name == "--follow-symlinks") {
      if (!flag_only())
        return r;
      o.config.follow_symlinks = true;
    } else if (name == "--fail-fast") {
      if (!flag_only())
        return r;
      o.config.fail_fast = true;
    } else if (name == "-v" || name == "--verbose") {
      if (!flag_only())
        return r;
      o.verbosity++;
    } else if (name.size() > 2 && name[0] == '-' && name[1] == 'v' &&
               name.find_first_not_of('v', 1) == std::string::npos) {
      o.verbosity += static_cast<int>(name.size() - 1);
    } else if (name == "--ext") {
      auto v = take_value();
      if (!v) {
        r.error = "--ext: value required";
        return r;
      }
      if (!ext_given) {
        o.config.extensions.clear();
        ext_given = true;
      }
      for (auto &e : split_csv(*v)) {
        auto n = PathFilter::normalize_ext(e);
        if (!n.empty())
          o.config.extensions.push_back(n);
      }
    } else if (name == "--exclude") {
      auto v = take_value();
      if (!v) {
        r.error = "--exclude: value required";
        return r;
      }
      if (!exclude_given) {
        o.config.excludes.clear();
        exclude_given = true;
      }
      for (auto &e : split_csv(*v))
        o.config.excludes.push_back(e);
    } else if (name == "--age") {
      auto v = take_value();
      if (!v) {
        r.error = "--age: value required";
        return r;
      }
      auto age = parse_age(*v);
      if (!age) {
        r.error = "--age: invalid duration '" + *v + "' (expected e.g. 30m, 2h, 1d, 2.5w)";
        return r;
      }
      o.config.max_age = *age;
    } else if (name == "--jobs" || name == "-j") {
      auto v = take_value();
      auto n = v ? parse_uint(*v) : std::nullopt;
      if (!n || *n > 1024) {
        r.error = "--jobs: expected a number between 0 and 1024";
        return r;
      }
      o.config.jobs = static_cast<unsigned>(*n);
    } else if (name == "--log-file") {
      auto v = take_value();
      if (!v || v->empty()) {
        r.error = "--log-file: path required";
        return r;
      }
      o.log_file = std::filesystem::path(*v);
    } else if (name == "--log-rotate-max") {
      auto v = take_value();
      auto n = v ? parse_uint(*v) : std::nullopt;
      if (!n || *n == 0) {
        r.error = "--log-rotate-max: expected a positive number of bytes";
        return r;
      }
      o.log_rotate_max = static_cast<size_t>(*n);
    } else if (name == "--log-rotate-files") {
      auto v = take_value();
      auto n = v ? parse_uint(*v) : std::nullopt;
      if (!n || *n == 0) {
        r.error = "--log-rotate-files: expected a positive number";
        return r;
      }
      o.log_rotate_files = static_cast<size_t>(*n);
    } else {
      r.error = "unknown option: " + a;
      return r;
    }
  }

  if (o.help || o.version) {
    r.opts = std::move(o);
    return r;
  }
  if (o.roots.empty()) {
    r.error = "at least one <root-path> is required";
    return r;
  }
  if (ext_given && o.config.extensions.empty()) {
    r.error = "--ext: no extensions given";
    return r;
  }
  o.config.verbose = o.verbosity > 0;
  r.opts = std::move(o);
  return r;
}

} // namespace cleanmarkers
