#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cleanmarkers {

struct Config {
    std::vector<std::string> extensions{"md"};
    std::vector<std::string> excludes{".git"};
    std::optional<std::chrono::seconds> max_age;
    bool dry_run = false;
    bool verbose = false;
    bool follow_symlinks = false;
    bool fail_fast = false;
    unsigned jobs = 1;
};

} // namespace cleanmarkers
