#pragma once
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <cleanmarkers/config.hpp>
#include <cleanmarkers/filter.hpp>
#include <cleanmarkers/io.hpp>

namespace cleanmarkers {

class ThreadPool;

enum class FileOutcome {
    Unchanged,
    Changed,
    Error,
};

const char* to_string(FileOutcome o);

struct RunStats {
    size_t scanned{0};
    size_t changed{0};
    size_t spans{0};
    size_t errors{0};
    bool interrupted{false};
    bool aborted{false};
};

class Walker {
public:
    explicit Walker(Config cfg, FileOps ops = default_file_ops());
    ~Walker();

    // Root must exist, be a directory and be listable.
    static bool validate_root(const std::filesystem::path& root, std::string& err);

    RunStats run(const std::vector<std::filesystem::path>& roots);
    RunStats run(const std::vector<std::filesystem::path>& roots,
                 const std::atomic<bool>& stop_flag);

    // Read, scan and (unless dry run) rewrite one file. Updates counters.
    FileOutcome process_file(const std::filesystem::path& p);

private:
    Config cfg_;
    FileOps ops_;
    PathFilter filter_;

    const std::atomic<bool>* stop_{nullptr};
    std::atomic<bool> abort_{false};

    std::atomic<size_t> scanned_{0};
    std::atomic<size_t> changed_{0};
    std::atomic<size_t> spans_{0};
    std::atomic<size_t> errors_{0};

    std::unique_ptr<ThreadPool> pool_;

    // Canonical paths, only tracked when following symlinks.
    std::set<std::string> visited_dirs_;
    std::mutex seen_mu_;
    std::set<std::string> seen_files_;

    bool should_stop() const;
    void walk_root(const std::filesystem::path& root);
    void dispatch(const std::filesystem::path& file);
    bool mark_dir_visited(const std::filesystem::path& dir);
    bool mark_file_seen(const std::filesystem::path& file);
};

} // namespace cleanmarkers
