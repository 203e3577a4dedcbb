#include <cleanmarkers/walker.hpp>
#include <cleanmarkers/scanner.hpp>
#include <cleanmarkers/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stack>

namespace fs = std::filesystem;

namespace cleanmarkers {

const char* to_string(FileOutcome o){
    switch (o){
        case FileOutcome::Unchanged: return "unchanged";
        case FileOutcome::Changed:   return "changed";
        case FileOutcome::Error:     return "error";
    }
    return "unknown";
}

static bool is_within(const fs::path& p, const fs::path& base){
    auto s = p.string();
    auto b = base.string();
    if (s == b) return true;
    if (!b.empty() && b.back() != '/') b += '/';
    return s.rfind(b, 0) == 0;
}

Walker::Walker(Config cfg, FileOps ops)
: cfg_(std::move(cfg)), ops_(std::move(ops)), filter_(cfg_)
{
    if (!ops_.read) ops_.read = io::read_file;
    if (!ops_.write) ops_.write = io::write_file_atomic;
}

Walker::~Walker() = default;

bool Walker::validate_root(const fs::path& root, std::string& err){
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        err = ec ? ec.message() : "does not exist";
        return false;
    }
    if (!fs::is_directory(root, ec)) {
        err = "not a directory";
        return false;
    }
    fs::directory_iterator it(root, ec);
    if (ec) {
        err = ec.message();
        return false;
    }
    return true;
}

bool Walker::should_stop() const {
    if (abort_.load()) return true;
    return stop_ && stop_->load();
}

bool Walker::mark_dir_visited(const fs::path& dir){
    if (!cfg_.follow_symlinks) return true;
    std::error_code ec;
    auto can = fs::canonical(dir, ec);
    auto key = ec ? dir.lexically_normal().string() : can.string();
    return visited_dirs_.insert(key).second;
}

bool Walker::mark_file_seen(const fs::path& file){
    if (!cfg_.follow_symlinks) return true;
    std::error_code ec;
    auto can = fs::canonical(file, ec);
    auto key = ec ? file.lexically_normal().string() : can.string();
    std::lock_guard<std::mutex> lk(seen_mu_);
    return seen_files_.insert(key).second;
}

RunStats Walker::run(const std::vector<fs::path>& roots){
    std::atomic<bool> never{false};
    return run(roots, never);
}

RunStats Walker::run(const std::vector<fs::path>& roots, const std::atomic<bool>& stop_flag){
    stop_ = &stop_flag;
    abort_.store(false);
    scanned_ = 0; changed_ = 0; spans_ = 0; errors_ = 0;
    visited_dirs_.clear();
    seen_files_.clear();

    if (cfg_.jobs != 1) {
        pool_ = std::make_unique<ThreadPool>(cfg_.jobs);
        spdlog::debug("processing with {} workers", pool_->size());
    }

    for (const auto& root : roots) {
        if (should_stop()) break;
        walk_root(root);
    }

    if (pool_) {
        pool_->wait_idle();
        pool_.reset();
    }

    RunStats st;
    st.scanned = scanned_.load();
    st.changed = changed_.load();
    st.spans = spans_.load();
    st.errors = errors_.load();
    st.aborted = abort_.load();
    st.interrupted = stop_flag.load();
    stop_ = nullptr;
    return st;
}

void Walker::walk_root(const fs::path& root){
    spdlog::debug("walking {}", root.string());

    std::error_code ec;
    fs::path root_can = fs::canonical(root, ec);
    if (ec) root_can = fs::absolute(root).lexically_normal();

    std::stack<fs::path> dirs;
    dirs.push(root);
    mark_dir_visited(root);

    while (!dirs.empty()) {
        if (should_stop()) return;

        fs::path current = dirs.top();
        dirs.pop();

        std::vector<fs::directory_entry> entries;
        {
            std::error_code iec;
            fs::directory_iterator it(current, iec);
            if (iec) {
                spdlog::warn("cannot read directory {}: {}", current.string(), iec.message());
                continue;
            }
            while (it != fs::directory_iterator()) {
                entries.push_back(*it);
                it.increment(iec);
                if (iec) {
                    spdlog::warn("error listing {}: {}", current.string(), iec.message());
                    break;
                }
            }
        }
        std::sort(entries.begin(), entries.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b){ return a.path() < b.path(); });

        std::vector<fs::path> subdirs;

        for (const auto& entry : entries) {
            if (should_stop()) return;

            const auto& p = entry.path();
            std::error_code sec;
            auto lst = entry.symlink_status(sec);
            if (sec) {
                spdlog::warn("cannot stat {}: {}", p.string(), sec.message());
                continue;
            }

            fs::path target = p;
            bool is_dir = fs::is_directory(lst);
            bool is_file = fs::is_regular_file(lst);

            if (fs::is_symlink(lst)) {
                if (!cfg_.follow_symlinks) {
                    spdlog::debug("skip symlink: {}", p.string());
                    continue;
                }
                std::error_code cec;
                target = fs::canonical(p, cec);
                if (cec) {
                    spdlog::debug("skip dangling symlink: {}", p.string());
                    continue;
                }
                if (!is_within(target, root_can)) {
                    spdlog::warn("skip symlink leaving root: {} -> {}", p.string(), target.string());
                    continue;
                }
                auto st = fs::status(target, cec);
                is_dir = !cec && fs::is_directory(st);
                is_file = !cec && fs::is_regular_file(st);
            }

            if (is_dir) {
                if (filter_.is_excluded(p.filename())) {
                    spdlog::debug("prune: {}", p.string());
                    continue;
                }
                if (!mark_dir_visited(target)) {
                    spdlog::debug("already visited: {}", p.string());
                    continue;
                }
                subdirs.push_back(target);
            } else if (is_file) {
                std::string reason;
                if (!filter_.accepts_file(target, &reason)) {
                    if (reason.rfind("cannot stat", 0) == 0) {
                        spdlog::warn("skip {}: {}", p.string(), reason);
                        errors_++;
                        if (cfg_.fail_fast) abort_.store(true);
                    } else {
                        spdlog::trace("filtered ({}): {}", reason, p.string());
                    }
                    continue;
                }
                if (!mark_file_seen(target)) {
                    spdlog::debug("already processed: {}", p.string());
                    continue;
                }
                dispatch(target);
            } else {
                spdlog::trace("skip special file: {}", p.string());
            }
        }

        // reversed so the stack pops them in name order
        for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) dirs.push(*it);
    }
}

void Walker::dispatch(const fs::path& file){
    if (!pool_) {
        auto outcome = process_file(file);
        spdlog::trace("{}: {}", to_string(outcome), file.string());
        return;
    }
    pool_->submit([this, file]{
        if (should_stop()) return;
        auto outcome = process_file(file);
        spdlog::trace("{}: {}", to_string(outcome), file.string());
    });
}

FileOutcome Walker::process_file(const fs::path& p){
    scanned_++;

    std::string content, err;
    if (!ops_.read(p, content, err)) {
        spdlog::warn("skip {}: read failed: {}", p.string(), err);
        errors_++;
        if (cfg_.fail_fast) abort_.store(true);
        return FileOutcome::Error;
    }

    auto res = scan_markers(content);

    if (res.unterminated_line && cfg_.verbose) {
        spdlog::warn("unterminated marker in {} (line {})", p.string(), *res.unterminated_line);
    }
    for (auto ln : res.stray_end_lines) {
        spdlog::debug("END marker without START in {} (line {})", p.string(), ln);
    }

    if (!res.changed) {
        spdlog::debug("no markers: {}", p.string());
        return FileOutcome::Unchanged;
    }

    for (const auto& s : res.spans) {
        spdlog::trace("{}: span lines {}-{}", p.string(), s.start_line, s.end_line);
    }

    if (cfg_.dry_run) {
        spdlog::info("would remove {} span(s): {}", res.spans.size(), p.string());
    } else {
        if (!ops_.write(p, res.cleaned, err)) {
            spdlog::warn("skip {}: write failed: {}", p.string(), err);
            errors_++;
            if (cfg_.fail_fast) abort_.store(true);
            return FileOutcome::Error;
        }
        spdlog::info("removed {} span(s): {}", res.spans.size(), p.string());
    }

    changed_++;
    spans_ += res.spans.size();
    return FileOutcome::Changed;
}

} // namespace cleanmarkers
