#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <cleanmarkers/config.hpp>

namespace cleanmarkers {

class PathFilter {
public:
    PathFilter(std::vector<std::string> extensions,
               std::vector<std::string> excludes,
               std::optional<std::chrono::seconds> max_age);
    explicit PathFilter(const Config& cfg);

    // True if any component of p equals an excluded name (case-sensitive).
    bool is_excluded(const std::filesystem::path& p) const;
    bool accepts_extension(const std::filesystem::path& p) const;
    bool accepts_age(std::filesystem::file_time_type mtime,
                     std::filesystem::file_time_type now) const;

    // Extension first, then mtime; a failed stat rejects and fills reason.
    bool accepts_file(const std::filesystem::path& p, std::string* reason = nullptr) const;

    const std::vector<std::string>& extensions() const { return extensions_; }
    const std::vector<std::string>& excludes() const { return excludes_; }

    static std::string normalize_ext(const std::string& ext);

private:
    std::vector<std::string> extensions_;
    std::vector<std::string> excludes_;
    std::optional<std::chrono::seconds> max_age_;
};

} // namespace cleanmarkers
