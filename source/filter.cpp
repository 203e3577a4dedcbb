#include <cleanmarkers/filter.hpp>

#include <algorithm>
#include <cctype>

namespace cleanmarkers {

PathFilter::PathFilter(std::vector<std::string> extensions,
                       std::vector<std::string> excludes,
                       std::optional<std::chrono::seconds> max_age)
: excludes_(std::move(excludes)), max_age_(max_age)
{
    for (const auto& e : extensions) {
        auto n = normalize_ext(e);
        if (!n.empty() && std::find(extensions_.begin(), extensions_.end(), n) == extensions_.end())
            extensions_.push_back(std::move(n));
    }
}

PathFilter::PathFilter(const Config& cfg)
: PathFilter(cfg.extensions, cfg.excludes, cfg.max_age) {}

std::string PathFilter::normalize_ext(const std::string& ext){
    std::string s = ext;
    if (!s.empty() && s[0] == '.') s.erase(0, 1);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool PathFilter::is_excluded(const std::filesystem::path& p) const {
    if (excludes_.empty()) return false;
    for (const auto& part : p) {
        auto name = part.string();
        if (std::find(excludes_.begin(), excludes_.end(), name) != excludes_.end()) return true;
    }
    return false;
}

bool PathFilter::accepts_extension(const std::filesystem::path& p) const {
    if (extensions_.empty()) return true;
    auto ext = p.extension().string();
    if (ext.empty()) return false;
    return std::find(extensions_.begin(), extensions_.end(), normalize_ext(ext)) != extensions_.end();
}

bool PathFilter::accepts_age(std::filesystem::file_time_type mtime,
                             std::filesystem::file_time_type now) const {
    if (!max_age_) return true;
    return std::chrono::duration_cast<std::chrono::seconds>(now - mtime) <= *max_age_;
}

bool PathFilter::accepts_file(const std::filesystem::path& p, std::string* reason) const {
    if (!accepts_extension(p)) {
        if (reason) *reason = "extension";
        return false;
    }
    if (!max_age_) return true;

    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(p, ec);
    if (ec) {
        if (reason) *reason = "cannot stat: " + ec.message();
        return false;
    }
    if (!accepts_age(mtime, std::filesystem::file_time_type::clock::now())) {
        if (reason) *reason = "age";
        return false;
    }
    return true;
}

} // namespace cleanmarkers
