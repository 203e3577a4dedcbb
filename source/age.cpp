#include <cleanmarkers/age.hpp>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>

namespace cleanmarkers {

static long long unit_seconds(char u){
    switch (std::tolower(static_cast<unsigned char>(u))) {
        case 's': return 1;
        case 'm': return 60;
        case 'h': return 3600;
        case 'd': return 86400;
        case 'w': return 604800;
    }
    return 0;
}

std::optional<std::chrono::seconds> parse_age(const std::string& text){
    if (text.size() < 2) return std::nullopt;

    long long mult = unit_seconds(text.back());
    if (mult == 0) return std::nullopt;

    std::string num = text.substr(0, text.size() - 1);
    size_t i = 0;
    size_t int_digits = 0;
    while (i < num.size() && std::isdigit(static_cast<unsigned char>(num[i]))) { ++i; ++int_digits; }
    if (int_digits == 0) return std::nullopt;
    if (i < num.size()) {
        if (num[i] != '.') return std::nullopt;
        ++i;
        size_t frac_digits = 0;
        while (i < num.size() && std::isdigit(static_cast<unsigned char>(num[i]))) { ++i; ++frac_digits; }
        if (frac_digits == 0 || i != num.size()) return std::nullopt;
    }

    // Ages must fit the file clock's duration, or comparing against mtimes overflows.
    const auto limit = std::chrono::duration_cast<std::chrono::seconds>(
        std::filesystem::file_time_type::duration::max()).count();

    double value = std::strtod(num.c_str(), nullptr);
    double secs = value * static_cast<double>(mult);
    if (!std::isfinite(secs) || secs > static_cast<double>(limit)) return std::nullopt;
    return std::chrono::seconds(std::llround(secs));
}

std::string format_age(std::chrono::seconds age){
    auto s = age.count();
    if (s != 0 && s % 604800 == 0) return fmt::format("{}w", s / 604800);
    if (s != 0 && s % 86400 == 0)  return fmt::format("{}d", s / 86400);
    if (s != 0 && s % 3600 == 0)   return fmt::format("{}h", s / 3600);
    if (s != 0 && s % 60 == 0)     return fmt::format("{}m", s / 60);
    return fmt::format("{}s", s);
}

} // namespace cleanmarkers
