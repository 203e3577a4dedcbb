#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace cleanmarkers {

// "30m", "2h", "1.5d", "2w". Units: s m h d w, case-insensitive.
std::optional<std::chrono::seconds> parse_age(const std::string& text);

std::string format_age(std::chrono::seconds age);

} // namespace cleanmarkers
