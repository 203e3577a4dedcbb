#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cleanmarkers {

inline constexpr std::string_view kStartMarker = ".......... START ..........";
inline constexpr std::string_view kEndMarker   = ".......... END ..........";

enum class MarkerKind {
    None,
    Start,
    End,
};

// Line numbers are 1-based and refer to the original content.
struct Span {
    size_t start_line{0};
    size_t end_line{0};
};

struct ScanResult {
    std::string cleaned;
    std::vector<Span> spans;
    bool changed{false};
    // START with no END after it; that region is kept as-is.
    std::optional<size_t> unterminated_line;
    std::vector<size_t> stray_end_lines;
};

// Surrounding whitespace (including a trailing CR) is ignored; the rest must
// equal a marker exactly.
MarkerKind classify_line(std::string_view line);

// Each element keeps its own terminator ("\n" or "\r\n"); the last one may have none.
std::vector<std::string_view> split_lines(std::string_view content);

ScanResult scan_markers(std::string_view content);

} // namespace cleanmarkers
