#include <cleanmarkers/scanner.hpp>

namespace cleanmarkers {

static bool is_ws(char c){
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

static std::string_view trim(std::string_view s){
    size_t i = 0, j = s.size();
    while (i < j && is_ws(s[i])) ++i;
    while (j > i && is_ws(s[j-1])) --j;
    return s.substr(i, j - i);
}

MarkerKind classify_line(std::string_view line){
    auto t = trim(line);
    if (t == kStartMarker) return MarkerKind::Start;
    if (t == kEndMarker) return MarkerKind::End;
    return MarkerKind::None;
}

std::vector<std::string_view> split_lines(std::string_view content){
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos < content.size()) {
        auto nl = content.find('\n', pos);
        if (nl == std::string_view::npos) {
            lines.push_back(content.substr(pos));
            break;
        }
        lines.push_back(content.substr(pos, nl - pos + 1));
        pos = nl + 1;
    }
    return lines;
}

ScanResult scan_markers(std::string_view content){
    enum class State { Outside, Inside };

    ScanResult res;
    res.cleaned.reserve(content.size());

    State state = State::Outside;
    size_t span_start = 0;
    // Byte offset of the open START line; everything from here is restored
    // if the file ends before the matching END.
    size_t pending_offset = 0;

    size_t offset = 0;
    size_t lineno = 0;
    for (auto line : split_lines(content)) {
        ++lineno;
        auto kind = classify_line(line);
        switch (state) {
            case State::Outside:
                if (kind == MarkerKind::Start) {
                    state = State::Inside;
                    span_start = lineno;
                    pending_offset = offset;
                } else {
                    if (kind == MarkerKind::End) res.stray_end_lines.push_back(lineno);
                    res.cleaned.append(line);
                }
                break;
            case State::Inside:
                if (kind == MarkerKind::End) {
                    state = State::Outside;
                    res.spans.push_back(Span{span_start, lineno});
                }
                break;
        }
        offset += line.size();
    }

    if (state == State::Inside) {
        res.unterminated_line = span_start;
        res.cleaned.append(content.substr(pending_offset));
    }

    res.changed = !res.spans.empty();

    // Keep the "no newline at end of file" property when the last span ate the tail.
    if (res.changed && !content.empty() && content.back() != '\n' &&
        !res.cleaned.empty() && res.cleaned.back() == '\n') {
        res.cleaned.pop_back();
        if (!res.cleaned.empty() && res.cleaned.back() == '\r') res.cleaned.pop_back();
    }
    return res;
}

} // namespace cleanmarkers
