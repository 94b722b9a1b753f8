#include "core/front_matter.hpp"

#include <vector>

namespace blockmark {

namespace {

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (true) {
        const auto nl = text.find('\n', pos);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string_view>& lines, size_t from, size_t to) {
    std::string out;
    for (size_t i = from; i < to; ++i) {
        if (i > from) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string unquote(std::string_view value) {
    if (value.size() >= 2) {
        const char q = value.front();
        if ((q == '"' || q == '\'') && value.back() == q) {
            return std::string(value.substr(1, value.size() - 2));
        }
    }
    return std::string(value);
}

} // namespace

std::optional<FrontMatterHandling> parse_front_matter_handling(std::string_view name) {
    if (name == "remove") return FrontMatterHandling::Remove;
    if (name == "keep-as-code") return FrontMatterHandling::KeepAsCode;
    return std::nullopt;
}

FrontMatterSplit split_front_matter(std::string_view document) {
    if (document.substr(0, 4) != "---\n" && document.substr(0, 5) != "---\r\n") {
        return FrontMatterSplit{std::nullopt, std::string(document)};
    }

    const auto lines = split_lines(document);
    size_t close = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (trim(lines[i]) == "---") {
            close = i;
            break;
        }
    }
    if (close == 0) {
        return FrontMatterSplit{std::nullopt, std::string(document)};
    }

    FrontMatter fm;
    fm.raw = join_lines(lines, 1, close);
    for (size_t i = 1; i < close; ++i) {
        const auto line = trim(lines[i]);
        if (line.empty() || line.front() == '#') continue;
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        const auto key = trim(line.substr(0, colon));
        if (key.empty()) continue;
        fm.values[std::string(key)] = unquote(trim(line.substr(colon + 1)));
    }

    return FrontMatterSplit{std::move(fm), join_lines(lines, close + 1, lines.size())};
}

std::string apply_front_matter_handling(std::string_view document, FrontMatterHandling handling) {
    auto split = split_front_matter(document);
    if (!split.front_matter) {
        return std::move(split.body);
    }
    switch (handling) {
        case FrontMatterHandling::Remove:
            return std::move(split.body);
        case FrontMatterHandling::KeepAsCode:
            return "```yaml\n" + split.front_matter->raw + "\n```\n\n" + split.body;
    }
    return std::move(split.body);
}

} // namespace blockmark
