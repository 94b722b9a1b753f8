#include "markdown/callout.hpp"

#include "markdown/md_node.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace blockmark::markdown {

namespace {

constexpr CalloutStyle kNoteStyle{"note", "📝", Color::GrayBackground};

constexpr std::array<CalloutStyle, 17> kCalloutStyles{{
    {"info", "💡", Color::BlueBackground},
    kNoteStyle,
    {"tip", "💡", Color::GreenBackground},
    {"hint", "💡", Color::GreenBackground},
    {"warning", "⚠️", Color::YellowBackground},
    {"caution", "⚠️", Color::YellowBackground},
    {"attention", "⚠️", Color::YellowBackground},
    {"error", "❌", Color::RedBackground},
    {"danger", "⛔", Color::RedBackground},
    {"failure", "❌", Color::RedBackground},
    {"fail", "❌", Color::RedBackground},
    {"success", "✅", Color::GreenBackground},
    {"check", "✅", Color::GreenBackground},
    {"done", "✅", Color::GreenBackground},
    {"question", "❓", Color::PurpleBackground},
    {"help", "🆘", Color::PurpleBackground},
    {"quote", "💬", Color::GrayBackground},
}};

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

bool is_ascii_alpha(char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

// Scanner over the first line: '[' '!' letters ']' [-+]? spaces title.
enum class State {
    OpenBracket,
    Bang,
    Type,
    Modifier,
    Title
};

} // namespace

CalloutStyle callout_style(std::string_view type) {
    const auto key = to_lower(type);
    for (const auto& style : kCalloutStyles) {
        if (style.keyword == key) return style;
    }
    return kNoteStyle;
}

std::string CalloutMatch::text() const {
    std::string out = title.empty() ? type : title;
    if (!body.empty()) {
        out += ' ';
        out += body;
    }
    return out;
}

std::optional<CalloutMatch> classify_callout(std::string_view plain) {
    const auto text = trim_copy(plain);
    const auto newline = text.find('\n');
    const std::string_view first_line = std::string_view(text).substr(0, newline);

    State state = State::OpenBracket;
    size_t type_start = 0;
    size_t type_end = 0;
    size_t i = 0;
    for (; i < first_line.size() && state != State::Title; ++i) {
        const char ch = first_line[i];
        switch (state) {
            case State::OpenBracket:
                if (ch != '[') return std::nullopt;
                state = State::Bang;
                break;
            case State::Bang:
                if (ch != '!') return std::nullopt;
                state = State::Type;
                type_start = i + 1;
                break;
            case State::Type:
                if (ch == ']') {
                    if (i == type_start) return std::nullopt;
                    type_end = i;
                    state = State::Modifier;
                } else if (!is_ascii_alpha(ch)) {
                    return std::nullopt;
                }
                break;
            case State::Modifier:
                state = State::Title;
                if (ch != '-' && ch != '+') --i;  // not a modifier; rescan as title
                break;
            case State::Title:
                break;
        }
    }
    if (state == State::OpenBracket || state == State::Bang || state == State::Type) {
        return std::nullopt;
    }

    CalloutMatch match;
    match.type = to_lower(first_line.substr(type_start, type_end - type_start));
    match.title = trim_copy(first_line.substr(std::min(i, first_line.size())));
    if (newline != std::string::npos) {
        match.body = trim_copy(std::string_view(text).substr(newline + 1));
    }
    match.style = callout_style(match.type);
    return match;
}

} // namespace blockmark::markdown
