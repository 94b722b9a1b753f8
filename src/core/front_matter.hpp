#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace blockmark {

enum class FrontMatterHandling {
    Remove,
    KeepAsCode
};

[[nodiscard]] std::optional<FrontMatterHandling> parse_front_matter_handling(std::string_view name);

/**
 * FrontMatter - the `key: value` pairs of a leading `---` fenced block.
 * Only flat scalar pairs are read; nested YAML is ignored.
 */
struct FrontMatter {
    std::map<std::string, std::string> values;
    std::string raw;  // lines between the fences

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const {
        const auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }
};

struct FrontMatterSplit {
    std::optional<FrontMatter> front_matter;
    std::string body;
};

/**
 * Split a document into front matter and body. A document without an
 * opening `---` line or without a closing fence has no front matter and is
 * returned unchanged as the body.
 */
[[nodiscard]] FrontMatterSplit split_front_matter(std::string_view document);

/**
 * Apply the configured handling: Remove returns the body, KeepAsCode
 * prepends the front matter as a fenced yaml code block.
 */
[[nodiscard]] std::string apply_front_matter_handling(std::string_view document,
                                                      FrontMatterHandling handling);

} // namespace blockmark
