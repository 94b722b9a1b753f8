#pragma once

#include "core/front_matter.hpp"
#include "core/result.hpp"
#include "core/rich_text.hpp"

#include <QString>

namespace blockmark::app {

/**
 * Settings - conversion defaults read from an INI file.
 *
 *   [convert]
 *   frontMatter=remove            ; or keep-as-code
 *   highlightColor=yellow_background
 *   [assets]
 *   root=/path/to/notes
 *   uploads=/path/to/uploads.json
 *   [logging]
 *   file=/tmp/blockmark.log
 *
 * Relative paths are taken relative to the settings file.
 */
struct Settings {
    FrontMatterHandling front_matter = FrontMatterHandling::Remove;
    Color highlight_color = Color::YellowBackground;
    QString asset_root;
    QString uploads_manifest;
    QString log_file;
};

/**
 * Load settings from `path`. An empty path yields the defaults. A missing
 * or unreadable file and invalid values are errors.
 */
[[nodiscard]] Res<Settings> load_settings(const QString& path);

} // namespace blockmark::app
