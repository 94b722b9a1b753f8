#pragma once

#include "app/settings.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QString>

#include <optional>
#include <string>

namespace blockmark::app {

enum class OutputMode {
    Blocks,  // normalized block array
    Plan,    // append batches plus deferred table rows
    Title    // front matter title only
};

/**
 * Command line request. Unset optionals fall back to the settings file.
 */
struct CommandOptions {
    QString input;   // empty or "-" reads stdin
    QString config;
    std::optional<QString> front_matter;
    std::optional<QString> highlight_color;
    std::optional<QString> asset_root;
    std::optional<QString> uploads;
    std::optional<QString> log_file;
    OutputMode mode = OutputMode::Blocks;
    bool compact = false;
};

/**
 * Settings with the command line overrides applied. Invalid override
 * values are InvalidInput errors.
 */
[[nodiscard]] Res<Settings> effective_settings(const CommandOptions& options);

[[nodiscard]] Res<std::string> read_input(const QString& path);

/**
 * Run one conversion of `markdown` and render the requested output.
 * `input_dir` is the default asset root when none is configured.
 */
[[nodiscard]] Res<QByteArray> run_convert(const std::string& markdown,
                                          const Settings& settings,
                                          const QString& input_dir,
                                          OutputMode mode,
                                          bool compact = false);

} // namespace blockmark::app
