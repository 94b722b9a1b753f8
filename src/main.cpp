#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#include <cstdio>
#include <optional>

#include "app/convert_command.hpp"
#include "app/logging.hpp"

namespace {

std::optional<QString> optional_value(const QCommandLineParser& parser, const QCommandLineOption& option) {
    if (!parser.isSet(option)) return std::nullopt;
    return parser.value(option);
}

int fail(const blockmark::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("blockmark");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Convert markdown into block API payloads."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Read defaults from an INI settings file."),
        QStringLiteral("path"));
    parser.addOption(configOption);

    const QCommandLineOption frontMatterOption(
        QStringList{QStringLiteral("front-matter")},
        QStringLiteral("Front matter handling: remove or keep-as-code."),
        QStringLiteral("mode"));
    parser.addOption(frontMatterOption);

    const QCommandLineOption highlightOption(
        QStringList{QStringLiteral("highlight-color")},
        QStringLiteral("Color for ==highlighted== text (e.g. yellow_background)."),
        QStringLiteral("color"));
    parser.addOption(highlightOption);

    const QCommandLineOption assetRootOption(
        QStringList{QStringLiteral("asset-root")},
        QStringLiteral("Directory relative image paths resolve against (default: the input's directory)."),
        QStringLiteral("dir"));
    parser.addOption(assetRootOption);

    const QCommandLineOption uploadsOption(
        QStringList{QStringLiteral("uploads")},
        QStringLiteral("JSON manifest mapping local files to upload ids."),
        QStringLiteral("path"));
    parser.addOption(uploadsOption);

    const QCommandLineOption planOption(
        QStringList{QStringLiteral("plan")},
        QStringLiteral("Print append batches with table rows deferred."));
    parser.addOption(planOption);

    const QCommandLineOption titleOption(
        QStringList{QStringLiteral("title")},
        QStringLiteral("Print the front matter title and exit."));
    parser.addOption(titleOption);

    const QCommandLineOption compactOption(
        QStringList{QStringLiteral("compact")},
        QStringLiteral("Print compact JSON."));
    parser.addOption(compactOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Enable blockmark.* debug logging."));
    parser.addOption(verboseOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append log output to a file instead of stderr."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    parser.addPositionalArgument(QStringLiteral("input"),
                                 QStringLiteral("Markdown file to convert ('-' or omitted reads stdin)."));
    parser.process(app);

    if (parser.isSet(planOption) && parser.isSet(titleOption)) {
        QTextStream(stderr) << "--plan and --title cannot be combined\n";
        return 1;
    }

    blockmark::app::CommandOptions options;
    const auto positional = parser.positionalArguments();
    options.input = positional.isEmpty() ? QString{} : positional.first();
    options.config = parser.value(configOption);
    options.front_matter = optional_value(parser, frontMatterOption);
    options.highlight_color = optional_value(parser, highlightOption);
    options.asset_root = optional_value(parser, assetRootOption);
    options.uploads = optional_value(parser, uploadsOption);
    options.log_file = optional_value(parser, logFileOption);
    options.compact = parser.isSet(compactOption);
    if (parser.isSet(planOption)) options.mode = blockmark::app::OutputMode::Plan;
    if (parser.isSet(titleOption)) options.mode = blockmark::app::OutputMode::Title;

    if (parser.isSet(verboseOption)) {
        blockmark::app::enable_verbose_logging();
    }

    auto settings = blockmark::app::effective_settings(options);
    if (settings.is_err()) {
        return fail(settings.unwrap_err());
    }

    const auto& log_file = settings.unwrap().log_file;
    if (!log_file.isEmpty() && !blockmark::app::install_file_logging(log_file)) {
        QTextStream(stderr) << "Cannot open log file " << log_file << ", logging to stderr\n";
    }

    auto input = blockmark::app::read_input(options.input);
    if (input.is_err()) {
        return fail(input.unwrap_err());
    }

    const bool from_stdin = options.input.isEmpty() || options.input == QStringLiteral("-");
    const auto input_dir = from_stdin ? QDir::currentPath() : QFileInfo(options.input).absolutePath();

    const auto output = blockmark::app::run_convert(
        input.unwrap(), settings.unwrap(), input_dir, options.mode, options.compact);
    if (output.is_err()) {
        return fail(output.unwrap_err());
    }

    QFile out;
    if (!out.open(stdout, QIODevice::WriteOnly)) {
        return 1;
    }
    const auto& bytes = output.unwrap();
    if (out.write(bytes) != bytes.size()) {
        QTextStream(stderr) << "Failed to write output\n";
        return 1;
    }
    return 0;
}
