#include "app/convert_command.hpp"

#include "app/local_asset_resolver.hpp"
#include "payload/append_plan.hpp"
#include "payload/converter.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QLoggingCategory>

#include <cstdio>
#include <exception>
#include <memory>

Q_LOGGING_CATEGORY(blockmarkCliLog, "blockmark.cli")

namespace blockmark::app {

namespace {

Error input_error(const QString& message) {
    return Error{message.toStdString(), ErrorKind::InvalidInput};
}

QByteArray render(const QJsonDocument& doc, bool compact) {
    return doc.toJson(compact ? QJsonDocument::Compact : QJsonDocument::Indented);
}

} // namespace

Res<Settings> effective_settings(const CommandOptions& options) {
    auto loaded = load_settings(options.config);
    if (loaded.is_err()) {
        return loaded;
    }
    auto settings = std::move(loaded).unwrap();

    if (options.front_matter) {
        const auto parsed = parse_front_matter_handling(options.front_matter->toStdString());
        if (!parsed) {
            return Res<Settings>::err(input_error("Unknown front matter handling: " + *options.front_matter));
        }
        settings.front_matter = *parsed;
    }
    if (options.highlight_color) {
        const auto parsed = parse_color(options.highlight_color->toStdString());
        if (!parsed) {
            return Res<Settings>::err(input_error("Unknown highlight color: " + *options.highlight_color));
        }
        settings.highlight_color = *parsed;
    }
    if (options.asset_root) settings.asset_root = QDir(*options.asset_root).absolutePath();
    if (options.uploads) settings.uploads_manifest = QFileInfo(*options.uploads).absoluteFilePath();
    if (options.log_file) settings.log_file = QFileInfo(*options.log_file).absoluteFilePath();
    return Res<Settings>::ok(std::move(settings));
}

Res<std::string> read_input(const QString& path) {
    QFile file;
    bool opened = false;
    if (path.isEmpty() || path == QStringLiteral("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        const auto name = path.isEmpty() ? QStringLiteral("<stdin>") : path;
        return Res<std::string>::err(Error{("Cannot read input: " + name).toStdString(), ErrorKind::Io});
    }
    return Res<std::string>::ok(file.readAll().toStdString());
}

Res<QByteArray> run_convert(const std::string& markdown,
                            const Settings& settings,
                            const QString& input_dir,
                            OutputMode mode,
                            bool compact) {
    if (mode == OutputMode::Title) {
        const auto split = split_front_matter(markdown);
        const auto title = split.front_matter ? split.front_matter->get("title") : std::nullopt;
        return Res<QByteArray>::ok(QByteArray::fromStdString(title.value_or(std::string{})) + '\n');
    }

    payload::ConvertOptions options{
        .front_matter = settings.front_matter,
        .highlight_color = settings.highlight_color,
    };

    std::unique_ptr<LocalAssetResolver> resolver;
    if (!settings.uploads_manifest.isEmpty()) {
        auto manifest = load_upload_manifest(settings.uploads_manifest);
        if (manifest.is_err()) {
            return Res<QByteArray>::err(manifest.unwrap_err());
        }
        const auto root = settings.asset_root.isEmpty() ? input_dir : settings.asset_root;
        qCDebug(blockmarkCliLog) << "resolving local assets under" << root;
        resolver = std::make_unique<LocalAssetResolver>(root, std::move(manifest).unwrap());
        options.resolver = resolver.get();
    }

    try {
        if (mode == OutputMode::Plan) {
            const auto plan = payload::plan_append(payload::convert_blocks(markdown, options));
            qCInfo(blockmarkCliLog) << "planned" << plan.block_count() << "blocks in" << plan.batches.size() << "batches";
            return Res<QByteArray>::ok(render(QJsonDocument(payload::plan_to_json(plan)), compact));
        }
        const auto blocks = payload::convert(markdown, options);
        qCInfo(blockmarkCliLog) << "converted" << blocks.size() << "blocks";
        return Res<QByteArray>::ok(render(QJsonDocument(blocks), compact));
    } catch (const std::exception& e) {
        return Res<QByteArray>::err(Error{std::string("Conversion failed: ") + e.what()});
    }
}

} // namespace blockmark::app
