#include "app/settings.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>

namespace blockmark::app {

namespace {

constexpr auto kSettingsFrontMatter = "convert/frontMatter";
constexpr auto kSettingsHighlightColor = "convert/highlightColor";
constexpr auto kSettingsAssetRoot = "assets/root";
constexpr auto kSettingsUploads = "assets/uploads";
constexpr auto kSettingsLogFile = "logging/file";

QString string_value(const QSettings& settings, const char* key) {
    return settings.value(QString::fromLatin1(key), QString{}).toString().trimmed();
}

QString resolve_path(const QDir& base, const QString& value) {
    if (value.isEmpty()) return value;
    return QDir::cleanPath(base.absoluteFilePath(value));
}

Error config_error(const QString& message) {
    return Error{message.toStdString(), ErrorKind::InvalidConfig};
}

} // namespace

Res<Settings> load_settings(const QString& path) {
    Settings out;
    if (path.isEmpty()) {
        return Res<Settings>::ok(out);
    }

    const QFileInfo info(path);
    if (!info.isFile() || !info.isReadable()) {
        return Res<Settings>::err(Error{("Cannot read settings file: " + path).toStdString(), ErrorKind::Io});
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        return Res<Settings>::err(config_error("Malformed settings file: " + path));
    }

    const auto front_matter = string_value(settings, kSettingsFrontMatter);
    if (!front_matter.isEmpty()) {
        const auto parsed = parse_front_matter_handling(front_matter.toStdString());
        if (!parsed) {
            return Res<Settings>::err(config_error("Invalid convert/frontMatter: " + front_matter));
        }
        out.front_matter = *parsed;
    }

    const auto color = string_value(settings, kSettingsHighlightColor);
    if (!color.isEmpty()) {
        const auto parsed = parse_color(color.toStdString());
        if (!parsed) {
            return Res<Settings>::err(config_error("Invalid convert/highlightColor: " + color));
        }
        out.highlight_color = *parsed;
    }

    const QDir base = info.absoluteDir();
    out.asset_root = resolve_path(base, string_value(settings, kSettingsAssetRoot));
    out.uploads_manifest = resolve_path(base, string_value(settings, kSettingsUploads));
    out.log_file = resolve_path(base, string_value(settings, kSettingsLogFile));
    return Res<Settings>::ok(out);
}

} // namespace blockmark::app
