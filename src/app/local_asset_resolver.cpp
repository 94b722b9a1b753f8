#include "app/local_asset_resolver.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QUrl>

Q_LOGGING_CATEGORY(blockmarkAssetsLog, "blockmark.assets")

namespace blockmark::app {

namespace {

const QStringList kImageSuffixes = {
    QStringLiteral("png"), QStringLiteral("jpg"), QStringLiteral("jpeg"), QStringLiteral("gif"),
    QStringLiteral("bmp"), QStringLiteral("svg"), QStringLiteral("webp"), QStringLiteral("avif"),
};

} // namespace

Res<UploadManifest> load_upload_manifest(const QString& path) {
    if (path.isEmpty()) {
        return Res<UploadManifest>::ok(UploadManifest{});
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Res<UploadManifest>::err(Error{("Cannot open upload manifest: " + path).toStdString(), ErrorKind::Io});
    }

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return Res<UploadManifest>::err(Error{
            ("Upload manifest is not a JSON object: " + path).toStdString(), ErrorKind::InvalidConfig});
    }

    UploadManifest out;
    const auto obj = doc.object();
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!it.value().isString()) {
            return Res<UploadManifest>::err(Error{
                ("Upload id for " + it.key() + " is not a string").toStdString(), ErrorKind::InvalidConfig});
        }
        out.insert(QDir::cleanPath(it.key()), it.value().toString());
    }
    return Res<UploadManifest>::ok(std::move(out));
}

bool is_image_file(const QString& path) {
    return kImageSuffixes.contains(QFileInfo(path).suffix().toLower());
}

LocalAssetResolver::LocalAssetResolver(QString root, UploadManifest uploads)
    : root_(std::move(root)), uploads_(std::move(uploads)) {
}

QFuture<std::optional<markdown::AssetResolution>> LocalAssetResolver::resolve(const std::string& src) {
    return markdown::resolved(lookup(src));
}

std::optional<markdown::AssetResolution> LocalAssetResolver::lookup(const std::string& src) const {
    const auto decoded = QUrl::fromPercentEncoding(QByteArray::fromStdString(src));
    const QDir root(root_.isEmpty() ? QDir::currentPath() : root_);
    const auto path = decoded.startsWith(QLatin1Char('/'))
        ? QDir::cleanPath(decoded)
        : QDir::cleanPath(root.absoluteFilePath(decoded));

    if (!QFileInfo::exists(path)) {
        qCWarning(blockmarkAssetsLog) << "local asset not found:" << path;
        return std::nullopt;
    }

    auto id = uploads_.value(path);
    if (id.isEmpty()) id = uploads_.value(root.relativeFilePath(path));
    if (id.isEmpty()) {
        qCWarning(blockmarkAssetsLog) << "no upload id for" << path << "- keeping external link";
        return std::nullopt;
    }

    const auto kind = is_image_file(path)
        ? markdown::AssetResolution::Kind::Image
        : markdown::AssetResolution::Kind::File;
    qCDebug(blockmarkAssetsLog) << "resolved" << path << "to upload" << id;
    return markdown::AssetResolution{kind, id.toStdString(), std::nullopt};
}

} // namespace blockmark::app
