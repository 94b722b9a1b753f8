#pragma once

#include "core/result.hpp"
#include "markdown/asset_resolver.hpp"

#include <QHash>
#include <QString>

namespace blockmark::app {

/**
 * Upload manifest: local file path (absolute, or relative to the asset
 * root) -> upload id, read from a flat JSON object.
 */
using UploadManifest = QHash<QString, QString>;

[[nodiscard]] Res<UploadManifest> load_upload_manifest(const QString& path);

/**
 * LocalAssetResolver - resolves local image sources against a directory
 * and a manifest of files that were already uploaded.
 *
 * A source starting with `/` is absolute, anything else is relative to the
 * asset root. Sources are percent-decoded first. Files that do not exist or
 * have no upload id resolve to nullopt.
 */
class LocalAssetResolver final : public markdown::AssetResolver {
public:
    LocalAssetResolver(QString root, UploadManifest uploads);

    [[nodiscard]] QFuture<std::optional<markdown::AssetResolution>> resolve(const std::string& src) override;

private:
    [[nodiscard]] std::optional<markdown::AssetResolution> lookup(const std::string& src) const;

    QString root_;
    UploadManifest uploads_;
};

/**
 * True for the image extensions the block API renders inline.
 */
[[nodiscard]] bool is_image_file(const QString& path);

} // namespace blockmark::app
