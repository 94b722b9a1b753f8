#pragma once

#include <QFuture>

#include <exception>
#include <optional>
#include <string>

namespace blockmark::markdown {

/**
 * AssetResolution - the uploaded handle for a local asset.
 */
struct AssetResolution {
    enum class Kind { Image, File };

    Kind kind = Kind::Image;
    std::string upload_id;
    std::optional<std::string> caption;

    bool operator==(const AssetResolution&) const = default;
};

/**
 * AssetResolver - maps a local asset reference (an image source that is
 * not an http(s) URL) to an uploaded-file handle. A future holding nullopt
 * means "leave the reference as an external link". Exceptions stored in
 * the future reach the caller of the conversion unchanged.
 *
 * The converter may call resolve() any number of times and waits for each
 * future before moving to the next node.
 */
class AssetResolver {
public:
    virtual ~AssetResolver() = default;

    [[nodiscard]] virtual QFuture<std::optional<AssetResolution>> resolve(const std::string& src) = 0;
};

/**
 * Already-finished futures, for resolvers that answer synchronously.
 */
[[nodiscard]] QFuture<std::optional<AssetResolution>> resolved(std::optional<AssetResolution> value);
[[nodiscard]] QFuture<std::optional<AssetResolution>> resolution_failed(std::exception_ptr error);

} // namespace blockmark::markdown
