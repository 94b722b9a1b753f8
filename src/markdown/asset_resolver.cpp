#include "markdown/asset_resolver.hpp"

#include <QPromise>

namespace blockmark::markdown {

QFuture<std::optional<AssetResolution>> resolved(std::optional<AssetResolution> value) {
    QPromise<std::optional<AssetResolution>> promise;
    auto future = promise.future();
    promise.start();
    promise.addResult(std::move(value));
    promise.finish();
    return future;
}

QFuture<std::optional<AssetResolution>> resolution_failed(std::exception_ptr error) {
    QPromise<std::optional<AssetResolution>> promise;
    auto future = promise.future();
    promise.start();
    promise.setException(error);
    promise.finish();
    return future;
}

} // namespace blockmark::markdown
