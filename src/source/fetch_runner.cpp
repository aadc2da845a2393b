#include "source/fetch_runner.hpp"
#include "core/utils.hpp"

#include <format>
#include <future>
#include <thread>

namespace errorengine {

namespace {

FetchResult guarded_fetch(ISourceAdapter& adapter, const std::string& query_text,
                          std::chrono::milliseconds timeout) {
    try {
        return adapter.fetch(query_text, timeout);
    } catch (const std::exception& e) {
        return FetchResult::failure(SourceErrorKind::CONNECTION,
            std::format("adapter '{}' threw: {}", adapter.name(), e.what()));
    }
}

} // anonymous namespace

FetchResult FetchRunner::run(std::shared_ptr<ISourceAdapter> adapter,
                             const std::string& query_text,
                             std::chrono::milliseconds timeout) {
    if (!adapter) {
        return FetchResult::failure(SourceErrorKind::CONFIGURATION, "no source adapter");
    }
    if (timeout.count() <= 0) {
        return guarded_fetch(*adapter, query_text, timeout);
    }

    auto promise = std::make_shared<std::promise<FetchResult>>();
    auto future = promise->get_future();

    std::thread worker([adapter, query_text, timeout, promise]() {
        promise->set_value(guarded_fetch(*adapter, query_text, timeout));
    });

    if (future.wait_for(timeout) == std::future_status::ready) {
        worker.join();
        return future.get();
    }

    worker.detach();
    utils::log::warn(std::format("Source '{}': fetch abandoned after {}ms",
        adapter->name(), timeout.count()));
    return FetchResult::failure(SourceErrorKind::TIMEOUT,
        std::format("fetch exceeded timeout of {}ms", timeout.count()));
}

} // namespace errorengine
