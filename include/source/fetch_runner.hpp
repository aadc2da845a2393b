#pragma once

#include "source/isource_adapter.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace errorengine {

/**
 * @brief Runs an adapter fetch on a worker thread with a hard deadline.
 *
 * On timeout the worker is detached and keeps the adapter alive until it
 * returns; its late result is discarded. The caller gets a TIMEOUT failure
 * immediately and nothing downstream ever sees partial data.
 */
class FetchRunner {
public:
    [[nodiscard]] static FetchResult run(std::shared_ptr<ISourceAdapter> adapter,
                                         const std::string& query_text,
                                         std::chrono::milliseconds timeout);
};

} // namespace errorengine
