#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include "bridge/RequestQueue.h"
#include "bridge/ReloadGeneration.h"

/**
 * @brief Host-thread pump step
 *
 * pump() is called once per host tick. It takes at most batchSize entries
 * from the queue, drops the ones that are stale, expired or abandoned, and
 * hands the rest to the request handler. No exception leaves pump().
 */
class Dispatcher {
public:
    using RequestHandler = std::function<BridgeResponse(const BridgePayload&)>;

    struct Options {
        size_t batchSize = 10;
        std::chrono::milliseconds staleAge{25000};
    };

    struct Stats {
        uint64_t handled = 0;
        uint64_t staleDropped = 0;
        uint64_t expiredDropped = 0;
        uint64_t abandonedDropped = 0;
        uint64_t handlerFaults = 0;
        uint64_t ticks = 0;
    };

    Dispatcher(RequestQueue& queue, const ReloadGeneration& generation, RequestHandler handler);
    Dispatcher(RequestQueue& queue, const ReloadGeneration& generation, RequestHandler handler, Options options);

    /**
     * @brief Process one batch
     * @return number of entries taken off the queue
     */
    size_t pump();

    Stats getStats() const;
    const Options& getOptions() const { return options; }

private:
    void process(const PendingRequestPtr& entry);

    RequestQueue& queue;
    const ReloadGeneration& generation;
    RequestHandler handler;
    Options options;

    mutable std::mutex statsMtx;
    Stats stats;
};
