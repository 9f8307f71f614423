#include "bridge/Dispatcher.h"
#include "utils/Logger.h"
#include <utility>

Dispatcher::Dispatcher(RequestQueue& queue, const ReloadGeneration& generation, RequestHandler handler)
    : Dispatcher(queue, generation, std::move(handler), Options{}) {}

Dispatcher::Dispatcher(RequestQueue& queue, const ReloadGeneration& generation, RequestHandler handler, Options options)
    : queue(queue), generation(generation), handler(std::move(handler)), options(options) {}

size_t Dispatcher::pump() {
    {
        std::lock_guard<std::mutex> lock(statsMtx);
        ++stats.ticks;
    }

    size_t processed = 0;
    while (processed < options.batchSize) {
        PendingRequestPtr entry = queue.dequeue();
        if (!entry) break;
        process(entry);
        ++processed;
    }
    return processed;
}

void Dispatcher::process(const PendingRequestPtr& entry) {
    auto& logger = Logger::getInstance();

    if (!generation.isCurrent(entry->getGeneration())) {
        entry->complete(CompletionStatus::StaleReload);
        std::lock_guard<std::mutex> lock(statsMtx);
        ++stats.staleDropped;
        return;
    }

    if (entry->getAge() > options.staleAge) {
        logger.debug("[Tether] Dropping expired request " + entry->getPayload().path + " (age " +
                     std::to_string(entry->getAge().count()) + "ms)");
        entry->complete(CompletionStatus::Expired);
        std::lock_guard<std::mutex> lock(statsMtx);
        ++stats.expiredDropped;
        return;
    }

    if (entry->isAbandoned()) {
        entry->complete(CompletionStatus::Abandoned);
        std::lock_guard<std::mutex> lock(statsMtx);
        ++stats.abandonedDropped;
        return;
    }

    BridgeResponse response;
    bool faulted = false;
    try {
        response = handler(entry->getPayload());
    } catch (const std::exception& e) {
        logger.warn(std::string("[Tether] Error handling request: ") + e.what());
        response = BridgeResponse::json(500, {{"error", e.what()}});
        faulted = true;
    } catch (...) {
        logger.warn("[Tether] Error handling request: non-standard exception");
        response = BridgeResponse::json(500, {{"error", "Internal error"}});
        faulted = true;
    }

    entry->complete(CompletionStatus::Handled, std::move(response));

    std::lock_guard<std::mutex> lock(statsMtx);
    ++stats.handled;
    if (faulted) ++stats.handlerFaults;
}

Dispatcher::Stats Dispatcher::getStats() const {
    std::lock_guard<std::mutex> lock(statsMtx);
    return stats;
}
