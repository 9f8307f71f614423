#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "bridge/Dispatcher.h"

namespace {
BridgePayload call(const std::string& body) {
    return BridgePayload{"POST", "/mcp", body};
}
} // namespace

class DispatcherTest : public ::testing::Test {
protected:
    ReloadGeneration generation;
    RequestQueue queue{20, generation};
    std::vector<std::string> seen;

    Dispatcher::RequestHandler recorder() {
        return [this](const BridgePayload& payload) {
            seen.push_back(payload.body);
            return BridgeResponse::json(200, {{"echo", payload.body}});
        };
    }
};

TEST_F(DispatcherTest, HandlesInArrivalOrder) {
    Dispatcher dispatcher(queue, generation, recorder());
    std::vector<PendingRequestPtr> handles;
    for (const char* body : {"1", "2", "3"}) {
        handles.push_back(queue.enqueue(call(body)).handle);
    }

    EXPECT_EQ(dispatcher.pump(), 3u);
    EXPECT_EQ(seen, (std::vector<std::string>{"1", "2", "3"}));
    for (const auto& h : handles) {
        EXPECT_EQ(h->getStatus(), CompletionStatus::Handled);
    }
}

TEST_F(DispatcherTest, ProcessesAtMostOneBatchPerTick) {
    Dispatcher::Options options;
    options.batchSize = 10;
    Dispatcher dispatcher(queue, generation, recorder(), options);
    for (int i = 0; i < 15; ++i) queue.enqueue(call(std::to_string(i)));

    EXPECT_EQ(dispatcher.pump(), 10u);
    EXPECT_EQ(queue.size(), 5u);
    EXPECT_EQ(dispatcher.pump(), 5u);
    EXPECT_EQ(dispatcher.pump(), 0u);
    EXPECT_EQ(seen.size(), 15u);
    EXPECT_EQ(dispatcher.getStats().ticks, 3u);
}

TEST_F(DispatcherTest, NothingQueuedBeforeReloadReachesHandler) {
    Dispatcher dispatcher(queue, generation, recorder());
    std::vector<PendingRequestPtr> old;
    for (int i = 0; i < 5; ++i) old.push_back(queue.enqueue(call("old")).handle);

    queue.onReload();
    auto fresh = queue.enqueue(call("new")).handle;
    EXPECT_EQ(fresh->getGeneration(), 1u);

    dispatcher.pump();

    for (const auto& h : old) {
        EXPECT_EQ(h->getStatus(), CompletionStatus::StaleReload);
    }
    EXPECT_EQ(fresh->getStatus(), CompletionStatus::Handled);
    EXPECT_EQ(seen, std::vector<std::string>{"new"});
}

TEST_F(DispatcherTest, DropsEntryTaggedWithOldGeneration) {
    // Entry slipped past the queue with an old tag: the dispatcher still
    // refuses it.
    Dispatcher dispatcher(queue, generation, recorder());
    auto handle = queue.enqueue(call("old")).handle;
    generation.advance();

    dispatcher.pump();
    EXPECT_EQ(handle->getStatus(), CompletionStatus::StaleReload);
    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(dispatcher.getStats().staleDropped, 1u);
}

TEST_F(DispatcherTest, BuildStartReleasesQueuedAndHandlerNeverRuns) {
    Dispatcher dispatcher(queue, generation, recorder());
    std::vector<PendingRequestPtr> handles;
    for (int i = 0; i < 3; ++i) handles.push_back(queue.enqueue(call("x")).handle);

    queue.onBuildStarted();
    auto fourth = queue.enqueue(call("y"));
    EXPECT_EQ(fourth.reason, RejectReason::Building);

    dispatcher.pump();
    EXPECT_TRUE(seen.empty());
    for (const auto& h : handles) {
        EXPECT_EQ(h->getStatus(), CompletionStatus::StaleCompiling);
    }
}

TEST_F(DispatcherTest, DropsExpiredEntries) {
    Dispatcher::Options options;
    options.staleAge = std::chrono::milliseconds(20);
    Dispatcher dispatcher(queue, generation, recorder(), options);

    auto handle = queue.enqueue(call("late")).handle;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    dispatcher.pump();
    EXPECT_EQ(handle->getStatus(), CompletionStatus::Expired);
    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(dispatcher.getStats().expiredDropped, 1u);
}

TEST_F(DispatcherTest, SkipsAbandonedEntries) {
    Dispatcher dispatcher(queue, generation, recorder());
    auto handle = queue.enqueue(call("gone")).handle;
    EXPECT_EQ(queue.waitForCompletion(handle, std::chrono::milliseconds(1)), CompletionStatus::TimedOut);

    dispatcher.pump();
    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(handle->getStatus(), CompletionStatus::Abandoned);
    EXPECT_EQ(dispatcher.getStats().abandonedDropped, 1u);
}

TEST_F(DispatcherTest, HandlerExceptionBecomesErrorResponseAndPumpContinues) {
    Dispatcher dispatcher(queue, generation, [this](const BridgePayload& payload) {
        if (payload.body == "boom") throw std::runtime_error("kaboom");
        seen.push_back(payload.body);
        return BridgeResponse::json(200, {{"ok", true}});
    });

    auto bad = queue.enqueue(call("boom")).handle;
    auto good = queue.enqueue(call("fine")).handle;

    EXPECT_NO_THROW(dispatcher.pump());
    EXPECT_EQ(bad->getStatus(), CompletionStatus::Handled);
    EXPECT_EQ(bad->getResponse().status, 500);
    EXPECT_NE(bad->getResponse().body.find("kaboom"), std::string::npos);
    EXPECT_EQ(good->getResponse().status, 200);
    EXPECT_EQ(seen, std::vector<std::string>{"fine"});
    EXPECT_EQ(dispatcher.getStats().handlerFaults, 1u);
}

TEST_F(DispatcherTest, ListenerThreadsSeeTheirOwnResponses) {
    Dispatcher dispatcher(queue, generation, recorder());
    const int kCallers = 8;
    std::vector<std::thread> callers;
    std::vector<std::string> replies(kCallers);

    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([this, i, &replies] {
            auto result = queue.enqueue(call(std::to_string(i)));
            ASSERT_TRUE(result.accepted());
            auto status = queue.waitForCompletion(result.handle, std::chrono::seconds(5));
            ASSERT_EQ(status, CompletionStatus::Handled);
            replies[i] = result.handle->getResponse().body;
        });
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (seen.size() < static_cast<size_t>(kCallers) && std::chrono::steady_clock::now() < deadline) {
        dispatcher.pump();
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    for (auto& t : callers) t.join();

    for (int i = 0; i < kCallers; ++i) {
        auto body = nlohmann::json::parse(replies[i]);
        EXPECT_EQ(body["echo"], std::to_string(i));
    }
}
