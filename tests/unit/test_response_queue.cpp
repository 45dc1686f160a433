#include <gtest/gtest.h>
#include "chunkpipe/transfer/response_queue.hpp"
#include "chunkpipe/transfer/cancel_signal.hpp"
#include <atomic>
#include <thread>

using namespace chunkpipe::transfer;
using chunkpipe::network::ReadResponse;
using chunkpipe::network::ResponsePtr;

namespace {

ResponsePtr make_response(chunkpipe::network::RequestId id) {
    auto response = std::make_shared<ReadResponse>();
    response->request_id = id;
    return response;
}

}

class ResponseQueueTest : public ::testing::Test {};

TEST_F(ResponseQueueTest, FifoOrder) {
    ResponseQueue queue(4);
    ASSERT_TRUE(queue.push(make_response(1)));
    ASSERT_TRUE(queue.push(make_response(2)));
    
    ResponsePtr out;
    EXPECT_EQ(queue.pop(out), PopStatus::ITEM);
    EXPECT_EQ(out->request_id, 1u);
    EXPECT_EQ(queue.pop(out), PopStatus::ITEM);
    EXPECT_EQ(out->request_id, 2u);
    EXPECT_EQ(queue.size(), 0u);
}

TEST_F(ResponseQueueTest, PopTimesOut) {
    ResponseQueue queue(4);
    ResponsePtr out;
    
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(queue.pop(out, std::chrono::milliseconds(30)), PopStatus::TIMED_OUT);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(30));
}

TEST_F(ResponseQueueTest, InterruptWakesBlockedPop) {
    ResponseQueue queue(4);
    std::atomic<PopStatus> status{PopStatus::ITEM};
    
    std::thread consumer([&]() {
        ResponsePtr out;
        status = queue.pop(out);
    });
    
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.interrupt();
    consumer.join();
    
    EXPECT_EQ(status, PopStatus::INTERRUPTED);
}

TEST_F(ResponseQueueTest, InterruptWinsOverQueuedItems) {
    ResponseQueue queue(4);
    ASSERT_TRUE(queue.push(make_response(1)));
    queue.interrupt();
    
    ResponsePtr out;
    EXPECT_EQ(queue.pop(out), PopStatus::INTERRUPTED);
    EXPECT_FALSE(queue.push(make_response(2)));
}

TEST_F(ResponseQueueTest, CloseDrainsRemainingItems) {
    ResponseQueue queue(4);
    ASSERT_TRUE(queue.push(make_response(1)));
    queue.close();
    
    EXPECT_TRUE(queue.is_closed());
    EXPECT_FALSE(queue.push(make_response(2)));
    
    ResponsePtr out;
    EXPECT_EQ(queue.pop(out), PopStatus::ITEM);
    EXPECT_EQ(queue.pop(out), PopStatus::CLOSED);
}

TEST_F(ResponseQueueTest, PushBlocksWhileFull) {
    ResponseQueue queue(1);
    ASSERT_TRUE(queue.push(make_response(1)));
    
    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        pushed = queue.push(make_response(2));
    });
    
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(pushed);
    
    ResponsePtr out;
    EXPECT_EQ(queue.pop(out), PopStatus::ITEM);
    producer.join();
    
    EXPECT_TRUE(pushed);
    EXPECT_EQ(queue.size(), 1u);
}

TEST_F(ResponseQueueTest, CloseReleasesBlockedProducer) {
    ResponseQueue queue(1);
    ASSERT_TRUE(queue.push(make_response(1)));
    
    std::atomic<bool> result{true};
    std::thread producer([&]() {
        result = queue.push(make_response(2));
    });
    
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    producer.join();
    
    EXPECT_FALSE(result);
}

class CancelSignalTest : public ::testing::Test {};

TEST_F(CancelSignalTest, CallbacksRunOnCancel) {
    CancelSignal signal;
    int calls = 0;
    signal.add_callback([&]() { ++calls; });
    auto removed = signal.add_callback([&]() { calls += 100; });
    signal.remove_callback(removed);
    
    EXPECT_FALSE(signal.is_cancelled());
    signal.cancel();
    signal.cancel();
    
    EXPECT_TRUE(signal.is_cancelled());
    EXPECT_EQ(calls, 1);
}

TEST_F(CancelSignalTest, LateCallbackRunsImmediately) {
    CancelSignal signal;
    signal.cancel();
    
    bool called = false;
    signal.add_callback([&]() { called = true; });
    EXPECT_TRUE(called);
}

TEST_F(CancelSignalTest, InterruptsQueue) {
    CancelSignal signal;
    ResponseQueue queue(2);
    signal.add_callback([&queue]() { queue.interrupt(); });
    
    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        signal.cancel();
    });
    
    ResponsePtr out;
    EXPECT_EQ(queue.pop(out), PopStatus::INTERRUPTED);
    canceller.join();
}
