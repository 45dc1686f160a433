#include <gtest/gtest.h>
#include "chunkpipe/transfer/response_correlator.hpp"
#include "scripted_transport.hpp"

using namespace chunkpipe::transfer;
using chunkpipe::network::ReadResponse;
using chunkpipe::network::ResponseStatus;
using chunkpipe::test::ScriptedTransport;

class ResponseCorrelatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_unique<ScriptedTransport>(ScriptedTransport::make_content(4 * 1024));
        transport->set_release_mode(ScriptedTransport::Release::HOLD);
        handle = *transport->open_file("remote/data.bin");
        
        state = TransferState(4 * 1024);
        planner = std::make_unique<ChunkPlanner>(state.file_size, 1024);
        dispatcher = std::make_unique<RequestDispatcher>(*transport, handle, *planner);
        correlator = std::make_unique<ResponseCorrelator>(*dispatcher);
        
        while (dispatcher->try_dispatch_next(state, 4)) {
        }
        issued = transport->issued_requests();
    }
    
    ReadResponse data_response(size_t index, size_t length = 1024) const {
        ReadResponse response;
        response.request_id = issued[index].request_id;
        response.payload.assign(length, static_cast<std::uint8_t>(index));
        return response;
    }
    
    std::unique_ptr<ScriptedTransport> transport;
    chunkpipe::network::FileHandle handle;
    TransferState state;
    std::unique_ptr<ChunkPlanner> planner;
    std::unique_ptr<RequestDispatcher> dispatcher;
    std::unique_ptr<ResponseCorrelator> correlator;
    std::vector<ScriptedTransport::IssuedRequest> issued;
};

TEST_F(ResponseCorrelatorTest, AcceptsOutOfOrderResponses) {
    EXPECT_EQ(correlator->handle_response(state, data_response(2)), CorrelationResult::ACCEPTED);
    EXPECT_EQ(correlator->handle_response(state, data_response(0)), CorrelationResult::ACCEPTED);
    
    EXPECT_EQ(state.in_flight, 2u);
    ASSERT_EQ(state.pending_chunks.size(), 2u);
    EXPECT_EQ(state.pending_chunks.begin()->first, 0u);
    EXPECT_EQ(state.pending_chunks.at(2048).payload.front(), 2);
    EXPECT_EQ(state.write_cursor, 0u);
}

TEST_F(ResponseCorrelatorTest, IgnoresUnknownIds) {
    ReadResponse foreign;
    foreign.request_id = 424242;
    foreign.payload.assign(1024, 0);
    
    EXPECT_EQ(correlator->handle_response(state, foreign), CorrelationResult::IGNORED);
    EXPECT_EQ(state.responses_ignored, 1u);
    EXPECT_EQ(state.in_flight, 4u);
    EXPECT_FALSE(state.terminal_error.has_value());
}

TEST_F(ResponseCorrelatorTest, IgnoresDuplicateResponse) {
    EXPECT_EQ(correlator->handle_response(state, data_response(1)), CorrelationResult::ACCEPTED);
    EXPECT_EQ(correlator->handle_response(state, data_response(1)), CorrelationResult::IGNORED);
    
    EXPECT_EQ(state.in_flight, 3u);
    EXPECT_EQ(state.pending_chunks.size(), 1u);
}

TEST_F(ResponseCorrelatorTest, WrongLengthIsProtocolMismatch) {
    EXPECT_EQ(correlator->handle_response(state, data_response(2, 100)), CorrelationResult::FAILED);
    
    ASSERT_TRUE(state.terminal_error.has_value());
    EXPECT_EQ(state.terminal_error->error, TransferError::PROTOCOL_MISMATCH);
    EXPECT_EQ(state.terminal_error->message,
              "invalid data block size at offset 2048: expected 1024 bytes, got 100");
    EXPECT_TRUE(state.pending_chunks.empty());
}

TEST_F(ResponseCorrelatorTest, FailedReadIsTransportError) {
    ReadResponse failure;
    failure.request_id = issued[3].request_id;
    failure.status = ResponseStatus::PERMISSION_DENIED;
    failure.error_message = "denied";
    
    EXPECT_EQ(correlator->handle_response(state, failure), CorrelationResult::FAILED);
    ASSERT_TRUE(state.terminal_error.has_value());
    EXPECT_EQ(state.terminal_error->error, TransferError::TRANSPORT_ERROR);
    EXPECT_NE(state.terminal_error->message.find("offset 3072"), std::string::npos);
    EXPECT_NE(state.terminal_error->message.find("denied"), std::string::npos);
}

TEST_F(ResponseCorrelatorTest, ConnectionLossIsFatal) {
    ReadResponse lost;
    lost.status = ResponseStatus::CONNECTION_LOST;
    lost.error_message = "peer reset";
    
    EXPECT_EQ(correlator->handle_response(state, lost), CorrelationResult::FAILED);
    ASSERT_TRUE(state.terminal_error.has_value());
    EXPECT_EQ(state.terminal_error->error, TransferError::TRANSPORT_ERROR);
    EXPECT_EQ(state.terminal_error->message, "connection lost: peer reset");
}

TEST_F(ResponseCorrelatorTest, FirstErrorWins) {
    correlator->handle_response(state, data_response(0, 10));
    
    ReadResponse failure;
    failure.request_id = issued[1].request_id;
    failure.status = ResponseStatus::FAILURE;
    correlator->handle_response(state, failure);
    
    ASSERT_TRUE(state.terminal_error.has_value());
    EXPECT_EQ(state.terminal_error->error, TransferError::PROTOCOL_MISMATCH);
}
