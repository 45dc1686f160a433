#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkpipe::network {

using RequestId = std::uint64_t;
using SubscriptionId = std::uint64_t;

// Request id carried by connection-level events that belong to no single request.
constexpr RequestId CONNECTION_EVENT_ID = 0;

enum class ResponseStatus {
    OK,
    END_OF_FILE,
    FAILURE,
    NO_SUCH_FILE,
    PERMISSION_DENIED,
    CONNECTION_LOST
};

const char* to_string(ResponseStatus status);

struct FileHandle {
    std::uint64_t id = 0;
    std::string path;
    
    bool operator==(const FileHandle& other) const { return id == other.id; }
};

struct ReadResponse {
    RequestId request_id = CONNECTION_EVENT_ID;
    ResponseStatus status = ResponseStatus::OK;
    std::vector<std::uint8_t> payload;
    std::string error_message;
    
    bool is_data() const { return status == ResponseStatus::OK; }
    bool is_connection_event() const { return status == ResponseStatus::CONNECTION_LOST; }
};

using ResponsePtr = std::shared_ptr<const ReadResponse>;

// A request/response file-transfer connection that allows several outstanding
// read requests. The connection may be shared by unrelated callers: every
// subscriber sees every inbound response and filters by request id.
class ReadTransport {
public:
    using ResponseHandler = std::function<void(const ResponsePtr&)>;
    
    virtual ~ReadTransport() = default;
    
    virtual std::optional<FileHandle> open_file(const std::string& path) = 0;
    virtual void close_file(const FileHandle& handle) = 0;
    virtual std::optional<std::uint64_t> file_size(const FileHandle& handle) = 0;
    
    // Sends the request and returns immediately; nullopt if it could not be sent.
    // Must not wait for response delivery: callers may hold a lock their
    // response handler also takes.
    virtual std::optional<RequestId> issue_read_request(const FileHandle& handle,
                                                        std::uint64_t offset,
                                                        std::uint32_t length) = 0;
    
    // After unsubscribe() returns the handler is no longer running or scheduled.
    virtual SubscriptionId subscribe(ResponseHandler handler) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};

}
