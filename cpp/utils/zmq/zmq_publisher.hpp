#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <zmq.h>

namespace messaging {

/**
 * ZeroMQ PUB socket sending two-frame messages: topic, then payload.
 *
 * Sends never block; when the high water mark is reached the message is dropped and
 * counted. ZMQ sockets are not thread-safe, so every send holds the publisher mutex.
 */
class ZmqPublisher {
public:
    /**
     * Binds a PUB socket to endpoint (e.g. "tcp://127.0.0.1:5560")
     * @throws std::runtime_error if the context, socket or bind fails
     */
    explicit ZmqPublisher(const std::string& endpoint, int hwm = 1000, int linger_ms = 0);
    ~ZmqPublisher();

    ZmqPublisher(const ZmqPublisher&) = delete;
    ZmqPublisher& operator=(const ZmqPublisher&) = delete;

    // false if the message was dropped or the send failed
    bool publish(const std::string& topic, const std::string& payload);

    const std::string& endpoint() const { return endpoint_; }
    uint64_t get_messages_sent() const { return messages_sent_.load(); }
    uint64_t get_messages_dropped() const { return messages_dropped_.load(); }

private:
    void close();

    void* ctx_ = nullptr;
    void* pub_ = nullptr;
    std::string endpoint_;
    std::mutex send_mutex_;

    std::atomic<uint64_t> messages_sent_{0};
    std::atomic<uint64_t> messages_dropped_{0};
};

} // namespace messaging
