#include "zmq_publisher.hpp"
#include "../logging/log_helper.hpp"
#include <cerrno>
#include <stdexcept>

namespace messaging {

ZmqPublisher::ZmqPublisher(const std::string& endpoint, int hwm, int linger_ms)
    : endpoint_(endpoint) {
    ctx_ = zmq_ctx_new();
    if (!ctx_) {
        throw std::runtime_error("Failed to create ZMQ context");
    }

    pub_ = zmq_socket(ctx_, ZMQ_PUB);
    if (!pub_) {
        std::string reason = zmq_strerror(zmq_errno());
        close();
        throw std::runtime_error("Failed to create ZMQ socket: " + reason);
    }

    zmq_setsockopt(pub_, ZMQ_SNDHWM, &hwm, sizeof(hwm));
    zmq_setsockopt(pub_, ZMQ_LINGER, &linger_ms, sizeof(linger_ms));

    if (zmq_bind(pub_, endpoint_.c_str()) != 0) {
        std::string reason = zmq_strerror(zmq_errno());
        close();
        throw std::runtime_error("Failed to bind event publisher to " + endpoint_ + ": " + reason);
    }
    LOG_INFO_COMP("EVENTS", "Event publisher bound to " + endpoint_);
}

ZmqPublisher::~ZmqPublisher() {
    close();
}

void ZmqPublisher::close() {
    if (pub_) {
        zmq_close(pub_);
        pub_ = nullptr;
    }
    if (ctx_) {
        zmq_ctx_term(ctx_);
        ctx_ = nullptr;
    }
}

bool ZmqPublisher::publish(const std::string& topic, const std::string& payload) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!pub_) return false;

    if (zmq_send(pub_, topic.data(), topic.size(), ZMQ_SNDMORE | ZMQ_DONTWAIT) == -1) {
        if (zmq_errno() == EAGAIN) {
            messages_dropped_.fetch_add(1);
            LOG_WARN_COMP("EVENTS", "Send buffer full, dropped message for topic: " + topic);
        } else {
            LOG_ERROR_COMP("EVENTS", "Failed to send topic frame: " + std::string(zmq_strerror(zmq_errno())));
        }
        return false;
    }

    // A PUB socket accepts the remaining frames of a message once the first is queued
    if (zmq_send(pub_, payload.data(), payload.size(), ZMQ_DONTWAIT) == -1) {
        LOG_ERROR_COMP("EVENTS", "Failed to send payload for topic " + topic + ": " +
                       std::string(zmq_strerror(zmq_errno())));
        return false;
    }

    messages_sent_.fetch_add(1);
    return true;
}

} // namespace messaging
