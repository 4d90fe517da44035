#pragma once
#include "../exchanges/exchange_types.hpp"
#include "../utils/metrics/metrics_collector.hpp"
#include "../utils/resilience/resilience.hpp"
#include "proto/trading_events.pb.h"
#include <memory>
#include <string>
#include <vector>

namespace messaging {
class ZmqPublisher;
}

namespace trading {

/**
 * Outbound usage and audit events.
 *
 * Publishing is fire-and-forget: a sink never throws into the trading path, it logs and
 * drops instead.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void publish_order_event(const proto::OrderEvent& event) = 0;
    virtual void publish_breaker_event(const proto::BreakerStateEvent& event) = 0;
    virtual void publish_metrics(const proto::MetricsSnapshot& snapshot) = 0;
};

// Discards everything; used when [events] is disabled
class NullEventSink : public IEventSink {
public:
    void publish_order_event(const proto::OrderEvent&) override {}
    void publish_breaker_event(const proto::BreakerStateEvent&) override {}
    void publish_metrics(const proto::MetricsSnapshot&) override {}
};

/**
 * Serialized protobuf messages on a ZMQ PUB socket.
 * Topics: "orders.<user_id>", "breakers", "metrics".
 */
class ZmqEventSink : public IEventSink {
public:
    explicit ZmqEventSink(std::shared_ptr<messaging::ZmqPublisher> publisher);
    explicit ZmqEventSink(const std::string& endpoint);

    void publish_order_event(const proto::OrderEvent& event) override;
    void publish_breaker_event(const proto::BreakerStateEvent& event) override;
    void publish_metrics(const proto::MetricsSnapshot& snapshot) override;

    const std::shared_ptr<messaging::ZmqPublisher>& publisher() const { return publisher_; }

private:
    void send(const std::string& topic, const google::protobuf::Message& message);

    std::shared_ptr<messaging::ZmqPublisher> publisher_;
};

std::string order_topic(const std::string& user_id);

// Message builders shared by the execution path and the CLI
proto::OrderEvent make_order_event(const std::string& user_id, const std::string& exchange_id,
                                   const std::string& mode, const exchanges::Order& order,
                                   const std::string& event);
proto::OrderEvent make_rejected_order_event(const std::string& user_id, const std::string& exchange_id,
                                            const std::string& mode, const exchanges::OrderRequest& request,
                                            const std::string& reason);
proto::BreakerStateEvent make_breaker_event(const std::string& name, resilience::CircuitState from,
                                            resilience::CircuitState to);
proto::MetricsSnapshot make_metrics_snapshot(const std::vector<metrics::MetricSample>& samples);

} // namespace trading
