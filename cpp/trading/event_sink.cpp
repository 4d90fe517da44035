#include "event_sink.hpp"
#include "../exchanges/gateway_utils.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/zmq/zmq_publisher.hpp"
#include <stdexcept>

namespace trading {

ZmqEventSink::ZmqEventSink(std::shared_ptr<messaging::ZmqPublisher> publisher)
    : publisher_(std::move(publisher)) {
    if (!publisher_) {
        throw std::invalid_argument("ZmqEventSink requires a publisher");
    }
}

ZmqEventSink::ZmqEventSink(const std::string& endpoint)
    : ZmqEventSink(std::make_shared<messaging::ZmqPublisher>(endpoint)) {}

void ZmqEventSink::publish_order_event(const proto::OrderEvent& event) {
    send(order_topic(event.user_id()), event);
}

void ZmqEventSink::publish_breaker_event(const proto::BreakerStateEvent& event) {
    send("breakers", event);
}

void ZmqEventSink::publish_metrics(const proto::MetricsSnapshot& snapshot) {
    send("metrics", snapshot);
}

void ZmqEventSink::send(const std::string& topic, const google::protobuf::Message& message) {
    std::string payload;
    if (!message.SerializeToString(&payload)) {
        LOG_ERROR_COMP("EVENTS", "Failed to serialize " + message.GetTypeName() + " for topic " + topic);
        return;
    }
    publisher_->publish(topic, payload);
}

std::string order_topic(const std::string& user_id) {
    return "orders." + user_id;
}

proto::OrderEvent make_order_event(const std::string& user_id, const std::string& exchange_id,
                                   const std::string& mode, const exchanges::Order& order,
                                   const std::string& event) {
    proto::OrderEvent msg;
    msg.set_user_id(user_id);
    msg.set_exchange_id(exchange_id);
    msg.set_mode(mode);
    msg.set_order_id(order.id);
    msg.set_client_order_id(order.client_order_id);
    msg.set_symbol(order.symbol);
    msg.set_side(exchanges::to_string(order.side));
    msg.set_type(exchanges::to_string(order.type));
    msg.set_status(exchanges::to_string(order.status));
    msg.set_quantity(order.quantity);
    msg.set_filled_quantity(order.filled_quantity);
    msg.set_price(order.price.value_or(0.0));
    msg.set_average_price(order.average_price);
    msg.set_fee(order.fee);
    msg.set_fee_currency(order.fee_currency);
    msg.set_event(event);
    msg.set_timestamp_ms(exchanges::now_millis());
    return msg;
}

proto::OrderEvent make_rejected_order_event(const std::string& user_id, const std::string& exchange_id,
                                            const std::string& mode, const exchanges::OrderRequest& request,
                                            const std::string& reason) {
    proto::OrderEvent msg;
    msg.set_user_id(user_id);
    msg.set_exchange_id(exchange_id);
    msg.set_mode(mode);
    msg.set_client_order_id(request.client_order_id.value_or(""));
    msg.set_symbol(request.symbol);
    msg.set_side(exchanges::to_string(request.side));
    msg.set_type(exchanges::to_string(request.type));
    msg.set_status(exchanges::to_string(exchanges::OrderStatus::REJECTED));
    msg.set_quantity(request.quantity);
    msg.set_price(request.price.value_or(0.0));
    msg.set_event("rejected");
    msg.set_reason(reason);
    msg.set_timestamp_ms(exchanges::now_millis());
    return msg;
}

proto::BreakerStateEvent make_breaker_event(const std::string& name, resilience::CircuitState from,
                                            resilience::CircuitState to) {
    proto::BreakerStateEvent msg;
    msg.set_name(name);
    msg.set_from_state(resilience::to_string(from));
    msg.set_to_state(resilience::to_string(to));
    msg.set_timestamp_ms(exchanges::now_millis());
    return msg;
}

proto::MetricsSnapshot make_metrics_snapshot(const std::vector<metrics::MetricSample>& samples) {
    proto::MetricsSnapshot msg;
    for (const auto& sample : samples) {
        auto* out = msg.add_samples();
        out->set_name(sample.name);
        out->set_type(metrics::to_string(sample.type));
        out->set_value(sample.value);
        out->set_count(sample.count);
        out->set_sum(sample.sum);
    }
    msg.set_timestamp_ms(exchanges::now_millis());
    return msg;
}

} // namespace trading
