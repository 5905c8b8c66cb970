/**
 * @file event_logger.cpp
 * @brief Реализация EventLogger
 */

#include "event_logger.hpp"
#include "alerter.hpp"

#include <sstream>

namespace xmrweb::monitoring {

namespace {

std::string describe(const Event& event) {
    std::ostringstream ss;
    ss << "[" << to_string(event.type) << "]";
    if (event.session_id != 0) {
        ss << " session=" << event.session_id;
    }
    if (event.job_id != 0) {
        ss << " job=" << event.job_id;
    }
    if (event.generation != 0) {
        ss << " gen=" << event.generation;
    }
    if (event.height != 0) {
        ss << " height=" << event.height;
    }
    if (!event.message.empty()) {
        ss << " " << event.message;
    }
    return ss.str();
}

} // anonymous namespace

EventLogger::EventLogger(EventHub& hub)
    : hub_(hub)
{
    subscription_id_ = hub_.subscribe([](const Event& event) {
        EventLogger::log(event);
    });
}

EventLogger::~EventLogger() {
    hub_.unsubscribe(subscription_id_);
}

void EventLogger::log(const Event& event) {
    auto& alerter = Alerter::instance();

    switch (event.type) {
        case EventType::BlockCandidate:
            alerter.alert_block_found(event.height, event.message);
            break;
        case EventType::BlockForwarded:
            alerter.alert_block_accepted(event.height);
            break;
        case EventType::BlockRejected:
            alerter.alert_block_rejected(event.height, event.message);
            break;
        case EventType::BlockForwardFailed:
            // Critical алерт с полным blob выдаёт сам форвардер
            alerter.alert(AlertLevel::Warning, describe(event));
            break;
        case EventType::StoreDegraded:
            alerter.alert_store_degraded(event.message);
            break;
        case EventType::StoreRecovered:
            alerter.alert_store_recovered();
            break;
        case EventType::RpcFailure:
            alerter.alert_rpc_failure("monerod", event.message);
            break;
        case EventType::RateLimitViolation:
            alerter.alert_rate_limit(event.session_id, event.message);
            break;
        case EventType::TemplateRefreshed:
        case EventType::SessionOpened:
        case EventType::SessionClosed:
            alerter.alert(AlertLevel::Info, describe(event));
            break;
        default:
            alerter.alert(AlertLevel::Debug, describe(event));
            break;
    }
}

} // namespace xmrweb::monitoring
