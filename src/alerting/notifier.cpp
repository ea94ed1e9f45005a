#include "alerting/notifier.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace codegate {

void LogNotificationSink::deliver(const Notification& n) {
    const std::string line = std::format("[{}] {}: {}", notification_kind_to_string(n.kind),
                                         n.title, n.message);
    if (n.severity == "critical") {
        utils::log::error(line);
    } else if (n.severity == "warning") {
        utils::log::warn(line);
    } else {
        utils::log::info(line);
    }
}

// ============================================================================
// AsyncNotifier
// ============================================================================

AsyncNotifier::AsyncNotifier(const NotificationConfig& config,
                             std::shared_ptr<INotificationSink> sink)
    : config_(config),
      sink_(std::move(sink)) {
    if (config_.queue_capacity == 0) config_.queue_capacity = 1;
    if (config_.enabled && sink_) {
        worker_ = std::thread(&AsyncNotifier::worker_loop, this);
    }
}

AsyncNotifier::~AsyncNotifier() {
    stop();
}

bool AsyncNotifier::wants(NotificationKind kind) const {
    if (!config_.enabled || !sink_) return false;
    switch (kind) {
        case NotificationKind::SECURITY_ALERT:      return config_.security_alerts;
        case NotificationKind::BACKEND_EVENT:       return config_.backend_events;
        case NotificationKind::PERFORMANCE_INSIGHT: return config_.performance_insights;
    }
    return false;
}

bool AsyncNotifier::notify(Notification notification) {
    if (!wants(notification.kind)) return false;

    {
        std::lock_guard lock(mutex_);
        if (stopping_) return false;
        if (queue_.size() >= config_.queue_capacity) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.push_back(std::move(notification));
    }
    queued_.fetch_add(1, std::memory_order_relaxed);
    cv_.notify_one();
    return true;
}

void AsyncNotifier::drain() {
    std::unique_lock lock(mutex_);
    if (!worker_.joinable()) return;
    idle_cv_.wait(lock, [this] { return (queue_.empty() && !delivering_) || stopping_; });
}

void AsyncNotifier::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    cv_.notify_one();
    idle_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

AsyncNotifier::Stats AsyncNotifier::get_stats() const {
    return Stats{
        .queued = queued_.load(std::memory_order_relaxed),
        .delivered = delivered_.load(std::memory_order_relaxed),
        .dropped = dropped_.load(std::memory_order_relaxed),
        .delivery_failures = delivery_failures_.load(std::memory_order_relaxed)
    };
}

void AsyncNotifier::worker_loop() {
    std::unique_lock lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });

        // Pending notifications are still delivered on stop
        if (queue_.empty() && stopping_) return;

        Notification next = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;
        lock.unlock();

        try {
            sink_->deliver(next);
            delivered_.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& e) {
            delivery_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Notification sink {} failed: {}", sink_->name(), e.what()));
        }

        lock.lock();
        delivering_ = false;
        if (queue_.empty()) idle_cv_.notify_all();
    }
}

} // namespace codegate
