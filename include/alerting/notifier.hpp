#pragma once

#include "alerting/notification.hpp"
#include "config/config_types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace codegate {

/**
 * @brief Destination for operator notifications (desktop, chat, log...)
 *
 * Called from the notifier worker thread only.
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual void deliver(const Notification& notification) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/// Writes notifications to the diagnostic log
class LogNotificationSink : public INotificationSink {
public:
    void deliver(const Notification& notification) override;
    [[nodiscard]] std::string name() const override { return "log"; }
};

/**
 * @brief Fire-and-forget notification dispatch
 *
 * notify() filters by kind, enqueues and returns immediately. A bounded
 * queue drained by one worker thread decouples the pipeline from slow
 * sinks; when the queue is full the notification is dropped and counted.
 * Sink exceptions are logged and counted, never propagated.
 */
class AsyncNotifier {
public:
    AsyncNotifier(const NotificationConfig& config, std::shared_ptr<INotificationSink> sink);
    ~AsyncNotifier();

    AsyncNotifier(const AsyncNotifier&) = delete;
    AsyncNotifier& operator=(const AsyncNotifier&) = delete;

    /// Returns true if the notification was queued
    bool notify(Notification notification);

    /// Whether notifications of this kind are delivered at all
    [[nodiscard]] bool wants(NotificationKind kind) const;

    /// Block until the queue is empty and the in-flight delivery finished
    void drain();

    void stop();

    struct Stats {
        uint64_t queued;
        uint64_t delivered;
        uint64_t dropped;
        uint64_t delivery_failures;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    void worker_loop();

    NotificationConfig config_;
    std::shared_ptr<INotificationSink> sink_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Notification> queue_;
    bool delivering_ = false;
    bool stopping_ = false;
    std::thread worker_;

    std::atomic<uint64_t> queued_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> delivery_failures_{0};
};

} // namespace codegate
