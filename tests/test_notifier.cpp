#include <catch2/catch_test_macros.hpp>
#include "alerting/notifier.hpp"
#include "mocks/mock_sinks.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>

using namespace codegate;

namespace {

// Blocks deliveries until released, so the queue can fill up
class GatedSink : public INotificationSink {
public:
    void deliver(const Notification&) override {
        std::unique_lock lock(mutex_);
        entered_ = true;
        entered_cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }

    [[nodiscard]] std::string name() const override { return "gated"; }

    void wait_until_entered() {
        std::unique_lock lock(mutex_);
        entered_cv_.wait(lock, [this] { return entered_; });
    }

    void open() {
        {
            std::lock_guard lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable entered_cv_;
    bool entered_ = false;
    bool open_ = false;
};

Notification alert(const std::string& title) {
    return Notification(NotificationKind::SECURITY_ALERT, "critical", title, "risk detected");
}

} // anonymous namespace

TEST_CASE("Notifier: delivers queued notifications", "[notifier]") {
    auto sink = std::make_shared<testing::MockNotificationSink>();
    AsyncNotifier notifier(NotificationConfig{}, sink);

    CHECK(notifier.notify(alert("first")));
    CHECK(notifier.notify(Notification(NotificationKind::BACKEND_EVENT, "warning",
                                       "Container unavailable", "falling back")));
    notifier.drain();

    const auto received = sink->received();
    REQUIRE(received.size() == 2);
    CHECK(received[0].title == "first");
    CHECK(received[0].severity == "critical");
    CHECK_FALSE(received[0].id.empty());
    CHECK(received[1].kind == NotificationKind::BACKEND_EVENT);

    const auto stats = notifier.get_stats();
    CHECK(stats.queued == 2);
    CHECK(stats.delivered == 2);
    CHECK(stats.dropped == 0);
}

TEST_CASE("Notifier: kinds are filtered by configuration", "[notifier]") {
    auto sink = std::make_shared<testing::MockNotificationSink>();
    NotificationConfig cfg;
    cfg.backend_events = false;
    AsyncNotifier notifier(cfg, sink);

    CHECK(notifier.wants(NotificationKind::SECURITY_ALERT));
    CHECK_FALSE(notifier.wants(NotificationKind::BACKEND_EVENT));
    // Off unless asked for
    CHECK_FALSE(notifier.wants(NotificationKind::PERFORMANCE_INSIGHT));

    CHECK_FALSE(notifier.notify(Notification(NotificationKind::BACKEND_EVENT, "info", "x", "y")));
    notifier.drain();
    CHECK(sink->received().empty());
}

TEST_CASE("Notifier: disabled or sinkless notifier drops everything", "[notifier]") {
    NotificationConfig disabled;
    disabled.enabled = false;
    auto sink = std::make_shared<testing::MockNotificationSink>();
    AsyncNotifier off(disabled, sink);
    CHECK_FALSE(off.notify(alert("ignored")));
    off.drain();

    AsyncNotifier no_sink(NotificationConfig{}, nullptr);
    CHECK_FALSE(no_sink.wants(NotificationKind::SECURITY_ALERT));
    CHECK_FALSE(no_sink.notify(alert("ignored")));
    no_sink.drain();

    CHECK(sink->received().empty());
}

TEST_CASE("Notifier: full queue drops instead of blocking", "[notifier]") {
    auto sink = std::make_shared<GatedSink>();
    NotificationConfig cfg;
    cfg.queue_capacity = 2;
    AsyncNotifier notifier(cfg, sink);

    // First one is taken by the worker and blocks inside deliver()
    REQUIRE(notifier.notify(alert("in-flight")));
    sink->wait_until_entered();

    CHECK(notifier.notify(alert("queued-1")));
    CHECK(notifier.notify(alert("queued-2")));
    CHECK_FALSE(notifier.notify(alert("overflow")));
    CHECK(notifier.get_stats().dropped == 1);

    sink->open();
    notifier.drain();
    CHECK(notifier.get_stats().delivered == 3);
}

TEST_CASE("Notifier: sink exceptions are contained", "[notifier]") {
    auto sink = std::make_shared<testing::MockNotificationSink>();
    sink->set_throw(true);
    AsyncNotifier notifier(NotificationConfig{}, sink);

    REQUIRE(notifier.notify(alert("boom")));
    notifier.drain();
    CHECK(notifier.get_stats().delivery_failures == 1);

    sink->set_throw(false);
    REQUIRE(notifier.notify(alert("recovered")));
    notifier.drain();
    CHECK(sink->count(NotificationKind::SECURITY_ALERT) == 1);
}

TEST_CASE("Notifier: stop delivers pending notifications", "[notifier]") {
    auto sink = std::make_shared<testing::MockNotificationSink>();
    {
        AsyncNotifier notifier(NotificationConfig{}, sink);
        for (int i = 0; i < 10; ++i) {
            REQUIRE(notifier.notify(alert("n" + std::to_string(i))));
        }
        notifier.stop();
        CHECK_FALSE(notifier.notify(alert("after stop")));
    }
    CHECK(sink->received().size() == 10);
}

TEST_CASE("Notifier: log sink accepts every severity", "[notifier]") {
    LogNotificationSink sink;
    CHECK(sink.name() == "log");
    for (const char* sev : {"info", "warning", "critical"}) {
        Notification n(NotificationKind::PERFORMANCE_INSIGHT, sev, "title", "message");
        REQUIRE_NOTHROW(sink.deliver(n));
    }
    CHECK(notification_kind_to_string(NotificationKind::PERFORMANCE_INSIGHT) == "performance_insight");
}
