#pragma once

#include "core/utils.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace codegate {

namespace keys {
    inline constexpr std::string_view SECURITY_ALERT      = "security_alert";
    inline constexpr std::string_view BACKEND_EVENT       = "backend_event";
    inline constexpr std::string_view PERFORMANCE_INSIGHT = "performance_insight";
}

enum class NotificationKind {
    SECURITY_ALERT,         // high/critical risk about to execute
    BACKEND_EVENT,          // container unavailable, fallback taken
    PERFORMANCE_INSIGHT     // significant change in the rolling history
};

struct Notification {
    std::string id;
    NotificationKind kind = NotificationKind::SECURITY_ALERT;
    std::string severity = "info";          // info | warning | critical
    std::string title;
    std::string message;
    std::string execution_id;
    std::chrono::system_clock::time_point fired_at;

    Notification()
        : id(utils::generate_uuid()),
          fired_at(std::chrono::system_clock::now()) {}

    Notification(NotificationKind k, std::string sev, std::string t, std::string msg)
        : Notification() {
        kind = k;
        severity = std::move(sev);
        title = std::move(t);
        message = std::move(msg);
    }
};

[[nodiscard]] constexpr std::string_view notification_kind_to_string(NotificationKind k) {
    switch (k) {
        case NotificationKind::SECURITY_ALERT:      return keys::SECURITY_ALERT;
        case NotificationKind::BACKEND_EVENT:       return keys::BACKEND_EVENT;
        case NotificationKind::PERFORMANCE_INSIGHT: return keys::PERFORMANCE_INSIGHT;
        default: return "unknown";
    }
}

} // namespace codegate
