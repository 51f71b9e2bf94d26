#pragma once
#include <string>
#include <nlohmann/json.hpp>

//named event for the graphical shell: "qr-code", "auth-success", "logged-out"
struct UiNotification {
    std::string name;
    nlohmann::json payload = nlohmann::json::object();
};

inline UiNotification qr_code_notification(const std::string& code) {
    return UiNotification{"qr-code", nlohmann::json{{"code", code}}};
}
inline UiNotification auth_success_notification() { return UiNotification{"auth-success"}; }
inline UiNotification logged_out_notification() { return UiNotification{"logged-out"}; }

//where notifications go. fire and forget, implementations must not block the caller for long
class INotificationSink {
public:
    virtual ~INotificationSink() = default;
    virtual void notify(const UiNotification& n) = 0;
};
