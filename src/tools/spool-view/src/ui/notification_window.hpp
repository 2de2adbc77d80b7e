#pragma once

#include "../tvision_include.hpp"

#include <chrono>
#include <functional>
#include <string>

// Small window stacked in the top-right corner of the desktop that closes
// itself once its display time runs out.
class NotificationWindow : public TWindow
{
public:
    using Clock = std::chrono::steady_clock;

    NotificationWindow(const TRect &bounds, const std::string &title, const std::string &body,
                       std::chrono::milliseconds duration);

    void setOnClosed(std::function<void(NotificationWindow *)> callback) { onClosed_ = std::move(callback); }
    bool expired(Clock::time_point now) const noexcept { return now >= expiresAt_; }

    void shutDown() override;

    static constexpr int kWidth = 54;
    static constexpr int kHeight = 6;

private:
    Clock::time_point expiresAt_;
    std::function<void(NotificationWindow *)> onClosed_;
};
