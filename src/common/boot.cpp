#include "boot.hpp"

#include <condition_variable>
#include <format>
#include <memory>
#include <mutex>
#include <optional>

namespace {

struct Race {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::optional<std::expected<void, BootFailure>> outcome;

    void settle(std::expected<void, BootFailure> result) {
        {
            std::lock_guard lock(mutex);
            if (outcome) return;
            outcome = std::move(result);
        }
        cv.notify_all();
    }
};

} // namespace

std::expected<void, BootFailure> wait_until_ready(Session& session, const BootOptions& options) {
    // Shared so a late event from another thread never touches a dead frame.
    auto race = std::make_shared<Race>();
    auto on_qr = options.on_qr;
    auto not_logged_in = options.not_logged_in_message;

    session.set_event_handler([race, on_qr, not_logged_in](const SessionEvent& ev) {
        switch (ev.kind) {
            case SessionEventKind::Qr:
                if (on_qr) {
                    on_qr(ev.detail);
                } else {
                    race->settle(std::unexpected(
                        BootFailure{BootFailureKind::NotLoggedIn, not_logged_in}));
                }
                break;
            case SessionEventKind::Ready:
                race->settle({});
                break;
            case SessionEventKind::Error:
                race->settle(std::unexpected(BootFailure{
                    BootFailureKind::Upstream,
                    ev.detail.empty() ? std::string("Session error") : ev.detail}));
                break;
            default:
                break;
        }
    });

    if (auto init = session.initialize(); !init) {
        race->settle(std::unexpected(BootFailure{BootFailureKind::Upstream, init.error()}));
    }

    std::expected<void, BootFailure> result;
    {
        std::unique_lock lock(race->mutex);
        auto settled = race->cv.wait_for(lock, options.stop, options.timeout,
                                         [&] { return race->outcome.has_value(); });
        if (!settled && options.stop.stop_requested()) {
            race->outcome = std::unexpected(
                BootFailure{BootFailureKind::Cancelled, "Interrupted while waiting for WhatsApp"});
        } else if (!settled) {
            race->outcome = std::unexpected(BootFailure{
                BootFailureKind::Timeout,
                std::format("Timed out waiting for WhatsApp ({} s). Is your phone connected?",
                            std::chrono::duration_cast<std::chrono::seconds>(options.timeout).count())});
        }
        result = *race->outcome;
    }

    session.set_event_handler({});
    return result;
}
