// EN: Cooperative cancellation for Forgeline - Shared token polled by processes, retries and stages
// FR: Annulation coopérative pour Forgeline - Jeton partagé consulté par les processus, retries et étapes

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace FGL {

// EN: Copyable handle on a shared cancellation state. A child token created with
// withDeadline() is cancelled when its parent is cancelled or when the deadline passes.
// FR: Handle copiable sur un état d'annulation partagé. Un jeton enfant créé avec
// withDeadline() est annulé quand son parent l'est ou quand l'échéance est dépassée.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken();

    // EN: Request cancellation (first reason wins)
    // FR: Demande l'annulation (la première raison l'emporte)
    void cancel(const std::string& reason = "cancelled");

    // EN: True when this token, an ancestor, or the deadline fired
    // FR: Vrai quand ce jeton, un ancêtre ou l'échéance s'est déclenché
    bool isCancelled() const;

    // EN: True only when the deadline (not an explicit cancel) fired
    // FR: Vrai seulement si l'échéance (et non une annulation explicite) s'est déclenchée
    bool deadlineExceeded() const;

    std::string reason() const;

    // EN: Time left before the nearest deadline of this token or its ancestors; nullopt without one
    // FR: Temps restant avant l'échéance la plus proche du jeton ou de ses ancêtres; nullopt sans échéance
    std::optional<std::chrono::milliseconds> remaining() const;

    // EN: Derive a child token bounded by a timeout
    // FR: Dérive un jeton enfant borné par un timeout
    CancellationToken withDeadline(std::chrono::milliseconds timeout) const;

    // EN: Sleep up to duration; returns false if cancelled before the end
    // FR: Dort jusqu'à la durée; retourne false si annulé avant la fin
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        mutable std::mutex mutex;
        std::string reason;
        std::optional<Clock::time_point> deadline;
        std::shared_ptr<State> parent;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

} // namespace FGL
