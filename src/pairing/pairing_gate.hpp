#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../protocol/messages.hpp"
#include "../util/clock.hpp"

namespace deskstream {

struct PairingAttemptResult {
    bool success = false;
    PairingFailureReason reason = PairingFailureReason::NONE;
};

// 6-digit PIN lifecycle with expiry and failed-attempt lockout.
// One instance per host; all state is guarded by a single mutex and events
// fire after it is released.
class PairingGate {
public:
    using PinGeneratedHandler = std::function<void(const std::string& pin)>;
    using AttemptHandler = std::function<void(const PairingAttemptResult&)>;

    static constexpr int DEFAULT_MAX_ATTEMPTS = 5;
    static constexpr int DEFAULT_TTL_SECONDS = 300;

    explicit PairingGate(const Clock& clock = SystemClock::instance(),
                         std::chrono::seconds ttl = std::chrono::seconds(DEFAULT_TTL_SECONDS),
                         int max_attempts = DEFAULT_MAX_ATTEMPTS);

    // New PIN in [100000, 999999]. Clears failures and lockout.
    std::string generate_pin();
    void refresh_pin() { generate_pin(); }

    bool validate_pin(const std::string& pin) { return attempt_pin(pin).success; }

    // validate_pin() with the failure reason; fires PairingAttempted
    PairingAttemptResult attempt_pin(const std::string& pin);

    std::optional<std::string> current_pin() const;
    bool is_pin_expired() const;
    bool is_locked_out() const;
    int attempts_remaining() const;
    int max_attempts() const { return m_max_attempts; }

    void on_pin_generated(PinGeneratedHandler handler);
    void on_pairing_attempted(AttemptHandler handler);

private:
    bool expired_locked() const;

    const Clock& m_clock;
    const std::chrono::milliseconds m_ttl;
    const int m_max_attempts;

    mutable std::mutex m_mutex;
    std::optional<std::string> m_pin;
    Timestamp m_generated_at;
    int m_failed_attempts = 0;

    std::vector<PinGeneratedHandler> m_pin_handlers;
    std::vector<AttemptHandler> m_attempt_handlers;
};

const char* pairing_failure_name(PairingFailureReason reason);

}  // namespace deskstream
