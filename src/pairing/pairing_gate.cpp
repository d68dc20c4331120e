#include "pairing_gate.hpp"
#include "../util/logger.hpp"
#include "../util/random.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <stdexcept>

namespace deskstream {

namespace {

constexpr uint32_t PIN_MIN = 100000;
constexpr uint32_t PIN_SPAN = 900000;  // PIN_MIN .. 999999 inclusive

}  // namespace

PairingGate::PairingGate(const Clock& clock, std::chrono::seconds ttl, int max_attempts)
    : m_clock(clock), m_ttl(ttl), m_max_attempts(max_attempts) {
    if (ttl.count() <= 0) {
        throw std::invalid_argument("PairingGate: ttl must be positive");
    }
    if (max_attempts <= 0) {
        throw std::invalid_argument("PairingGate: max_attempts must be positive");
    }
}

std::string PairingGate::generate_pin() {
    std::string pin = std::to_string(PIN_MIN + random_uniform(PIN_SPAN));

    std::vector<PinGeneratedHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pin = pin;
        m_generated_at = m_clock.now();
        m_failed_attempts = 0;
        handlers = m_pin_handlers;
    }

    LOG_INFO("Pairing PIN generated");
    for (auto& handler : handlers) {
        handler(pin);
    }
    return pin;
}

PairingAttemptResult PairingGate::attempt_pin(const std::string& pin) {
    PairingAttemptResult result;
    std::vector<AttemptHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handlers = m_attempt_handlers;

        if (!m_pin) {
            // Nothing generated yet counts as expired
            result.reason = PairingFailureReason::PIN_EXPIRED;
        } else if (m_failed_attempts >= m_max_attempts) {
            result.reason = PairingFailureReason::TOO_MANY_ATTEMPTS;
        } else if (expired_locked()) {
            result.reason = PairingFailureReason::PIN_EXPIRED;
        } else if (pin.size() != m_pin->size() ||
                   CRYPTO_memcmp(pin.data(), m_pin->data(), pin.size()) != 0) {
            m_failed_attempts++;
            result.reason = PairingFailureReason::INVALID_PIN;
        } else {
            // Failures are kept on success; only a new PIN clears them
            result.success = true;
        }
    }

    if (result.success) {
        LOG_INFO("Pairing PIN accepted");
    } else {
        LOG_WARN("Pairing attempt rejected: %s", pairing_failure_name(result.reason));
    }

    for (auto& handler : handlers) {
        handler(result);
    }
    return result;
}

std::optional<std::string> PairingGate::current_pin() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pin;
}

bool PairingGate::is_pin_expired() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_pin || expired_locked();
}

bool PairingGate::is_locked_out() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failed_attempts >= m_max_attempts;
}

int PairingGate::attempts_remaining() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::max(0, m_max_attempts - m_failed_attempts);
}

void PairingGate::on_pin_generated(PinGeneratedHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pin_handlers.push_back(std::move(handler));
}

void PairingGate::on_pairing_attempted(AttemptHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_attempt_handlers.push_back(std::move(handler));
}

bool PairingGate::expired_locked() const {
    return m_clock.now() - m_generated_at >= m_ttl;
}

const char* pairing_failure_name(PairingFailureReason reason) {
    switch (reason) {
        case PairingFailureReason::NONE:              return "none";
        case PairingFailureReason::INVALID_PIN:       return "invalid PIN";
        case PairingFailureReason::PIN_EXPIRED:       return "PIN expired";
        case PairingFailureReason::TOO_MANY_ATTEMPTS: return "too many attempts";
        case PairingFailureReason::HOST_REFUSED:      return "host refused";
    }
    return "unknown";
}

}  // namespace deskstream
