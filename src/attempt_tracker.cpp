#include "attempt_tracker.hpp"
#include "errors.hpp"
#include "logfile.hpp"

namespace sharpgate {

AttemptTracker::AttemptTracker(int helpAfterFailures)
    : m_helpAfterFailures(helpAfterFailures) {
    if (helpAfterFailures < 1) {
        logger->error("[AttemptTracker] helpAfterFailures must be at least 1, got {}", helpAfterFailures);
        throw InvalidArgument("helpAfterFailures must be at least 1");
    }
}

void AttemptTracker::recordResult(bool passed) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (passed) {
        m_failedAttempts = 0;
        m_showHelp = false;
        return;
    }
    m_failedAttempts++;
    if (m_failedAttempts >= m_helpAfterFailures && !m_showHelp) {
        m_showHelp = true;
        logger->info("[AttemptTracker] {} failed captures in a row, offering help", m_failedAttempts);
    }
}

void AttemptTracker::dismissHelp() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_showHelp = false;
    m_failedAttempts = 0;
}

int AttemptTracker::failedAttempts() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failedAttempts;
}

bool AttemptTracker::shouldShowHelp() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_showHelp;
}

} // namespace sharpgate
