#ifndef SHARPGATE_ATTEMPT_TRACKER_H
#define SHARPGATE_ATTEMPT_TRACKER_H

#include <mutex>

namespace sharpgate {

/**
 * @class AttemptTracker
 * @brief Counts consecutive failed captures and flags when help should be offered.
 */
class AttemptTracker {
public:
    /**
     * @param helpAfterFailures Consecutive failures that raise the help flag (at least 1)
     * @throws InvalidArgument if @p helpAfterFailures is below 1
     */
    explicit AttemptTracker(int helpAfterFailures = 5);

    // A pass clears the count and the flag; a failure may raise the flag
    void recordResult(bool passed);

    // Called once the help has been shown
    void dismissHelp();

    int failedAttempts();
    bool shouldShowHelp();

private:
    const int m_helpAfterFailures;
    int m_failedAttempts = 0;
    bool m_showHelp = false;
    std::mutex m_mutex;
};

} // namespace sharpgate

#endif // SHARPGATE_ATTEMPT_TRACKER_H
