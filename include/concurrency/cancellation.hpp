#pragma once

#include <atomic>
#include <memory>
#include <string>

namespace auraseal::concurrency {

// Copies share one flag; cancelling any copy cancels them all.
class CancellationToken {
public:
    CancellationToken();

    void cancel() noexcept;
    bool isCancelled() const noexcept;

    // Throws CancelledError naming `what` once cancelled.
    void throwIfCancelled(const std::string& what) const;

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace auraseal::concurrency
