#pragma once
#include <atomic>
#include "core/QueryError.h"

/**
 * @brief Cooperative cancellation flag shared between a transport worker and
 * the query running on its behalf.
 */
class CancellationToken {
public:
    void cancel() { cancelled.store(true); }
    bool isCancelled() const { return cancelled.load(); }

    void checkCanceled() const {
        if (cancelled.load()) {
            throw QueryCancelledException();
        }
    }

    // Token that is never cancelled, for callers without a transport.
    static const CancellationToken& none() {
        static const CancellationToken token;
        return token;
    }

private:
    std::atomic<bool> cancelled{false};
};
