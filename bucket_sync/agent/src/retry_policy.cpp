#include "retry_policy.hpp"

#include <algorithm>

namespace bucket_sync::agent {

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    if (attempt < 1 || base_delay.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    auto delay = base_delay;
    for (int i = 1; i < attempt && delay < max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

}  // namespace bucket_sync::agent
