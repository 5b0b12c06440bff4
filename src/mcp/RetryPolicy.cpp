// SPDX-License-Identifier: Apache-2.0
#include "RetryPolicy.hpp"

#include <algorithm>

namespace toolhost
{

auto computeRetryDelay(const ClientOptions& options, int attempt, std::mt19937& rng)
    -> std::chrono::milliseconds
{
    auto const cap = options.maxRetryDelay.count();
    auto delay = std::max<int64_t>(options.baseRetryDelay.count(), 0);

    // Doubling stops at the cap so large attempt numbers cannot overflow.
    for (auto i = 0; i < attempt && delay < cap; ++i)
        delay *= 2;

    if (options.maxJitter.count() > 0)
    {
        auto distribution = std::uniform_int_distribution<int64_t>(0, options.maxJitter.count());
        delay += distribution(rng);
    }

    return std::chrono::milliseconds(std::min(delay, cap));
}

} // namespace toolhost
