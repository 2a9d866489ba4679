#include "verify/retry_policy.hpp"

namespace verifier {

bool should_retry(int iteration, int max_budget, failure_category category) {
    if (iteration >= max_budget) return false;
    if (category == failure_category::SECURITY)
        return iteration < max_budget / 2;
    return true;
}

}  // namespace verifier
