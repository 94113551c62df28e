#include "allocation.hpp"
#include <algorithm>
#include <numeric>

namespace homecalc {

double SurplusAllocation::total_allocated() const {
    return std::accumulate(allocated.begin(), allocated.end(), 0.0);
}

SurplusAllocation allocate_in_priority_order(double surplus,
                                             const std::vector<AllocationTarget>& targets) {
    SurplusAllocation result;
    result.allocated.assign(targets.size(), 0.0);
    result.remainder = surplus;

    if (surplus <= 0.0) {
        return result;
    }

    for (size_t i = 0; i < targets.size(); ++i) {
        if (result.remainder <= 0.0) {
            break;
        }
        const double amount = std::min(std::max(0.0, targets[i].capacity), result.remainder);
        result.allocated[i] = amount;
        result.remainder -= amount;
    }

    return result;
}

} // namespace homecalc
