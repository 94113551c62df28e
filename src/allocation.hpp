#ifndef HOMECALC_ALLOCATION_HPP
#define HOMECALC_ALLOCATION_HPP

#include <string>
#include <vector>

namespace homecalc {

// A destination for surplus cash that can absorb at most `capacity`
struct AllocationTarget {
    std::string name;
    double capacity;

    AllocationTarget() : capacity(0.0) {}
    AllocationTarget(const std::string& target_name, double target_capacity)
        : name(target_name), capacity(target_capacity) {}
};

// allocated[i] is what targets[i] received; remainder is what none could absorb
struct SurplusAllocation {
    std::vector<double> allocated;
    double remainder;

    SurplusAllocation() : remainder(0.0) {}

    double total_allocated() const;
};

// Fill targets in list order, each up to its remaining capacity.
// A non-positive surplus allocates nothing and comes back whole as remainder.
// Negative capacities are treated as zero.
SurplusAllocation allocate_in_priority_order(double surplus,
                                             const std::vector<AllocationTarget>& targets);

} // namespace homecalc

#endif // HOMECALC_ALLOCATION_HPP
