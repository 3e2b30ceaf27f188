#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace attrtools {

/// Row indices of the two partitions of a split.
struct SplitIndices {
    std::vector<size_t> train;
    std::vector<size_t> test;
};

/// Stratified shuffle split. Every class sends max(1, round(n_c * test_size))
/// of its rows to the test partition and keeps at least one for training.
/// Indices within each partition are returned in ascending order.
///
/// Throws TrainingInternalError if test_size is outside (0, 1), there are
/// fewer than two classes, or any class has fewer than two rows.
SplitIndices stratifiedSplit(const std::vector<std::string>& labels,
                             double test_size, uint32_t seed);

} // namespace attrtools
