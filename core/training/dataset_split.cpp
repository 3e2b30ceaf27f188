#include "training/dataset_split.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <random>

namespace attrtools {

SplitIndices stratifiedSplit(const std::vector<std::string>& labels,
                             double test_size, uint32_t seed) {
    if (!(test_size > 0.0 && test_size < 1.0)) {
        throw TrainingInternalError("test_size must be in (0, 1), got " +
                                    std::to_string(test_size));
    }

    // Ordered by label so the shuffle sequence does not depend on hashing
    std::map<std::string, std::vector<size_t>> by_class;
    for (size_t i = 0; i < labels.size(); i++) {
        by_class[labels[i]].push_back(i);
    }

    if (by_class.size() < 2) {
        throw TrainingInternalError("Stratified split needs at least 2 classes, got " +
                                    std::to_string(by_class.size()));
    }

    std::mt19937 rng(seed);
    SplitIndices split;

    for (auto& [label, rows] : by_class) {
        if (rows.size() < 2) {
            throw TrainingInternalError("The least populated class '" + label +
                                        "' has only 1 member");
        }
        std::shuffle(rows.begin(), rows.end(), rng);

        size_t n_test = static_cast<size_t>(std::lround(rows.size() * test_size));
        n_test = std::max<size_t>(1, std::min(n_test, rows.size() - 1));

        split.test.insert(split.test.end(), rows.begin(), rows.begin() + n_test);
        split.train.insert(split.train.end(), rows.begin() + n_test, rows.end());
    }

    std::sort(split.train.begin(), split.train.end());
    std::sort(split.test.begin(), split.test.end());
    return split;
}

} // namespace attrtools
