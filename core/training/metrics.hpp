#pragma once

#include <string>
#include <vector>

namespace attrtools {

/// How per-class F1 values are combined.
enum class Averaging {
    Macro,      // unweighted mean over classes
    Weighted,   // mean weighted by true support
};

Averaging parseAveraging(const std::string& name);

/// Precision, recall and F1 of one class.
struct ClassScore {
    std::string label;
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
    size_t support = 0;      // occurrences in y_true
};

/// Per-class scores over the union of labels in y_true and y_pred,
/// sorted by label. Undefined ratios count as 0.
std::vector<ClassScore> classificationReport(const std::vector<std::string>& y_true,
                                             const std::vector<std::string>& y_pred);

/// Averaged F1 in [0, 1]. Throws std::invalid_argument on size mismatch
/// or empty input.
double f1Score(const std::vector<std::string>& y_true,
               const std::vector<std::string>& y_pred,
               Averaging average = Averaging::Weighted);

} // namespace attrtools
