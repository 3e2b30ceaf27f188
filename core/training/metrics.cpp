#include "training/metrics.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace attrtools {

Averaging parseAveraging(const std::string& name) {
    if (name == "macro") return Averaging::Macro;
    if (name == "weighted") return Averaging::Weighted;
    throw InputFormatError("Unknown F1 averaging: " + name);
}

std::vector<ClassScore> classificationReport(const std::vector<std::string>& y_true,
                                             const std::vector<std::string>& y_pred) {
    if (y_true.size() != y_pred.size()) {
        throw std::invalid_argument("y_true and y_pred differ in length");
    }

    struct Counts { size_t tp = 0, fp = 0, fn = 0; };
    std::map<std::string, Counts> counts;

    for (size_t i = 0; i < y_true.size(); i++) {
        if (y_true[i] == y_pred[i]) {
            counts[y_true[i]].tp++;
        } else {
            counts[y_true[i]].fn++;
            counts[y_pred[i]].fp++;
        }
    }

    std::vector<ClassScore> report;
    for (const auto& [label, c] : counts) {
        ClassScore s;
        s.label = label;
        s.support = c.tp + c.fn;
        if (c.tp + c.fp > 0) s.precision = static_cast<double>(c.tp) / (c.tp + c.fp);
        if (c.tp + c.fn > 0) s.recall = static_cast<double>(c.tp) / (c.tp + c.fn);
        if (s.precision + s.recall > 0.0) {
            s.f1 = 2.0 * s.precision * s.recall / (s.precision + s.recall);
        }
        report.push_back(s);
    }
    return report;
}

double f1Score(const std::vector<std::string>& y_true,
               const std::vector<std::string>& y_pred,
               Averaging average) {
    if (y_true.empty()) {
        throw std::invalid_argument("Cannot score an empty prediction set");
    }
    auto report = classificationReport(y_true, y_pred);

    double total = 0.0;
    double weight_sum = 0.0;
    for (const auto& s : report) {
        double w = (average == Averaging::Weighted) ? static_cast<double>(s.support) : 1.0;
        total += w * s.f1;
        weight_sum += w;
    }
    if (weight_sum <= 0.0) return 0.0;
    return std::min(1.0, std::max(0.0, total / weight_sum));
}

} // namespace attrtools
