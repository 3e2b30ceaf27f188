#include "generator/incident_generator.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace attrtools {

namespace {

double logBeta(double a, double b) {
    return std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
}

std::vector<const Entity*> pointers(const std::vector<Entity>& entities) {
    std::vector<const Entity*> out;
    out.reserve(entities.size());
    for (const auto& e : entities) out.push_back(&e);
    return out;
}

} // namespace

double betaBinomialPmf(int k, int n, double alpha, double beta) {
    if (k < 0 || k > n) return 0.0;
    double log_choose = std::lgamma(n + 1.0) - std::lgamma(k + 1.0) - std::lgamma(n - k + 1.0);
    return std::exp(log_choose + logBeta(k + alpha, n - k + beta) - logBeta(alpha, beta));
}

IncidentGenerator::IncidentGenerator(uint32_t seed, GeneratorConfig config)
    : config_(config), rng_(seed) {
    int region = config_.size_max - config_.size_min;
    if (config_.size_min < 1 || region <= 0) {
        throw InputFormatError("Wrong incident size bounds: " +
                               std::to_string(config_.size_min) + ", " +
                               std::to_string(config_.size_max));
    }

    // Support is [0, region); the upper end is excluded.
    std::vector<double> weights;
    weights.reserve(region);
    for (int k = 0; k < region; k++) {
        weights.push_back(betaBinomialPmf(k, region, config_.size_alpha, config_.size_beta));
    }
    size_dist_ = std::discrete_distribution<int>(weights.begin(), weights.end());
}

int IncidentGenerator::sampleIncidentSize() {
    return size_dist_(rng_) + config_.size_min;
}

std::vector<std::string> IncidentGenerator::generate(const IntrusionSet& source) {
    int n_size_max = std::max(static_cast<int>(source.relatedCount()), config_.size_min);
    int n_size = std::min(sampleIncidentSize(), n_size_max);

    std::vector<std::string> content;
    auto append = [&content](std::vector<std::string> items) {
        content.insert(content.end(), items.begin(), items.end());
    };

    append(sampleWithReplacement(pointers(source.attack_patterns),
                                 config_.frac_attack_patterns, n_size));
    append(sampleWithReplacement(pointers(source.tools), config_.frac_tools, n_size));
    append(sampleWithReplacement(pointers(source.malwares), config_.frac_malwares, n_size));

    std::vector<const Entity*> others;
    for (const auto* bucket : {&source.indicators, &source.vulnerabilities,
                               &source.identities, &source.locations}) {
        for (const auto& e : *bucket) others.push_back(&e);
    }
    append(sampleWithoutReplacement(others, config_.frac_others, n_size));

    return content;
}

std::vector<std::string> IncidentGenerator::sampleWithReplacement(
    const std::vector<const Entity*>& source, double fraction, int incident_size) {

    std::vector<std::string> result;
    if (source.empty()) return result;

    int draws = static_cast<int>(std::ceil(incident_size * fraction));
    std::uniform_int_distribution<size_t> pick(0, source.size() - 1);
    std::unordered_set<const Entity*> seen;
    for (int i = 0; i < draws; i++) {
        const Entity* e = source[pick(rng_)];
        if (seen.insert(e).second) {
            result.push_back(e->semantic_id);
        }
    }
    return result;
}

std::vector<std::string> IncidentGenerator::sampleWithoutReplacement(
    const std::vector<const Entity*>& source, double fraction, int incident_size) {

    std::vector<std::string> result;
    if (source.empty()) return result;

    size_t wanted = static_cast<size_t>(std::ceil(incident_size * fraction));
    size_t n = std::min(source.size(), wanted);

    // Partial Fisher-Yates over a copy
    std::vector<const Entity*> pool = source;
    for (size_t i = 0; i < n; i++) {
        std::uniform_int_distribution<size_t> pick(i, pool.size() - 1);
        std::swap(pool[i], pool[pick(rng_)]);
        result.push_back(pool[i]->semantic_id);
    }
    return result;
}

} // namespace attrtools
