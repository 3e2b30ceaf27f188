#pragma once

#include "stix/entity.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace attrtools {

/// Shape of generated incidents.
struct GeneratorConfig {
    int size_min = 10;               // lower bound of incident size
    int size_max = 50;               // upper bound (exclusive)
    double size_alpha = 1.5;         // beta-binomial shape
    double size_beta = 10.0;
    double frac_attack_patterns = 0.5;
    double frac_tools = 0.2;
    double frac_malwares = 0.2;
    double frac_others = 0.1;        // indicators, vulnerabilities, identities, locations
};

// ─── Incident Generator ────────────────────────────────────────
// Samples synthetic incidents from the entities of an intrusion set.
// Used as training signal: each generated incident is one labeled
// example. Deterministic for a given seed and call sequence.

class IncidentGenerator {
public:
    explicit IncidentGenerator(uint32_t seed = 27, GeneratorConfig config = {});

    /// Semantic ids of one generated incident.
    std::vector<std::string> generate(const IntrusionSet& source);

    /// Draw an incident size in [size_min, size_max).
    int sampleIncidentSize();

    const GeneratorConfig& config() const { return config_; }

private:
    GeneratorConfig config_;
    std::mt19937 rng_;
    std::discrete_distribution<int> size_dist_;

    /// With replacement, duplicates dropped, first-drawn order kept.
    std::vector<std::string> sampleWithReplacement(
        const std::vector<const Entity*>& source, double fraction, int incident_size);

    /// Without replacement.
    std::vector<std::string> sampleWithoutReplacement(
        const std::vector<const Entity*>& source, double fraction, int incident_size);
};

/// Beta-binomial pmf P(X = k) for n trials.
double betaBinomialPmf(int k, int n, double alpha, double beta);

} // namespace attrtools
