#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace attrtools {

/// Binary bag-of-tokens row: sorted, unique vocabulary indices of the
/// tokens present in a document.
using SparseFeatures = std::vector<uint32_t>;

// ─── Count Vectorizer ──────────────────────────────────────────
// Learns a token vocabulary from feature strings and maps each string
// to a binary presence vector. Tokens are lowercased and split on
// single spaces; empty tokens are ignored. The vocabulary is sorted
// lexically so that column order does not depend on input order.

class CountVectorizer {
public:
    CountVectorizer() = default;

    /// Learn the vocabulary of `documents`, replacing any previous one.
    void fit(const std::vector<std::string>& documents);

    /// Presence vector of `document`. Out-of-vocabulary tokens are dropped.
    SparseFeatures transform(const std::string& document) const;

    std::vector<SparseFeatures> transform(const std::vector<std::string>& documents) const;

    /// Split a document into lowercased tokens.
    static std::vector<std::string> tokenize(const std::string& document);

    const std::vector<std::string>& vocabulary() const { return vocabulary_; }
    size_t size() const { return vocabulary_.size(); }
    bool fitted() const { return !vocabulary_.empty(); }

    nlohmann::json toJson() const;
    static CountVectorizer fromJson(const nlohmann::json& j);

private:
    std::vector<std::string> vocabulary_;
    std::unordered_map<std::string, uint32_t> index_;

    void rebuildIndex();
};

} // namespace attrtools
