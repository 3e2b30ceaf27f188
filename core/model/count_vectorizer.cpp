#include "model/count_vectorizer.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace attrtools {

std::vector<std::string> CountVectorizer::tokenize(const std::string& document) {
    std::vector<std::string> tokens;
    std::istringstream iss(document);
    std::string token;
    while (std::getline(iss, token, ' ')) {
        if (token.empty()) continue;
        std::transform(token.begin(), token.end(), token.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        tokens.push_back(std::move(token));
    }
    return tokens;
}

void CountVectorizer::fit(const std::vector<std::string>& documents) {
    std::set<std::string> tokens;
    for (const auto& doc : documents) {
        for (auto& t : tokenize(doc)) tokens.insert(std::move(t));
    }
    vocabulary_.assign(tokens.begin(), tokens.end());
    rebuildIndex();
}

SparseFeatures CountVectorizer::transform(const std::string& document) const {
    SparseFeatures row;
    for (const auto& token : tokenize(document)) {
        auto it = index_.find(token);
        if (it != index_.end()) row.push_back(it->second);
    }
    std::sort(row.begin(), row.end());
    row.erase(std::unique(row.begin(), row.end()), row.end());
    return row;
}

std::vector<SparseFeatures> CountVectorizer::transform(
    const std::vector<std::string>& documents) const {
    std::vector<SparseFeatures> rows;
    rows.reserve(documents.size());
    for (const auto& doc : documents) rows.push_back(transform(doc));
    return rows;
}

nlohmann::json CountVectorizer::toJson() const {
    return {{"vocabulary", vocabulary_}};
}

CountVectorizer CountVectorizer::fromJson(const nlohmann::json& j) {
    CountVectorizer v;
    v.vocabulary_ = j.at("vocabulary").get<std::vector<std::string>>();
    if (!std::is_sorted(v.vocabulary_.begin(), v.vocabulary_.end())) {
        throw InputFormatError("Vectorizer vocabulary is not sorted");
    }
    v.rebuildIndex();
    return v;
}

void CountVectorizer::rebuildIndex() {
    index_.clear();
    for (size_t i = 0; i < vocabulary_.size(); i++) {
        index_[vocabulary_[i]] = static_cast<uint32_t>(i);
    }
}

} // namespace attrtools
