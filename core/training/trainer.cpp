#include "training/trainer.hpp"
#include "common/errors.hpp"
#include "model/bernoulli_nb.hpp"
#include "training/dataset_split.hpp"

#include <spdlog/spdlog.h>

namespace attrtools {

namespace {

std::string joinTokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (!out.empty()) out += ' ';
        out += t;
    }
    return out;
}

template <typename T>
std::vector<T> select(const std::vector<T>& values, const std::vector<size_t>& idx) {
    std::vector<T> out;
    out.reserve(idx.size());
    for (size_t i : idx) out.push_back(values[i]);
    return out;
}

} // namespace

Trainer::Trainer(nlohmann::json intrusion_sets,
                 const std::string& database_version,
                 TrainingConfig config)
    : config_(std::move(config)) {
    try {
        database_version_ = DatabaseVersion::parse(database_version);
    } catch (const InputFormatError& e) {
        throw TrainingDataError(e.what());
    }
    if (config_.samples_per_label < 1) {
        throw TrainingDataError("samples_per_label must be positive");
    }

    intrusion_sets_ = validateCorpus(intrusion_sets);

    spdlog::info("The number of intrusion set items {}", intrusion_sets_.size());
    spdlog::info("The data version is {}", database_version_.toString());
}

LabeledIntrusionSets Trainer::validateCorpus(const nlohmann::json& corpus) {
    if (!corpus.is_array() || corpus.empty()) {
        throw TrainingDataError("Intrusion-set corpus must be a non-empty array");
    }

    for (size_t i = 0; i < corpus.size(); i++) {
        const auto& bundle = corpus[i];
        std::string where = "Intrusion-set record " + std::to_string(i);
        if (!bundle.is_object() || !bundle.contains("objects") || !bundle["objects"].is_array()) {
            throw TrainingDataError(where + " has no 'objects' array");
        }
        try {
            auto label = intrusionSetLabel(bundle["objects"]);
            if (!label || !isWellFormedLabel(*label)) {
                throw TrainingDataError(where + " has no well-formed intrusion-set identifier");
            }
            auto intrusion_set = buildIntrusionSet(bundle["objects"]);
            if (!intrusion_set || intrusion_set->empty()) {
                throw TrainingDataError(where + " (" + *label + ") has no related entities");
            }
        } catch (const InputFormatError& e) {
            throw TrainingDataError(where + ": " + e.what());
        }
    }

    return collectIntrusionSets(corpus);
}

IncidentDataset Trainer::createIncidentData() const {
    IncidentGenerator generator(config_.random_seed, config_.generator);
    IncidentDataset data;
    data.incidents.reserve(intrusion_sets_.size() * config_.samples_per_label);
    data.labels.reserve(intrusion_sets_.size() * config_.samples_per_label);

    for (const auto& [label, intrusion_set] : intrusion_sets_) {
        for (int i = 0; i < config_.samples_per_label; i++) {
            data.incidents.push_back(joinTokens(generator.generate(intrusion_set)));
            data.labels.push_back(label);
        }
    }
    return data;
}

TrainedModel fitPipeline(const std::vector<std::string>& incidents,
                         const std::vector<std::string>& labels,
                         double nb_alpha) {
    CountVectorizer vectorizer;
    vectorizer.fit(incidents);

    auto classifier = std::make_unique<BernoulliNaiveBayes>(nb_alpha);
    classifier->fit(vectorizer.transform(incidents), labels, vectorizer.size());

    return TrainedModel(std::move(vectorizer), std::move(classifier));
}

TrainingResult Trainer::retrain(VersionPart part) const {
    try {
        IncidentDataset data = createIncidentData();
        SplitIndices split = stratifiedSplit(data.labels, config_.test_size, config_.random_seed);

        auto train_x = select(data.incidents, split.train);
        auto train_y = select(data.labels, split.train);
        auto test_x = select(data.incidents, split.test);
        auto test_y = select(data.labels, split.test);

        auto model = std::make_shared<const TrainedModel>(
            fitPipeline(train_x, train_y, config_.nb_alpha));

        std::vector<std::string> predicted;
        predicted.reserve(test_x.size());
        for (const auto& incident : test_x) {
            predicted.push_back(model->predictLabel(incident));
        }

        TrainingResult result;
        result.model = std::move(model);
        result.f1_score = f1Score(test_y, predicted, config_.averaging);
        result.database_version = database_version_.incremented(part);

        spdlog::info("Trained on {} incidents, validated on {}: f1={:.4f}, version {}",
                     train_x.size(), test_x.size(), result.f1_score,
                     result.database_version.toString());
        return result;
    } catch (const TrainingInternalError& e) {
        spdlog::warn("Retraining failed: {}", e.what());
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("Retraining failed: {}", e.what());
        throw TrainingInternalError(std::string("Retraining failed: ") + e.what());
    }
}

} // namespace attrtools
