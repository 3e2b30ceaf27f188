#include <gtest/gtest.h>
#include "registry/model_store.hpp"
#include "prediction/predictor.hpp"
#include "training/trainer.hpp"
#include "stix_fixtures.hpp"

#include <filesystem>
#include <fstream>
#include <regex>

using namespace attrtools;
namespace fs = std::filesystem;

namespace {

class ScratchDir {
public:
    explicit ScratchDir(const std::string& name)
        : path_(fs::temp_directory_path() / ("attrtools_" + name)) {
        fs::remove_all(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    std::string str() const { return path_.string(); }
    fs::path operator/(const std::string& leaf) const { return path_ / leaf; }

private:
    fs::path path_;
};

TrainingResult trainSmall() {
    TrainingConfig cfg;
    cfg.samples_per_label = 30;
    return Trainer(fixtures::corpus(), kDefaultDatabaseVersion, cfg).retrain();
}

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // namespace

TEST(ModelStoreTest, SaveLoadRoundTrip) {
    ScratchDir dir("roundtrip");
    TrainingResult trained = trainSmall();

    ModelStore store(dir.str());
    store.save(*trained.model, trained.database_version);
    EXPECT_TRUE(fs::exists(store.modelPath()));
    EXPECT_TRUE(fs::exists(store.metaDataPath()));

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->database_version, DatabaseVersion(0, 0, 2));
    EXPECT_FALSE(loaded->time_metadata_created.empty());
    EXPECT_EQ(loaded->model->labels(), trained.model->labels());

    std::string features = fixtures::aggahFeatureString();
    auto before = trained.model->scores(features);
    auto after = loaded->model->scores(features);
    ASSERT_EQ(before.size(), after.size());
    for (size_t i = 0; i < before.size(); i++) {
        EXPECT_NEAR(before[i], after[i], 1e-12);
    }
}

TEST(ModelStoreTest, LoadedModelServesPredictions) {
    ScratchDir dir("serve");
    TrainingResult trained = trainSmall();
    ModelStore(dir.str()).save(*trained.model, trained.database_version);

    auto loaded = ModelStore(dir.str()).load();
    ASSERT_TRUE(loaded.has_value());
    Predictor predictor(loaded->model, loaded->database_version);
    auto out = predictor.predict(fixtures::makeBundle(fixtures::unc2891()).dump());
    ASSERT_TRUE(out["label"].is_object());
    EXPECT_EQ(out["label"]["labels"][0], fixtures::kUnc2891Label);
    EXPECT_EQ(out["db_version"], "(0, 0, 2)");
}

TEST(ModelStoreTest, MissingDirectoryYieldsNothing) {
    ScratchDir dir("missing");
    EXPECT_FALSE(ModelStore(dir.str()).load().has_value());
}

TEST(ModelStoreTest, MissingMetadataFallsBackToDefaultVersion) {
    ScratchDir dir("nometa");
    TrainingResult trained = trainSmall();
    ModelStore store(dir.str());
    store.save(*trained.model, DatabaseVersion(3, 1, 4));
    fs::remove(store.metaDataPath());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->database_version, DatabaseVersion());
    EXPECT_TRUE(loaded->time_metadata_created.empty());
}

TEST(ModelStoreTest, BrokenMetadataFallsBackToDefaultVersion) {
    ScratchDir dir("badmeta");
    TrainingResult trained = trainSmall();
    ModelStore store(dir.str());
    store.save(*trained.model, DatabaseVersion(3, 1, 4));
    writeFile(store.metaDataPath(), R"({"db_version": "three"})");

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->database_version.toString(), kDefaultDatabaseVersion);
}

TEST(ModelStoreTest, BrokenModelYieldsNothing) {
    ScratchDir dir("badmodel");
    TrainingResult trained = trainSmall();
    ModelStore store(dir.str());
    store.save(*trained.model, trained.database_version);

    writeFile(store.modelPath(), "{\"vectorizer\": ");
    EXPECT_FALSE(store.load().has_value());

    writeFile(store.modelPath(), R"({"vectorizer": {"vocabulary": []}, "classifier": {"type": "svm"}})");
    EXPECT_FALSE(store.load().has_value());
}

TEST(ModelStoreTest, CustomFileNames) {
    ScratchDir dir("custom");
    TrainingResult trained = trainSmall();
    ModelStore store(dir.str(), "nb.json", "meta.json");
    store.save(*trained.model, trained.database_version);
    EXPECT_TRUE(fs::exists(dir / "nb.json"));
    EXPECT_TRUE(fs::exists(dir / "meta.json"));
    EXPECT_FALSE(ModelStore(dir.str()).load().has_value());
    EXPECT_TRUE(store.load().has_value());
}

TEST(ModelStoreTest, UtcTimestampFormat) {
    std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)");
    EXPECT_TRUE(std::regex_match(utcTimestamp(), iso));
}
