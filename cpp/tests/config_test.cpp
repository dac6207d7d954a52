#include "backbone.hpp"
#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace {
std::string WriteConfig(const std::string& name, const std::string& body) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << "%YAML:1.0\n---\n" << body;
    return path;
}
}  // namespace

TEST(DatasetPresetTest, KnownDatasets) {
    const DatasetPreset sysu = FindDatasetPreset("sysu");
    EXPECT_EQ(sysu.num_identities, 5532);
    EXPECT_EQ(sysu.queue_size, 5000);
    EXPECT_EQ(sysu.feature_dim, 256);
    EXPECT_FLOAT_EQ(sysu.momentum, 0.5f);

    const DatasetPreset prw = FindDatasetPreset("prw");
    EXPECT_EQ(prw.num_identities, 483);
    EXPECT_EQ(prw.queue_size, 500);
}

TEST(DatasetPresetTest, UnknownDatasetIsRejected) {
    EXPECT_THROW(FindDatasetPreset("market1501"), std::invalid_argument);
    EXPECT_THROW(FindDatasetPreset(""), std::invalid_argument);
}

TEST(BackboneSpecTest, FamilyTable) {
    EXPECT_EQ(FindBackboneSpec("vgg16").feature_dim, 4096);
    EXPECT_TRUE(FindBackboneSpec("vgg16").flattens_pooled);
    EXPECT_EQ(FindBackboneSpec("res34").feature_dim, 512);
    EXPECT_EQ(FindBackboneSpec("res50").feature_dim, 2048);
    EXPECT_FALSE(FindBackboneSpec("res50").flattens_pooled);
    EXPECT_EQ(FindBackboneSpec("dense121").feature_dim, 1024);
    EXPECT_EQ(FindBackboneSpec("dense161").feature_dim, 2208);
    EXPECT_THROW(FindBackboneSpec("alexnet"), std::invalid_argument);
}

TEST(BackboneSpecTest, UnknownNameFailsBeforeLoadingModels) {
    EXPECT_THROW(CreateBackbone("alexnet", "/nonexistent"), std::invalid_argument);
}

TEST(BackboneSpecTest, MissingModelFilesAreReported) {
    EXPECT_THROW(CreateBackbone("res50", ::testing::TempDir() + "no_such_model_dir"), std::runtime_error);
}

TEST(BoxNormalizationTest, DefaultsMatchTrainingTargets) {
    const BoxNormalization norm;
    EXPECT_FLOAT_EQ(norm.means[0], 0.0f);
    EXPECT_FLOAT_EQ(norm.stds[0], 0.1f);
    EXPECT_FLOAT_EQ(norm.stds[2], 0.2f);
}

TEST(BoxNormalizationTest, ReadsYaml) {
    const std::string path = WriteConfig("box_norm_ok.yml",
        "train_bbox_normalize_means: [ 0, 0.5, 0, -1.25 ]\n"
        "train_bbox_normalize_stds: [ 0.1, 0.1, 0.2, 0.2 ]\n");
    const BoxNormalization norm = LoadBoxNormalization(path);
    EXPECT_FLOAT_EQ(norm.means[0], 0.0f);
    EXPECT_FLOAT_EQ(norm.means[1], 0.5f);
    EXPECT_FLOAT_EQ(norm.means[3], -1.25f);
    EXPECT_FLOAT_EQ(norm.stds[1], 0.1f);
    EXPECT_FLOAT_EQ(norm.stds[3], 0.2f);
}

TEST(BoxNormalizationTest, MissingFileIsRuntimeError) {
    EXPECT_THROW(LoadBoxNormalization(::testing::TempDir() + "does_not_exist.yml"), std::runtime_error);
}

TEST(BoxNormalizationTest, MissingKeyIsRuntimeError) {
    const std::string path = WriteConfig("box_norm_missing.yml",
        "train_bbox_normalize_means: [ 0, 0, 0, 0 ]\n");
    EXPECT_THROW(LoadBoxNormalization(path), std::runtime_error);
}

TEST(BoxNormalizationTest, WrongLengthIsRuntimeError) {
    const std::string path = WriteConfig("box_norm_short.yml",
        "train_bbox_normalize_means: [ 0, 0, 0 ]\n"
        "train_bbox_normalize_stds: [ 0.1, 0.1, 0.2, 0.2 ]\n");
    EXPECT_THROW(LoadBoxNormalization(path), std::runtime_error);
}

TEST(EnvTest, FallsBackOnUnsetOrGarbage) {
    ::unsetenv("PERSON_SEARCH_TEST_VALUE");
    EXPECT_EQ(GetEnvInt("PERSON_SEARCH_TEST_VALUE", 3), 3);
    EXPECT_FLOAT_EQ(GetEnvFloat("PERSON_SEARCH_TEST_VALUE", 0.5f), 0.5f);

    ::setenv("PERSON_SEARCH_TEST_VALUE", "abc", 1);
    EXPECT_EQ(GetEnvInt("PERSON_SEARCH_TEST_VALUE", 3), 3);
    EXPECT_FLOAT_EQ(GetEnvFloat("PERSON_SEARCH_TEST_VALUE", 0.5f), 0.5f);

    ::setenv("PERSON_SEARCH_TEST_VALUE", "8", 1);
    EXPECT_EQ(GetEnvInt("PERSON_SEARCH_TEST_VALUE", 3), 8);
    EXPECT_FLOAT_EQ(GetEnvFloat("PERSON_SEARCH_TEST_VALUE", 0.5f), 8.0f);
    ::unsetenv("PERSON_SEARCH_TEST_VALUE");
}
