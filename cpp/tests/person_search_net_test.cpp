#include "person_search_net.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace {
constexpr int kFeatureDim = 6;
constexpr int kConvChannels = 2;
constexpr int kPooled = 2;

// Deterministic stand-in for the ncnn backbone.
class FakeBackbone : public Backbone {
public:
    explicit FakeBackbone(bool flattens) : flattens_(flattens) {}

    FeatureMap Head(const RgbImage& image) const override {
        ++head_calls;
        FeatureMap conv(kConvChannels, image.h / 4, image.w / 4);
        for (int ch = 0; ch < conv.c; ++ch) {
            for (int y = 0; y < conv.h; ++y) {
                for (int x = 0; x < conv.w; ++x) {
                    const uint8_t px = image.rgb[(static_cast<size_t>(y * 4) * image.w + x * 4) * 3];
                    conv.at(ch, y, x) = 0.1f * static_cast<float>(ch + 1) + 0.05f * static_cast<float>(x) +
                                        0.02f * static_cast<float>(y) + static_cast<float>(px) / 255.0f;
                }
            }
        }
        return conv;
    }

    FeatureMap Tail(const FeatureMap& pooled) const override {
        ++tail_calls;
        last_tail_c = pooled.c;
        last_tail_h = pooled.h;
        last_tail_w = pooled.w;
        const int side = flattens_ ? 1 : 2;
        FeatureMap out(kFeatureDim, side, side);
        for (int k = 0; k < kFeatureDim; ++k) {
            float v = 0.0f;
            for (size_t i = 0; i < pooled.data.size(); ++i) {
                v += pooled.data[i] * std::cos(0.37f * static_cast<float>(k) + 0.11f * static_cast<float>(i));
            }
            for (int y = 0; y < side; ++y) {
                for (int x = 0; x < side; ++x) out.at(k, y, x) = v;
            }
        }
        return out;
    }

    int FeatureDim() const override { return kFeatureDim; }
    bool FlattensPooled() const override { return flattens_; }

    mutable std::atomic<int> head_calls{0};
    mutable std::atomic<int> tail_calls{0};
    mutable int last_tail_c = 0;
    mutable int last_tail_h = 0;
    mutable int last_tail_w = 0;

private:
    bool flattens_;
};

DatasetPreset TinyDataset(int queue_size = 4) {
    DatasetPreset preset;
    preset.name = "tiny";
    preset.num_identities = 10;
    preset.queue_size = queue_size;
    preset.feature_dim = 8;
    preset.momentum = 0.5f;
    return preset;
}

struct Fixture {
    FakeBackbone* backbone = nullptr;
    std::unique_ptr<PersonSearchNet> net;
};

Fixture MakeNet(bool is_train, bool flattens = false, unsigned seed = 1, int queue_size = 4) {
    Fixture f;
    auto backbone = std::make_unique<FakeBackbone>(flattens);
    f.backbone = backbone.get();
    f.net = std::make_unique<PersonSearchNet>(std::move(backbone),
                                              std::make_unique<RoiAlignProposer>(kPooled, 0.25f),
                                              TinyDataset(queue_size), is_train, seed);
    return f;
}

RgbImage MakeImage() {
    RgbImage img;
    img.w = 32;
    img.h = 32;
    img.rgb.resize(static_cast<size_t>(img.w) * img.h * 3);
    for (size_t i = 0; i < img.rgb.size(); ++i) img.rgb[i] = static_cast<uint8_t>((i * 7) % 251);
    return img;
}

const ImageInfo kInfo{32.0f, 32.0f, 1.0f};

std::vector<GroundTruthBox> MixedGroundTruth() {
    return {
        {{0.0f, 0.0f, 12.0f, 24.0f}, 1, 3},
        {{14.0f, 2.0f, 30.0f, 30.0f}, 1, -1},
        {{4.0f, 20.0f, 10.0f, 31.0f}, 0, -1},
    };
}

std::vector<BBox> TwoBoxes() {
    return {BBox{0.0f, 0.0f, 12.0f, 24.0f}, BBox{14.0f, 2.0f, 30.0f, 30.0f}};
}

void SeedBank(IdentityBank& bank) {
    Matrix e(2, bank.dim());
    for (int k = 0; k < bank.dim(); ++k) {
        e(0, k) = static_cast<float>(k + 1);
        e(1, k) = static_cast<float>(bank.dim() - k);
    }
    bank.Update(e, {SampleLabel::known(5), SampleLabel::unlabeled()});
}
}  // namespace

TEST(ModeTest, ParsesKnownNames) {
    EXPECT_EQ(ParseMode("train"), Mode::Train);
    EXPECT_EQ(ParseMode("gallery"), Mode::Gallery);
    EXPECT_EQ(ParseMode("query"), Mode::Query);
    EXPECT_STREQ(ModeName(Mode::Gallery), "gallery");
    EXPECT_THROW(ParseMode("banana"), std::invalid_argument);
    EXPECT_THROW(ParseMode("Train"), std::invalid_argument);
}

TEST(DenormalizeBoxDeltasTest, AppliesStdThenMeanPerCoordinate) {
    BoxNormalization norm;
    norm.means = {{1.0f, 2.0f, 3.0f, 4.0f}};
    norm.stds = {{0.5f, 0.5f, 2.0f, 2.0f}};
    const Matrix pred(1, 8, {2, 2, 2, 2, -1, -1, -1, -1});
    const Matrix out = DenormalizeBoxDeltas(pred, norm);
    const std::vector<float> expect = {2, 3, 7, 8, 0.5f, 1.5f, 1, 2};
    for (int c = 0; c < 8; ++c) EXPECT_FLOAT_EQ(out(0, c), expect[static_cast<size_t>(c)]);
    EXPECT_THROW(DenormalizeBoxDeltas(Matrix(1, 6), norm), std::invalid_argument);
}

TEST(PersonSearchNetTest, OptionsWithUnknownNamesAreRejected) {
    NetOptions bad_dataset;
    bad_dataset.dataset = "market1501";
    EXPECT_THROW(PersonSearchNet{bad_dataset}, std::invalid_argument);

    NetOptions bad_backbone;
    bad_backbone.backbone = "alexnet";
    EXPECT_THROW(PersonSearchNet{bad_backbone}, std::invalid_argument);
}

TEST(PersonSearchNetTest, TrainReturnsFiveLossesAndUpdatesBank) {
    Fixture f = MakeNet(true);
    const RgbImage image = MakeImage();
    const TrainStep step = f.net->Train(image, MixedGroundTruth(), kInfo);

    EXPECT_EQ(step.losses.rpn_cls, 0.0f);
    EXPECT_EQ(step.losses.rpn_box, 0.0f);
    EXPECT_TRUE(std::isfinite(step.losses.detection));
    EXPECT_GT(step.losses.detection, 0.0f);
    EXPECT_GE(step.losses.box, 0.0f);
    // Empty bank: uniform over 10 + 4 columns, one known row, three instances.
    EXPECT_NEAR(step.losses.identity, std::log(14.0f) / 3.0f, 1e-5f);

    EXPECT_EQ(step.fc7.rows(), 3);
    EXPECT_EQ(step.fc7.cols(), kFeatureDim);
    EXPECT_EQ(step.grads.cls_score.cols(), 2);
    EXPECT_EQ(step.grads.bbox_pred.cols(), 8);
    EXPECT_EQ(step.grads.reid_feat.rows(), 3);
    EXPECT_EQ(step.grads.reid_feat.cols(), 8);

    const IdentityBank& bank = f.net->bank();
    EXPECT_NEAR(bank.lut().rowNorm(3), 1.0f, 1e-5f);
    EXPECT_EQ(bank.queueCursor(), 1);
    EXPECT_NEAR(bank.queue().rowNorm(0), 1.0f, 1e-5f);
    for (int r = 0; r < bank.numIdentities(); ++r) {
        if (r != 3) EXPECT_EQ(bank.lut().rowNorm(r), 0.0f);
    }
}

TEST(PersonSearchNetTest, SecondStepSeesUpdatedBank) {
    Fixture f = MakeNet(true);
    const RgbImage image = MakeImage();
    const TrainStep first = f.net->Train(image, MixedGroundTruth(), kInfo);
    const TrainStep second = f.net->Train(image, MixedGroundTruth(), kInfo);
    // The known region now matches its own LUT row.
    EXPECT_LT(second.losses.identity, first.losses.identity);
    EXPECT_EQ(f.net->bank().queueCursor(), 2);
}

TEST(PersonSearchNetTest, TrainRequiresTrainingNetworkAndGroundTruth) {
    Fixture infer = MakeNet(false);
    const RgbImage image = MakeImage();
    EXPECT_THROW(infer.net->Train(image, MixedGroundTruth(), kInfo), std::logic_error);

    Fixture train = MakeNet(true);
    EXPECT_THROW(train.net->Train(image, {}, kInfo), std::invalid_argument);
    EXPECT_EQ(train.net->bank().queueCursor(), 0);
}

TEST(PersonSearchNetTest, CorruptIdentityIdLeavesBankUntouched) {
    Fixture f = MakeNet(true);
    SeedBank(f.net->bank());
    const Matrix lut = f.net->bank().lut();
    const Matrix queue = f.net->bank().queue();

    const RgbImage image = MakeImage();
    std::vector<GroundTruthBox> gt = MixedGroundTruth();
    gt[1].pid = -7;
    EXPECT_THROW(f.net->Train(image, gt, kInfo), std::out_of_range);
    gt[1].pid = 10;  // one past the last identity
    EXPECT_THROW(f.net->Train(image, gt, kInfo), std::out_of_range);

    EXPECT_EQ(f.net->bank().lut(), lut);
    EXPECT_EQ(f.net->bank().queue(), queue);
    EXPECT_EQ(f.net->bank().queueCursor(), 1);
}

TEST(PersonSearchNetTest, InferenceOnTrainingNetworkIsRejected) {
    Fixture f = MakeNet(true);
    const RgbImage image = MakeImage();
    EXPECT_THROW(f.net->InferGallery(image, TwoBoxes(), kInfo, BoxNormalization{}), std::logic_error);
    EXPECT_THROW(f.net->InferQuery(image, TwoBoxes(), kInfo), std::logic_error);
    EXPECT_EQ(f.backbone->head_calls.load(), 0);
}

TEST(PersonSearchNetTest, UnknownModeFailsBeforeAnyWork) {
    for (bool is_train : {false, true}) {
        Fixture f = MakeNet(is_train);
        SeedBank(f.net->bank());
        const Matrix lut = f.net->bank().lut();
        const Matrix queue = f.net->bank().queue();

        const RgbImage image = MakeImage();
        InferenceRequest request;
        request.image = &image;
        request.boxes = TwoBoxes();
        request.im_info = kInfo;
        EXPECT_THROW(f.net->Infer("banana", request), std::invalid_argument);
        EXPECT_THROW(f.net->Infer("train", request), std::invalid_argument);

        EXPECT_EQ(f.backbone->head_calls.load(), 0);
        EXPECT_EQ(f.net->bank().lut(), lut);
        EXPECT_EQ(f.net->bank().queue(), queue);
        EXPECT_EQ(f.net->bank().queueCursor(), 1);
    }
}

TEST(PersonSearchNetTest, GalleryProducesScoresBoxesAndUnitEmbeddings) {
    Fixture f = MakeNet(false);
    SeedBank(f.net->bank());
    const Matrix lut = f.net->bank().lut();
    const Matrix queue = f.net->bank().queue();

    const RgbImage image = MakeImage();
    const GalleryOutput out = f.net->InferGallery(image, TwoBoxes(), kInfo, BoxNormalization{});
    ASSERT_EQ(out.cls_prob.rows(), 2);
    ASSERT_EQ(out.cls_prob.cols(), 2);
    EXPECT_EQ(out.bbox_pred.cols(), 8);
    EXPECT_EQ(out.rois.size(), 2u);
    ASSERT_EQ(out.embeddings.rows(), 2);
    ASSERT_EQ(out.embeddings.cols(), 8);
    for (int r = 0; r < 2; ++r) {
        EXPECT_NEAR(out.cls_prob(r, 0) + out.cls_prob(r, 1), 1.0f, 1e-6f);
        EXPECT_NEAR(out.embeddings.rowNorm(r), 1.0f, 1e-5f);
    }
    EXPECT_EQ(f.backbone->head_calls.load(), 1);
    EXPECT_EQ(f.net->bank().lut(), lut);
    EXPECT_EQ(f.net->bank().queue(), queue);
}

TEST(PersonSearchNetTest, GalleryBoxDeltasAreDenormalized) {
    Fixture f = MakeNet(false);
    LinearHead& bbox = f.net->bboxPredNet();
    bbox.weight().setZero();
    for (int c = 0; c < 8; ++c) bbox.bias()[static_cast<size_t>(c)] = 0.25f * static_cast<float>(c + 1);

    const RgbImage image = MakeImage();
    BoxNormalization identity;
    identity.means = {{0.0f, 0.0f, 0.0f, 0.0f}};
    identity.stds = {{1.0f, 1.0f, 1.0f, 1.0f}};
    const GalleryOutput raw = f.net->InferGallery(image, TwoBoxes(), kInfo, identity);

    const BoxNormalization defaults;
    const GalleryOutput scaled = f.net->InferGallery(image, TwoBoxes(), kInfo, defaults);
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 8; ++c) {
            const float b = 0.25f * static_cast<float>(c + 1);
            EXPECT_FLOAT_EQ(raw.bbox_pred(r, c), b);
            const size_t k = static_cast<size_t>(c % 4);
            EXPECT_FLOAT_EQ(scaled.bbox_pred(r, c), b * defaults.stds[k] + defaults.means[k]);
        }
    }
}

TEST(PersonSearchNetTest, QueryEmbeddingsMatchGalleryForSameBoxes) {
    Fixture f = MakeNet(false);
    const RgbImage image = MakeImage();
    InferenceRequest request;
    request.image = &image;
    request.boxes = TwoBoxes();
    request.im_info = kInfo;

    const InferenceOutput query = f.net->Infer("query", request);
    const InferenceOutput gallery = f.net->Infer("gallery", request);
    ASSERT_TRUE(std::holds_alternative<QueryOutput>(query));
    ASSERT_TRUE(std::holds_alternative<GalleryOutput>(gallery));

    const Matrix& q = std::get<QueryOutput>(query).embeddings;
    const Matrix& g = std::get<GalleryOutput>(gallery).embeddings;
    ASSERT_EQ(q.rows(), 2);
    for (int r = 0; r < 2; ++r) {
        EXPECT_NEAR(q.rowNorm(r), 1.0f, 1e-5f);
        for (int c = 0; c < q.cols(); ++c) EXPECT_FLOAT_EQ(q(r, c), g(r, c));
    }
    // Distinct regions give distinct embeddings.
    EXPECT_NE(q.getRow(0), q.getRow(1));
}

TEST(PersonSearchNetTest, InferWithoutImageIsRejected) {
    Fixture f = MakeNet(false);
    InferenceRequest request;
    request.boxes = TwoBoxes();
    EXPECT_THROW(f.net->Infer("query", request), std::invalid_argument);
}

TEST(PersonSearchNetTest, FlatteningFamilyFeedsTailFlatRegions) {
    Fixture f = MakeNet(false, true);
    const RgbImage image = MakeImage();
    const QueryOutput out = f.net->InferQuery(image, TwoBoxes(), kInfo);
    EXPECT_EQ(out.embeddings.rows(), 2);
    EXPECT_EQ(f.backbone->tail_calls.load(), 2);
    EXPECT_EQ(f.backbone->last_tail_c, kConvChannels * kPooled * kPooled);
    EXPECT_EQ(f.backbone->last_tail_h, 1);
    EXPECT_EQ(f.backbone->last_tail_w, 1);
}

TEST(PersonSearchNetTest, SpatialFamilyFeedsTailPooledRegions) {
    Fixture f = MakeNet(false, false);
    const RgbImage image = MakeImage();
    (void)f.net->InferQuery(image, TwoBoxes(), kInfo);
    EXPECT_EQ(f.backbone->last_tail_c, kConvChannels);
    EXPECT_EQ(f.backbone->last_tail_h, kPooled);
    EXPECT_EQ(f.backbone->last_tail_w, kPooled);
}

TEST(PersonSearchNetTest, ConcurrentTrainingStepsAreSerialized) {
    Fixture f = MakeNet(true, false, 1, 64);
    const RgbImage image = MakeImage();
    const std::vector<GroundTruthBox> gt = {{{0.0f, 0.0f, 12.0f, 24.0f}, 1, -1},
                                            {{14.0f, 2.0f, 30.0f, 30.0f}, 1, -1}};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 5; ++i) f.net->Train(image, gt, kInfo);
        });
    }
    for (std::thread& w : workers) w.join();
    EXPECT_EQ(f.net->bank().queueCursor(), 40);
    EXPECT_EQ(f.backbone->head_calls.load(), 20);
}

TEST(PersonSearchNetTest, CheckpointRestoresHeadsAndBank) {
    Fixture trained = MakeNet(true, false, 7);
    const RgbImage image = MakeImage();
    (void)trained.net->Train(image, MixedGroundTruth(), kInfo);
    const std::string path = ::testing::TempDir() + "person_search_state.bin";
    trained.net->SaveState(path);

    Fixture restored = MakeNet(false, false, 99);
    ASSERT_NE(restored.net->reidFeatNet().weight(), trained.net->reidFeatNet().weight());
    restored.net->LoadState(path);
    EXPECT_EQ(restored.net->clsScoreNet().weight(), trained.net->clsScoreNet().weight());
    EXPECT_EQ(restored.net->bboxPredNet().bias(), trained.net->bboxPredNet().bias());
    EXPECT_EQ(restored.net->reidFeatNet().weight(), trained.net->reidFeatNet().weight());
    EXPECT_EQ(restored.net->bank().lut(), trained.net->bank().lut());
    EXPECT_EQ(restored.net->bank().queue(), trained.net->bank().queue());
    EXPECT_EQ(restored.net->bank().queueCursor(), trained.net->bank().queueCursor());
}

TEST(PersonSearchNetTest, BadCheckpointLeavesNetworkUnchanged) {
    Fixture f = MakeNet(false, false, 3);
    const Matrix weight = f.net->reidFeatNet().weight();
    EXPECT_THROW(f.net->LoadState(::testing::TempDir() + "missing_state.bin"), std::runtime_error);

    const std::string path = ::testing::TempDir() + "garbage_state.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "not a checkpoint at all";
    }
    EXPECT_THROW(f.net->LoadState(path), std::runtime_error);

    // A valid header followed by a truncated body.
    Fixture other = MakeNet(true, false, 4);
    const std::string good = ::testing::TempDir() + "good_state.bin";
    other.net->SaveState(good);
    std::string bytes;
    {
        std::ifstream in(good, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    const std::string cut = ::testing::TempDir() + "cut_state.bin";
    {
        std::ofstream out(cut, std::ios::binary);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size() / 2));
    }
    EXPECT_THROW(f.net->LoadState(cut), std::runtime_error);
    EXPECT_EQ(f.net->reidFeatNet().weight(), weight);
}

TEST(PersonSearchNetTest, CheckpointFromOppositeByteOrderIsReported) {
    Fixture saved = MakeNet(true, false, 5);
    const std::string good = ::testing::TempDir() + "native_state.bin";
    saved.net->SaveState(good);
    std::string bytes;
    {
        std::ifstream in(good, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    ASSERT_GE(bytes.size(), 4u);
    std::reverse(bytes.begin(), bytes.begin() + 4);
    const std::string swapped = ::testing::TempDir() + "swapped_state.bin";
    {
        std::ofstream out(swapped, std::ios::binary);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    Fixture f = MakeNet(false, false, 6);
    const Matrix weight = f.net->clsScoreNet().weight();
    try {
        f.net->LoadState(swapped);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("byte order"), std::string::npos) << e.what();
    }
    EXPECT_EQ(f.net->clsScoreNet().weight(), weight);
}
