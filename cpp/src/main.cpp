#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "annotations.hpp"
#include "config.hpp"
#include "identity_bank.hpp"
#include "image_io.hpp"
#include "person_search_net.hpp"

// Exit codes
enum ExitCode {
    SUCCESS = 0,
    ERR_INVALID_ARGS = 1,
    ERR_MODEL_NOT_FOUND = 2,
    ERR_IMAGE_LOAD_FAILED = 3,
    ERR_INFERENCE_FAILED = 4,
    ERR_NO_INPUT = 5,
    ERR_SELF_TEST_FAILED = 6,
    ERR_CONFIG = 7
};

void PrintUsage(const char* prog) {
    fprintf(stderr, "Person Search (joint detection + re-identification)\n\n");
    fprintf(stderr, "Usage:\n");
    fprintf(stderr, "  Gallery (detect + identify the given regions):\n");
    fprintf(stderr, "    %s --gallery --model <dir> --image <path> --boxes <x1,y1,x2,y2;...> [options]\n\n", prog);
    fprintf(stderr, "  Query (embedding of known person boxes):\n");
    fprintf(stderr, "    %s --query --model <dir> --image <path> --boxes <x1,y1,x2,y2;...> [options]\n\n", prog);
    fprintf(stderr, "  Training step on ground-truth regions:\n");
    fprintf(stderr, "    %s --train --model <dir> --image <path> --gt <x1,y1,x2,y2,cls,pid;...> --save <file>\n\n", prog);
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  --mode <name>        gallery, query or train (same as the flags above)\n");
    fprintf(stderr, "  --model <dir>        Directory containing head.param/.bin and tail.param/.bin\n");
    fprintf(stderr, "  --backbone <name>    vgg16, res34, res50, dense121, dense161 (default: res50)\n");
    fprintf(stderr, "  --dataset <name>     sysu or prw (default: sysu)\n");
    fprintf(stderr, "  --checkpoint <file>  Load head weights and identity bank\n");
    fprintf(stderr, "  --save <file>        Write head weights and identity bank (train)\n");
    fprintf(stderr, "  --config <file>      Box normalization YAML (default: config.yml, gallery only)\n");
    fprintf(stderr, "  --pool <int>         Pooled region size (default: 7)\n");
    fprintf(stderr, "  --stride <int>       Backbone head stride (default: 16)\n");
    fprintf(stderr, "  --seed <int>         Head initialization seed (default: 0)\n");
    fprintf(stderr, "  --self-test          Run the deterministic identity bank self-test\n");
    fprintf(stderr, "\nEnvironment:\n");
    fprintf(stderr, "  PERSON_SEARCH_NCNN_THREADS  ncnn worker threads (default: 1-4)\n");
    fprintf(stderr, "\nOutput: JSON to stdout\n");
    fprintf(stderr, "\nExit codes:\n");
    fprintf(stderr, "  0 - Success\n");
    fprintf(stderr, "  1 - Invalid arguments\n");
    fprintf(stderr, "  2 - Model files not found\n");
    fprintf(stderr, "  3 - Image load failed\n");
    fprintf(stderr, "  4 - Inference error\n");
    fprintf(stderr, "  5 - No input provided\n");
    fprintf(stderr, "  6 - Self-test failed\n");
    fprintf(stderr, "  7 - Configuration error\n");
}

void PrintRow(const float* v, int n) {
    printf("[");
    for (int i = 0; i < n; ++i) {
        printf("%.6f%s", v[i], i + 1 < n ? ", " : "");
    }
    printf("]");
}

void PrintEmbeddings(const Matrix& emb) {
    printf("  \"embeddings\": [\n");
    for (int r = 0; r < emb.rows(); ++r) {
        printf("    ");
        PrintRow(emb.row(r), emb.cols());
        printf("%s\n", r + 1 < emb.rows() ? "," : "");
    }
    printf("  ]\n");
}

void PrintGallery(const GalleryOutput& out) {
    printf("{\n");
    printf("  \"detections\": [\n");
    for (int r = 0; r < out.cls_prob.rows(); ++r) {
        const BBox& roi = out.rois[static_cast<size_t>(r)];
        printf("    {\n");
        printf("      \"roi\": [%.2f, %.2f, %.2f, %.2f],\n", roi.x1, roi.y1, roi.x2, roi.y2);
        printf("      \"personProb\": %.4f,\n", out.cls_prob(r, 1));
        printf("      \"bboxPred\": ");
        PrintRow(out.bbox_pred.row(r), out.bbox_pred.cols());
        printf(",\n");
        printf("      \"embedding\": ");
        PrintRow(out.embeddings.row(r), out.embeddings.cols());
        printf("\n");
        printf("    }%s\n", r + 1 < out.cls_prob.rows() ? "," : "");
    }
    printf("  ]\n");
    printf("}\n");
}

// Deterministic check of the identity bank update protocol (no model files needed).
int RunBankSelfTest() {
    const DatasetPreset sysu = FindDatasetPreset("sysu");
    IdentityBank bank(sysu.num_identities, sysu.queue_size, sysu.feature_dim, sysu.momentum);
    const int d = bank.dim();

    Matrix emb(4, d);
    for (int b = 0; b < 4; ++b) {
        for (int k = 0; k < d; ++k) {
            emb(b, k) = std::sin(0.37f * static_cast<float>((b + 1) * (k + 3)));
        }
    }
    emb.normalizeRows();
    const std::vector<SampleLabel> labels = {
        SampleLabel::known(10), SampleLabel::unlabeled(),
        SampleLabel::background(), SampleLabel::known(10)};

    bank.Update(emb, labels);

    // lut[10] = normalize(0.5 * normalize(0.5 * e1) + 0.5 * e4)
    std::vector<float> expect(emb.row(0), emb.row(0) + d);
    for (int k = 0; k < d; ++k) expect[static_cast<size_t>(k)] = 0.5f * expect[static_cast<size_t>(k)] + 0.5f * emb(3, k);
    L2Normalize(expect.data(), d);

    float max_err = 0.0f;
    for (int k = 0; k < d; ++k) {
        max_err = std::max(max_err, std::abs(bank.lut()(10, k) - expect[static_cast<size_t>(k)]));
        max_err = std::max(max_err, std::abs(bank.queue()(0, k) - emb(1, k)));
    }
    const bool cursor_ok = bank.queueCursor() == 1;
    const bool norm_ok = std::abs(bank.lut().rowNorm(10) - 1.0f) < 1e-5f;

    bool mode_rejected = false;
    try {
        (void)ParseMode("banana");
    } catch (const std::invalid_argument&) {
        mode_rejected = true;
    }

    if (max_err > 1e-5f || !cursor_ok || !norm_ok || !mode_rejected) {
        fprintf(stderr,
                "Identity bank self-test failed (max_err=%.6g, cursor=%d, |lut[10]|=%.6f, mode_rejected=%d)\n",
                max_err, bank.queueCursor(), bank.lut().rowNorm(10), mode_rejected ? 1 : 0);
        return ERR_SELF_TEST_FAILED;
    }
    fprintf(stderr, "Identity bank self-test passed (max_err=%.3g)\n", max_err);
    return SUCCESS;
}

int main(int argc, char** argv) {
    NetOptions options;
    std::string mode;
    std::string image_path;
    std::string boxes_arg;
    std::string gt_arg;
    std::string checkpoint_path;
    std::string save_path;
    std::string config_path = "config.yml";
    bool self_test = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--gallery") == 0) {
            mode = "gallery";
        } else if (strcmp(argv[i], "--query") == 0) {
            mode = "query";
        } else if (strcmp(argv[i], "--train") == 0) {
            mode = "train";
        } else if (strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            mode = argv[++i];
        } else if (strcmp(argv[i], "--self-test") == 0) {
            self_test = true;
        } else if (strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            options.model_dir = argv[++i];
        } else if (strcmp(argv[i], "--backbone") == 0 && i + 1 < argc) {
            options.backbone = argv[++i];
        } else if (strcmp(argv[i], "--dataset") == 0 && i + 1 < argc) {
            options.dataset = argv[++i];
        } else if (strcmp(argv[i], "--image") == 0 && i + 1 < argc) {
            image_path = argv[++i];
        } else if (strcmp(argv[i], "--boxes") == 0 && i + 1 < argc) {
            boxes_arg = argv[++i];
        } else if (strcmp(argv[i], "--gt") == 0 && i + 1 < argc) {
            gt_arg = argv[++i];
        } else if (strcmp(argv[i], "--checkpoint") == 0 && i + 1 < argc) {
            checkpoint_path = argv[++i];
        } else if (strcmp(argv[i], "--save") == 0 && i + 1 < argc) {
            save_path = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--pool") == 0 && i + 1 < argc) {
            options.pooled_size = atoi(argv[++i]);
        } else if (strcmp(argv[i], "--stride") == 0 && i + 1 < argc) {
            const int stride = atoi(argv[++i]);
            options.spatial_scale = stride > 0 ? 1.0f / static_cast<float>(stride) : 0.0f;
        } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            options.seed = static_cast<unsigned>(strtoul(argv[++i], nullptr, 10));
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return SUCCESS;
        }
    }

    if (self_test) {
        return RunBankSelfTest();
    }

    if (mode.empty()) {
        fprintf(stderr, "Error: one of --gallery, --query or --train is required\n\n");
        PrintUsage(argv[0]);
        return ERR_INVALID_ARGS;
    }
    Mode run_mode = Mode::Gallery;
    try {
        run_mode = ParseMode(mode);
    } catch (const std::invalid_argument& e) {
        fprintf(stderr, "Error: %s (expected gallery, query or train)\n", e.what());
        return ERR_CONFIG;
    }
    if (options.model_dir.empty()) {
        fprintf(stderr, "Error: --model is required\n\n");
        PrintUsage(argv[0]);
        return ERR_INVALID_ARGS;
    }
    if (image_path.empty()) {
        fprintf(stderr, "Error: --image is required\n");
        return ERR_NO_INPUT;
    }

    std::vector<BBox> boxes;
    std::vector<GroundTruthBox> gt_boxes;
    if (run_mode == Mode::Train) {
        if (!ParseGroundTruth(gt_arg, gt_boxes) || gt_boxes.empty()) {
            fprintf(stderr, "Error: --gt expects x1,y1,x2,y2,cls,pid rows separated by ';' (integer cls and pid)\n");
            return ERR_INVALID_ARGS;
        }
    } else if (!ParseBoxes(boxes_arg, boxes) || boxes.empty()) {
        fprintf(stderr, "Error: --boxes expects x1,y1,x2,y2 rows separated by ';'\n");
        return ERR_INVALID_ARGS;
    }

    // Box de-normalization is only needed (and only read) for gallery inference.
    BoxNormalization box_norm;
    if (run_mode == Mode::Gallery) {
        try {
            box_norm = LoadBoxNormalization(config_path);
        } catch (const std::exception& e) {
            fprintf(stderr, "Error: %s\n", e.what());
            return ERR_CONFIG;
        }
    }

    options.is_train = run_mode == Mode::Train;
    std::unique_ptr<PersonSearchNet> net;
    try {
        net = std::make_unique<PersonSearchNet>(options);
        if (!checkpoint_path.empty()) net->LoadState(checkpoint_path);
    } catch (const std::invalid_argument& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return ERR_CONFIG;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: Failed to load model from %s: %s\n", options.model_dir.c_str(), e.what());
        return ERR_MODEL_NOT_FOUND;
    }

    RgbImage image;
    if (!LoadRgbImage(image_path, image)) {
        fprintf(stderr, "Error: Failed to load image %s\n", image_path.c_str());
        return ERR_IMAGE_LOAD_FAILED;
    }
    ImageInfo im_info;
    im_info.height = static_cast<float>(image.h);
    im_info.width = static_cast<float>(image.w);
    im_info.scale = 1.0f;

    try {
        switch (run_mode) {
            case Mode::Train: {
                const TrainStep step = net->Train(image, gt_boxes, im_info);
                const TrainingLosses& l = step.losses;
                printf("{\n");
                printf("  \"rpnClsLoss\": %.6f,\n", l.rpn_cls);
                printf("  \"rpnBoxLoss\": %.6f,\n", l.rpn_box);
                printf("  \"clsLoss\": %.6f,\n", l.detection);
                printf("  \"bboxLoss\": %.6f,\n", l.box);
                printf("  \"reidLoss\": %.6f,\n", l.identity);
                printf("  \"queueCursor\": %d\n", net->bank().queueCursor());
                printf("}\n");
                if (!save_path.empty()) net->SaveState(save_path);
                break;
            }
            case Mode::Gallery:
                PrintGallery(net->InferGallery(image, boxes, im_info, box_norm));
                break;
            case Mode::Query: {
                const QueryOutput out = net->InferQuery(image, boxes, im_info);
                printf("{\n");
                PrintEmbeddings(out.embeddings);
                printf("}\n");
                break;
            }
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s failed: %s\n", ModeName(run_mode), e.what());
        return ERR_INFERENCE_FAILED;
    }

    return SUCCESS;
}
