#if defined(__has_include) && __has_include(<gtest/gtest.h>)
    #include <gtest/gtest.h>
#elif defined(__has_include) && __has_include(<gtest.h>)
    #include <gtest.h>
#else
    #error "[ERROR] 'gtest.h' header not found"
#endif

#include "pipeline/box_ops.h"
#include "pipeline/detection_pipeline.h"

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using ssdet::AnchorSet;
using ssdet::BBox;
using ssdet::DetectionParams;
using ssdet::ImageDetections;
using ssdet::LayerAnchors;
using ssdet::Tensor;

namespace {

constexpr std::array<float, 4> kScaling{0.1f, 0.1f, 0.2f, 0.2f};

/// One 1x1 layer with two identical anchors of size 0.1 centered in the image.
static AnchorSet one_cell_two_anchors() {
    LayerAnchors a;
    a.H = 1;
    a.W = 1;
    a.cy = {0.5f};
    a.cx = {0.5f};
    a.h = {0.1f, 0.1f};
    a.w = {0.1f, 0.1f};
    return {a};
}

/// Probabilities [B,1,1,2,2]: anchor 0 -> class 1 at 0.9, anchor 1 -> class 1 at 0.8.
static Tensor predictions(int64_t B) {
    Tensor t = Tensor::zeros({B, 1, 1, 2, 2});
    for (int64_t b = 0; b < B; ++b) {
        float* p = t.ptr() + (std::size_t)b * 4;
        p[0] = 0.1f;
        p[1] = 0.9f;
        p[2] = 0.2f;
        p[3] = 0.8f;
    }
    return t;
}

/// Default routines plus a log of the calls made by the pipeline.
class RecordingOps : public ssdet::pipeline::DefaultBoxOps {
  public:
    mutable std::vector<std::string> calls;

    ssdet::Result<std::vector<Tensor>> decode(const std::vector<Tensor>& localisations, const AnchorSet& anchors,
                                              const std::array<float, 4>& prior_scaling) const override {
        calls.push_back("decode");
        return DefaultBoxOps::decode(localisations, anchors, prior_scaling);
    }

    ImageDetections select(const std::vector<float>& probs, const std::vector<BBox>& boxes, int num_classes,
                           float threshold) const override {
        calls.push_back("select");
        return DefaultBoxOps::select(probs, boxes, num_classes, threshold);
    }

    ImageDetections sort_top_k(ImageDetections dets, int top_k) const override {
        calls.push_back("sort_top_k");
        return DefaultBoxOps::sort_top_k(std::move(dets), top_k);
    }

    ImageDetections nms(ImageDetections dets, float nms_threshold, int keep_top_k) const override {
        calls.push_back("nms");
        return DefaultBoxOps::nms(std::move(dets), nms_threshold, keep_top_k);
    }

    ImageDetections clip(ImageDetections dets, const BBox& window) const override {
        calls.push_back("clip");
        return DefaultBoxOps::clip(std::move(dets), window);
    }
};

/// Decoder returning fixed boxes: A = x [0.5, 1.4], B = x [0.6, 1.0], both y [0, 1].
class FixedBoxesOps : public ssdet::pipeline::DefaultBoxOps {
  public:
    ssdet::Result<std::vector<Tensor>> decode(const std::vector<Tensor>&, const AnchorSet&,
                                              const std::array<float, 4>&) const override {
        Tensor t({1, 1, 1, 2, 4}, {0.f, 0.5f, 1.f, 1.4f, 0.f, 0.6f, 1.f, 1.f});
        return ssdet::Result<std::vector<Tensor>>::Ok({t});
    }
};

} // namespace

TEST(DetectionPipeline, StageOrder) {
    const RecordingOps ops{};
    const ssdet::pipeline::DetectionPipeline pipe(ops);

    DetectionParams params;
    params.clip = BBox{0.f, 0.f, 1.f, 1.f};
    auto r = pipe.run({predictions(1)}, {Tensor::zeros({1, 1, 1, 2, 4})}, one_cell_two_anchors(), kScaling, params);
    ASSERT_TRUE(r.ok()) << r.status().message;
    EXPECT_EQ(ops.calls, (std::vector<std::string>{"decode", "select", "sort_top_k", "nms", "clip"}));
}

TEST(DetectionPipeline, NoClipWindow_NoClipStage) {
    const RecordingOps ops{};
    const ssdet::pipeline::DetectionPipeline pipe(ops);

    auto r = pipe.run({predictions(2)}, {Tensor::zeros({2, 1, 1, 2, 4})}, one_cell_two_anchors(), kScaling, {});
    ASSERT_TRUE(r.ok()) << r.status().message;
    ASSERT_EQ(r.value().size(), 2u);
    // decoded once for the batch, then per image
    EXPECT_EQ(ops.calls, (std::vector<std::string>{"decode", "select", "sort_top_k", "nms", "select", "sort_top_k",
                                                   "nms"}));
}

TEST(DetectionPipeline, DefaultOps_ZeroOffsetsDetectAnchors) {
    const ssdet::pipeline::DefaultBoxOps ops{};
    const ssdet::pipeline::DetectionPipeline pipe(ops);

    auto r = pipe.run({predictions(1)}, {Tensor::zeros({1, 1, 1, 2, 4})}, one_cell_two_anchors(), kScaling, {});
    ASSERT_TRUE(r.ok()) << r.status().message;
    const ImageDetections& d = r.value()[0];

    // identical anchor boxes: the 0.8 duplicate is suppressed
    ASSERT_EQ(d.size(), 1u);
    ASSERT_EQ(d.at(1).size(), 1u);
    EXPECT_FLOAT_EQ(d.at(1)[0].score, 0.9f);
    EXPECT_NEAR(d.at(1)[0].box.ymin, 0.45f, 1e-6f);
    EXPECT_NEAR(d.at(1)[0].box.xmax, 0.55f, 1e-6f);
}

TEST(DetectionPipeline, SelectThresholdDropsLowScores) {
    const ssdet::pipeline::DefaultBoxOps ops{};
    const ssdet::pipeline::DetectionPipeline pipe(ops);

    DetectionParams params;
    params.select_threshold = 0.95f;
    auto r = pipe.run({predictions(1)}, {Tensor::zeros({1, 1, 1, 2, 4})}, one_cell_two_anchors(), kScaling, params);
    ASSERT_TRUE(r.ok()) << r.status().message;
    EXPECT_TRUE(r.value()[0].empty());
}

TEST(DetectionPipeline, NmsRunsBeforeClip) {
    // Before clipping IoU(A, B) = 0.4 / 0.9 < 0.5; after clipping it would be 0.8.
    const FixedBoxesOps ops{};
    const ssdet::pipeline::DetectionPipeline pipe(ops);

    DetectionParams params;
    params.nms_threshold = 0.5f;
    params.clip = BBox{0.f, 0.f, 1.f, 1.f};
    auto r = pipe.run({predictions(1)}, {Tensor::zeros({1, 1, 1, 2, 4})}, one_cell_two_anchors(), kScaling, params);
    ASSERT_TRUE(r.ok()) << r.status().message;

    const auto& boxes = r.value()[0].at(1);
    ASSERT_EQ(boxes.size(), 2u);
    EXPECT_FLOAT_EQ(boxes[0].score, 0.9f);
    EXPECT_FLOAT_EQ(boxes[0].box.xmin, 0.5f);
    EXPECT_FLOAT_EQ(boxes[0].box.xmax, 1.f);
    EXPECT_FLOAT_EQ(boxes[1].score, 0.8f);
}

TEST(DetectionPipeline, ShapeErrors) {
    const ssdet::pipeline::DefaultBoxOps ops{};
    const ssdet::pipeline::DetectionPipeline pipe(ops);
    const AnchorSet anchors = one_cell_two_anchors();

    // layer count
    EXPECT_EQ(pipe.run({}, {}, anchors, kScaling, {}).status().code, ssdet::Status::Code::InvalidArgument);

    // K mismatch
    auto k = pipe.run({Tensor::zeros({1, 1, 1, 3, 2})}, {Tensor::zeros({1, 1, 1, 3, 4})}, anchors, kScaling, {});
    EXPECT_EQ(k.status().code, ssdet::Status::Code::InvalidArgument);

    // localisations disagree with anchors
    auto l = pipe.run({predictions(1)}, {Tensor::zeros({1, 1, 1, 2, 3})}, anchors, kScaling, {});
    EXPECT_EQ(l.status().code, ssdet::Status::Code::InvalidArgument);
}
