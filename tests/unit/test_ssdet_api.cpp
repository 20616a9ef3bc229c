#if defined(__has_include) && __has_include(<gtest/gtest.h>)
    #include <gtest/gtest.h>
#elif defined(__has_include) && __has_include(<gtest.h>)
    #include <gtest.h>
#else
    #error "[ERROR] 'gtest.h' header not found"
#endif

#include "ssdet.h"

#include "platform/omp_config.h"

#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using ssdet::NetConfig;
using ssdet::Status;
using ssdet::Tensor;

namespace {

/// 100x100 input, one 2x2 layer whose anchors tile the image in four 0.5x0.5 boxes.
static NetConfig tiny_config() {
    NetConfig c;
    c.img_shape = {100, 100};
    c.num_classes = 3;
    c.no_annotation_label = 3;
    c.feat_layers = {"block4"};
    c.feat_shapes = {{2, 2}};
    c.anchor_sizes = {{50.f}};
    c.anchor_ratios = std::vector<std::vector<float>>(1);
    c.anchor_steps = {50.f};
    c.normalizations = {-1.f};
    return c;
}

} // namespace

TEST(SsdNet, CreateWithoutModel) {
    auto r = ssdet::SsdNet::create(tiny_config());
    ASSERT_TRUE(r.ok()) << r.status().message;

    ssdet::SsdNet net = std::move(r).value();
    EXPECT_TRUE(static_cast<bool>(net));
    EXPECT_FALSE(net.has_model());
    EXPECT_EQ(net.config().feat_layers, tiny_config().feat_layers);

    auto f = net.forward(Tensor::zeros({1, 3, 100, 100}));
    EXPECT_EQ(f.status().code, Status::Code::Unsupported);
}

TEST(SsdNet, CreateRejectsInvalidConfig) {
    NetConfig c = tiny_config();
    c.normalizations.clear();
    auto r = ssdet::SsdNet::create(c);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.status().code, Status::Code::InvalidArgument);

    EXPECT_THROW(ssdet::SsdNet{c}, std::runtime_error);

    // validation failures carry the offending field
    EXPECT_NE(r.status().message.find("normalizations"), std::string::npos) << r.status().message;
}

TEST(SsdNet, DefaultConstructedIsInvalid) {
    ssdet::SsdNet net;
    EXPECT_FALSE(static_cast<bool>(net));
    EXPECT_FALSE(net.has_model());
    EXPECT_EQ(net.forward(Tensor::zeros({1, 3, 100, 100})).status().code, Status::Code::InvalidArgument);
}

TEST(SsdetApi, EncodeThenLoss) {
    const NetConfig cfg = tiny_config();
    auto anchors = ssdet::anchors(cfg.img_shape, cfg);
    ASSERT_TRUE(anchors.ok()) << anchors.status().message;
    ASSERT_EQ(anchors.value().size(), 1u);
    EXPECT_EQ(anchors.value()[0].size(), 4u);

    ssdet::GroundTruth gt;
    gt.labels = {1};
    gt.boxes = {ssdet::BBox{0.f, 0.f, 0.5f, 0.5f}};
    auto targets = ssdet::encode({gt}, anchors.value(), cfg);
    ASSERT_TRUE(targets.ok()) << targets.status().message;
    const ssdet::LayerTargets& t = targets.value()[0];
    EXPECT_EQ(t.classes.data, (std::vector<std::int32_t>{1, 0, 0, 0}));

    // Uniform logits and perfect regression: only the classification terms remain.
    const std::vector<Tensor> logits = {Tensor::zeros({1, 2, 2, 1, 3})};
    auto loss = ssdet::losses(logits, {t.localisations}, {t.classes}, {t.localisations}, {t.scores});
    ASSERT_TRUE(loss.ok()) << loss.status().message;
    EXPECT_NEAR(loss.value().positive, std::log(3.0), 1e-5);
    EXPECT_NEAR(loss.value().localization, 0.0, 1e-6);
    // min(3*1 + 1, 3) negatives
    EXPECT_EQ(loss.value().stats.n_negatives, 3);
    EXPECT_NEAR(loss.value().negative, 3.0 * std::log(3.0), 1e-5);
}

TEST(SsdetApi, EncodeRejectsAnchorLayerMismatch) {
    const NetConfig cfg = tiny_config();
    ssdet::GroundTruth gt;
    auto r = ssdet::encode({gt}, ssdet::AnchorSet{}, cfg);
    EXPECT_EQ(r.status().code, Status::Code::InvalidArgument);
}

TEST(SsdetApi, DecodeAndDetect) {
    const NetConfig cfg = tiny_config();
    auto anchors = ssdet::anchors(cfg.img_shape, cfg);
    ASSERT_TRUE(anchors.ok()) << anchors.status().message;

    const std::vector<Tensor> loc = {Tensor::zeros({1, 2, 2, 1, 4})};
    auto boxes = ssdet::decode(loc, anchors.value(), cfg);
    ASSERT_TRUE(boxes.ok()) << boxes.status().message;
    const float* b = boxes.value()[0].ptr();
    // cell (1, 1)
    EXPECT_NEAR(b[12], 0.5f, 1e-6f);
    EXPECT_NEAR(b[13], 0.5f, 1e-6f);
    EXPECT_NEAR(b[14], 1.f, 1e-6f);
    EXPECT_NEAR(b[15], 1.f, 1e-6f);

    // class 2 wins in cell (0, 1) only
    Tensor probs = Tensor::zeros({1, 2, 2, 1, 3});
    for (std::size_t a = 0; a < 4; ++a)
        probs.data[a * 3] = 1.f;
    probs.data[1 * 3 + 0] = 0.3f;
    probs.data[1 * 3 + 2] = 0.7f;

    auto dets = ssdet::detected_boxes({probs}, loc, anchors.value(), cfg);
    ASSERT_TRUE(dets.ok()) << dets.status().message;
    ASSERT_EQ(dets.value().size(), 1u);
    const ssdet::ImageDetections& d = dets.value()[0];
    ASSERT_EQ(d.size(), 1u);
    ASSERT_EQ(d.at(2).size(), 1u);
    EXPECT_FLOAT_EQ(d.at(2)[0].score, 0.7f);
    EXPECT_NEAR(d.at(2)[0].box.xmin, 0.5f, 1e-6f);
}

TEST(SsdetApi, RefineFeatShapes) {
    const NetConfig cfg = tiny_config();
    ssdet::ForwardOutput out;
    out.predictions.push_back(Tensor::zeros({1, 4, 4, 1, 3}));

    auto r = ssdet::refine_feat_shapes(out, cfg);
    ASSERT_TRUE(r.ok()) << r.status().message;
    EXPECT_EQ(r.value().feat_shapes[0], (ssdet::FeatShape{4, 4, 1}));
    EXPECT_EQ(cfg.feat_shapes[0], (ssdet::FeatShape{2, 2}));
}

TEST(SsdetApi, DescribeAnchors) {
    const NetConfig cfg = tiny_config();
    auto anchors = ssdet::anchors(cfg.img_shape, cfg);
    ASSERT_TRUE(anchors.ok()) << anchors.status().message;

    std::ostringstream os;
    ssdet::describe_anchors(anchors.value(), cfg, os);
    const std::string s = os.str();
    EXPECT_NE(s.find("block4:"), std::string::npos);
    EXPECT_NE(s.find("2x2"), std::string::npos);
    EXPECT_NE(s.find("h_px"), std::string::npos);
    // k=0: relative 0.5 x 0.5, 50 x 50 px on the 100x100 input
    EXPECT_NE(s.find("0.5     0.5     50"), std::string::npos) << s;
    EXPECT_EQ(s.find("\033["), std::string::npos);
}

TEST(SsdetApi, RuntimePolicy_SetsOpenMpTeam) {
    const int before = ssdet::platform::omp_max_threads();
    ASSERT_GE(before, 1);

    ssdet::RuntimePolicy policy;
    policy.omp_threads = 2;
    policy.suppress_opencv = false;
    ASSERT_TRUE(ssdet::setup_runtime_policy(policy, false).ok());
#if defined(_OPENMP)
    EXPECT_EQ(ssdet::platform::omp_max_threads(), 2);
#else
    EXPECT_EQ(ssdet::platform::omp_max_threads(), 1);
#endif

    policy.omp_threads = before;
    EXPECT_TRUE(ssdet::setup_runtime_policy(policy, false).ok());
}

TEST(SsdetApi, RuntimePolicy_NegativeThreadsAreInvalid) {
    ssdet::RuntimePolicy policy;
    policy.omp_threads = -1;
    EXPECT_EQ(ssdet::setup_runtime_policy(policy, false).code, Status::Code::InvalidArgument);

    policy.omp_threads = 0;
    policy.ort_intra_threads = -2;
    EXPECT_EQ(ssdet::setup_runtime_policy(policy, false).code, Status::Code::InvalidArgument);
}
