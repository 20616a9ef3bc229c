#if defined(__has_include) && __has_include(<gtest/gtest.h>)
    #include <gtest/gtest.h>
#elif defined(__has_include) && __has_include(<gtest.h>)
    #include <gtest.h>
#else
    #error "[ERROR] 'gtest.h' header not found"
#endif

#include "anchor/anchor_generator.h"
#include "head/multibox_head.h"
#include "pipeline/box_ops.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

using ssdet::LayerConfig;
using ssdet::Tensor;

namespace {

static LayerConfig layer(std::vector<float> sizes, std::vector<float> ratios, float normalization = -1.f) {
    LayerConfig l;
    l.name = "block4";
    l.shape = {2, 2};
    l.sizes = std::move(sizes);
    l.ratios = std::move(ratios);
    l.step = 8.f;
    l.normalization = normalization;
    return l;
}

/// [3,3,ci,co] kernel with only the center tap set: k[center][c][o] = taps[c*co + o].
static Tensor center_kernel(int64_t ci, int64_t co, const std::vector<float>& taps) {
    Tensor k = Tensor::zeros({3, 3, ci, co});
    const std::size_t center = (std::size_t)(1 * 3 + 1) * (std::size_t)(ci * co);
    for (std::size_t i = 0; i < taps.size(); ++i)
        k.data[center + i] = taps[i];
    return k;
}

static Tensor iota(std::vector<int64_t> shape) {
    Tensor t = Tensor::zeros(std::move(shape));
    for (std::size_t i = 0; i < t.data.size(); ++i)
        t.data[i] = (float)i;
    return t;
}

} // namespace

TEST(MultiboxHead, NumAnchors) {
    EXPECT_EQ(ssdet::head::num_anchors(layer({21.f, 45.f}, {2.f, .5f})), 4);
    EXPECT_EQ(ssdet::head::num_anchors(layer({45.f, 99.f}, {2.f, .5f, 3.f, 1.f / 3.f})), 6);
    EXPECT_EQ(ssdet::head::num_anchors(layer({30.f}, {})), 1);
}

TEST(MultiboxHead, ChannelsToLast) {
    // [B=1, C=2, H=1, W=2]
    const Tensor nchw({1, 2, 1, 2}, {10.f, 11.f, 20.f, 21.f});
    auto r = ssdet::head::channels_to_last(nchw);
    ASSERT_TRUE(r.ok()) << r.status().message;
    EXPECT_EQ(r.value().shape, (std::vector<int64_t>{1, 1, 2, 2}));
    EXPECT_EQ(r.value().data, (std::vector<float>{10.f, 20.f, 11.f, 21.f}));
}

TEST(MultiboxHead, Reshape_SplitsAnchorAxis) {
    const LayerConfig l = layer({30.f}, {2.f}); // K = 2
    const Tensor loc = iota({1, 2, 2, 8});
    const Tensor cls = iota({1, 2, 2, 6});

    auto r = ssdet::head::reshape_predictions(loc, cls, l, 3);
    ASSERT_TRUE(r.ok()) << r.status().message;
    EXPECT_EQ(r.value().localisations.shape, (std::vector<int64_t>{1, 2, 2, 2, 4}));
    EXPECT_EQ(r.value().logits.shape, (std::vector<int64_t>{1, 2, 2, 2, 3}));
    EXPECT_EQ(r.value().localisations.data, loc.data);
    EXPECT_EQ(r.value().logits.data, cls.data);
}

TEST(MultiboxHead, Reshape_WrongChannelCount_IsInvalid) {
    const LayerConfig l = layer({30.f}, {2.f});
    auto bad_loc = ssdet::head::reshape_predictions(iota({1, 2, 2, 7}), iota({1, 2, 2, 6}), l, 3);
    EXPECT_EQ(bad_loc.status().code, ssdet::Status::Code::InvalidArgument);

    auto bad_cls = ssdet::head::reshape_predictions(iota({1, 2, 2, 8}), iota({1, 2, 2, 4}), l, 3);
    EXPECT_EQ(bad_cls.status().code, ssdet::Status::Code::InvalidArgument);

    auto bad_hw = ssdet::head::reshape_predictions(iota({1, 2, 2, 8}), iota({1, 3, 2, 6}), l, 3);
    EXPECT_EQ(bad_hw.status().code, ssdet::Status::Code::InvalidArgument);
}

TEST(MultiboxHead, L2Normalize) {
    const Tensor f({1, 1, 2, 2}, {3.f, 4.f, 0.f, 0.f});

    auto r = ssdet::head::l2_normalize(f, {20.f});
    ASSERT_TRUE(r.ok()) << r.status().message;
    EXPECT_NEAR(r.value().data[0], 12.f, 1e-4f);
    EXPECT_NEAR(r.value().data[1], 16.f, 1e-4f);
    // zero vector stays zero
    EXPECT_FLOAT_EQ(r.value().data[2], 0.f);
    EXPECT_FLOAT_EQ(r.value().data[3], 0.f);

    auto pc = ssdet::head::l2_normalize(f, {1.f, 2.f});
    ASSERT_TRUE(pc.ok()) << pc.status().message;
    EXPECT_NEAR(pc.value().data[0], 0.6f, 1e-5f);
    EXPECT_NEAR(pc.value().data[1], 1.6f, 1e-5f);

    EXPECT_FALSE(ssdet::head::l2_normalize(f, {1.f, 2.f, 3.f}).ok());
}

TEST(MultiboxHead, SoftmaxRowsSumToOne) {
    const Tensor logits({1, 1, 1, 2, 2}, {0.f, std::log(3.f), 100.f, 100.f});
    auto r = ssdet::head::softmax_predictions(logits);
    ASSERT_TRUE(r.ok()) << r.status().message;
    EXPECT_NEAR(r.value().data[0], 0.25f, 1e-6f);
    EXPECT_NEAR(r.value().data[1], 0.75f, 1e-6f);
    EXPECT_NEAR(r.value().data[2], 0.5f, 1e-6f);
    EXPECT_NEAR(r.value().data[3], 0.5f, 1e-6f);
}

TEST(MultiboxHead, Conv3x3_CenterTapIsIdentityPlusBias) {
    const Tensor x = iota({1, 2, 2, 1});
    auto r = ssdet::head::conv3x3_same(x, center_kernel(1, 1, {1.f}), {0.5f});
    ASSERT_TRUE(r.ok()) << r.status().message;
    ASSERT_EQ(r.value().shape, (std::vector<int64_t>{1, 2, 2, 1}));
    for (std::size_t i = 0; i < 4; ++i)
        EXPECT_FLOAT_EQ(r.value().data[i], (float)i + 0.5f);
}

TEST(MultiboxHead, Conv3x3_SamePaddingSumsNeighbours) {
    // All-ones kernel on an all-ones 2x2 map: every output sees 4 valid inputs.
    const Tensor x = Tensor::filled({1, 2, 2, 1}, 1.f);
    const Tensor k = Tensor::filled({3, 3, 1, 1}, 1.f);
    auto r = ssdet::head::conv3x3_same(x, k, {});
    ASSERT_TRUE(r.ok()) << r.status().message;
    for (float v : r.value().data)
        EXPECT_FLOAT_EQ(v, 4.f);
}

TEST(MultiboxHead, Conv3x3_KernelMismatch_IsInvalid) {
    const Tensor x = iota({1, 2, 2, 2});
    EXPECT_FALSE(ssdet::head::conv3x3_same(x, Tensor::zeros({3, 3, 1, 4}), {}).ok());
    EXPECT_FALSE(ssdet::head::conv3x3_same(x, Tensor::zeros({3, 3, 2, 4}), {1.f}).ok());
}

TEST(MultiboxHead, Predict_PlainLayer) {
    const ssdet::head::MultiboxHead head(layer({30.f}, {}), 2); // K = 1
    ASSERT_EQ(head.num_anchors(), 1);

    ssdet::head::HeadWeights w;
    w.loc_kernel = center_kernel(1, 4, {1.f, 1.f, 1.f, 1.f});
    w.cls_kernel = Tensor::zeros({3, 3, 1, 2});
    w.cls_bias = {1.f, -1.f};

    auto r = head.predict(iota({1, 2, 2, 1}), w);
    ASSERT_TRUE(r.ok()) << r.status().message;
    const auto& p = r.value();
    EXPECT_EQ(p.localisations.shape, (std::vector<int64_t>{1, 2, 2, 1, 4}));
    EXPECT_EQ(p.logits.shape, (std::vector<int64_t>{1, 2, 2, 1, 2}));
    for (std::size_t cell = 0; cell < 4; ++cell) {
        for (std::size_t c = 0; c < 4; ++c)
            EXPECT_FLOAT_EQ(p.localisations.data[cell * 4 + c], (float)cell);
        EXPECT_FLOAT_EQ(p.logits.data[cell * 2 + 0], 1.f);
        EXPECT_FLOAT_EQ(p.logits.data[cell * 2 + 1], -1.f);
    }
}

TEST(MultiboxHead, Predict_NormalizedLayerUsesInitialScale) {
    const ssdet::head::MultiboxHead head(layer({30.f}, {}, 20.f), 2);

    ssdet::head::HeadWeights w;
    // loc = first input channel on every coordinate
    w.loc_kernel = center_kernel(2, 4, {1.f, 1.f, 1.f, 1.f, 0.f, 0.f, 0.f, 0.f});
    w.cls_kernel = Tensor::zeros({3, 3, 2, 2});

    const Tensor f({1, 1, 1, 2}, {3.f, 4.f});
    auto r = head.predict(f, w);
    ASSERT_TRUE(r.ok()) << r.status().message;
    for (float v : r.value().localisations.data)
        EXPECT_NEAR(v, 12.f, 1e-4f);
}

// ----------------------------- layer alignment -----------------------------------------------

TEST(MultiboxHead, Ssd300_PredictionsAlignWithAnchors) {
    const ssdet::NetConfig cfg = ssdet::NetConfig::ssd300();
    const int64_t C = cfg.num_classes;
    const int64_t Cin = 2;

    std::vector<Tensor> localisations;
    std::vector<Tensor> logits;
    for (std::size_t l = 0; l < cfg.num_layers(); ++l) {
        const ssdet::head::MultiboxHead head(cfg.layer(l), cfg.num_classes);
        const int64_t K = head.num_anchors();
        const ssdet::FeatShape& fs = cfg.feat_shapes[l];

        ssdet::head::HeadWeights w;
        w.loc_kernel = Tensor::zeros({3, 3, Cin, K * 4});
        w.cls_kernel = Tensor::zeros({3, 3, Cin, K * C});

        auto r = head.predict(Tensor::zeros({1, fs.h, fs.w, Cin}), w);
        ASSERT_TRUE(r.ok()) << cfg.feat_layers[l] << ": " << r.status().message;
        localisations.push_back(std::move(r.value().localisations));
        logits.push_back(std::move(r.value().logits));
    }

    auto anchors = ssdet::anchor::generate_all_layers(cfg.img_shape, cfg);
    ASSERT_TRUE(anchors.ok()) << anchors.status().message;
    const ssdet::AnchorSet& a = anchors.value();

    ASSERT_EQ(a.size(), cfg.num_layers());
    ASSERT_EQ(localisations.size(), cfg.num_layers());
    ASSERT_EQ(logits.size(), cfg.num_layers());
    for (std::size_t l = 0; l < cfg.num_layers(); ++l) {
        SCOPED_TRACE(cfg.feat_layers[l]);
        const int64_t H = a[l].H;
        const int64_t W = a[l].W;
        const int64_t K = a[l].num_per_cell();
        EXPECT_EQ(localisations[l].shape, (std::vector<int64_t>{1, H, W, K, 4}));
        EXPECT_EQ(logits[l].shape, (std::vector<int64_t>{1, H, W, K, C}));
    }

    // decoding requires every layer to agree with its anchors
    const ssdet::pipeline::DefaultBoxOps ops{};
    auto boxes = ops.decode(localisations, a, cfg.prior_scaling);
    ASSERT_TRUE(boxes.ok()) << boxes.status().message;
    EXPECT_EQ(boxes.value().size(), cfg.num_layers());
}
