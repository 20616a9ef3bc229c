#if defined(__has_include) && __has_include(<gtest/gtest.h>)
    #include <gtest/gtest.h>
#elif defined(__has_include) && __has_include(<gtest.h>)
    #include <gtest.h>
#else
    #error "[ERROR] 'gtest.h' header not found"
#endif

#include "config.h"

#include <sstream>
#include <string>

using ssdet::FeatShape;
using ssdet::NetConfig;
using ssdet::Status;

TEST(NetConfig, DefaultsValidate) {
    EXPECT_TRUE(NetConfig::ssd300().validate().ok());
    EXPECT_TRUE(NetConfig::ssd512().validate().ok());
}

TEST(NetConfig, Ssd300Table) {
    const NetConfig c = NetConfig::ssd300();
    ASSERT_EQ(c.num_layers(), 6u);
    EXPECT_EQ(c.feat_layers.front(), "block4");
    EXPECT_EQ(c.feat_layers.back(), "block11");
    EXPECT_EQ(c.feat_shapes[0], (FeatShape{38, 38}));
    EXPECT_EQ(c.num_classes, 21);
    EXPECT_EQ(c.no_annotation_label, 21);
    EXPECT_FLOAT_EQ(c.normalizations[0], 20.f);
    EXPECT_FLOAT_EQ(c.anchor_steps[4], 100.f);
}

TEST(NetConfig, Ssd512Table) {
    const NetConfig c = NetConfig::ssd512();
    ASSERT_EQ(c.num_layers(), 7u);
    EXPECT_EQ(c.img_shape.h, 512);
    EXPECT_EQ(c.feat_shapes[6], (FeatShape{1, 1}));
    EXPECT_FLOAT_EQ(c.anchor_steps[6], 512.f);
}

TEST(NetConfig, MissingRatioList_IsInvalid) {
    NetConfig c = NetConfig::ssd300();
    c.anchor_ratios.pop_back();
    const Status st = c.validate();
    EXPECT_EQ(st.code, Status::Code::InvalidArgument);
    EXPECT_NE(st.message.find("anchor_ratios"), std::string::npos) << st.message;
    EXPECT_NE(st.message.find("5 entries"), std::string::npos) << st.message;
}

TEST(NetConfig, RangeChecks) {
    {
        NetConfig c = NetConfig::ssd300();
        c.num_classes = 1;
        EXPECT_EQ(c.validate().code, Status::Code::InvalidArgument);
    }
    {
        NetConfig c = NetConfig::ssd300();
        c.anchor_sizes[2] = {};
        EXPECT_EQ(c.validate().code, Status::Code::InvalidArgument);
    }
    {
        NetConfig c = NetConfig::ssd300();
        c.anchor_ratios[1][0] = 0.f;
        EXPECT_EQ(c.validate().code, Status::Code::InvalidArgument);
    }
    {
        NetConfig c = NetConfig::ssd300();
        c.prior_scaling[3] = 0.f;
        EXPECT_EQ(c.validate().code, Status::Code::InvalidArgument);
    }
    {
        NetConfig c = NetConfig::ssd300();
        c.img_shape = {0, 300};
        EXPECT_EQ(c.validate().code, Status::Code::InvalidArgument);
    }
}

TEST(NetConfig, LayerView) {
    const NetConfig c = NetConfig::ssd300();
    const ssdet::LayerConfig l = c.layer(1);
    EXPECT_EQ(l.name, "block7");
    EXPECT_EQ(l.num_anchors(), 6);
    EXPECT_FALSE(l.normalized());
    EXPECT_TRUE(c.layer(0).normalized());
}

TEST(NetConfig, WithFeatShapes_LeavesSourceUnchanged) {
    const NetConfig c = NetConfig::ssd300();
    std::vector<FeatShape> shapes = c.feat_shapes;
    shapes[0] = FeatShape{40, 40, 4};

    const NetConfig d = c.with_feat_shapes(shapes);
    EXPECT_EQ(d.feat_shapes[0], (FeatShape{40, 40, 4}));
    EXPECT_EQ(c.feat_shapes[0], (FeatShape{38, 38}));
    EXPECT_EQ(d.feat_layers, c.feat_layers);
}

TEST(NetConfig, DescribeListsEveryLayer) {
    const NetConfig c = NetConfig::ssd300();
    std::ostringstream os;
    ssdet::describe(c, os);
    const std::string out = os.str();
    for (const auto& name : c.feat_layers)
        EXPECT_NE(out.find(name + ":"), std::string::npos) << name;
    EXPECT_NE(out.find("num_classes"), std::string::npos);
    EXPECT_EQ(out.find("\033["), std::string::npos);
}
