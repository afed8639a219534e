/**
 * @file test_cpn_config.cpp
 * @brief Unit tests for Targets/CpnConfig.h
 */

#include <gtest/gtest.h>
#include <CpnVision/Targets/CpnConfig.h>
#include <CpnVision/Core/Exception.h>

#include <string>

using namespace Cpn::Vision;

TEST(CpnConfigTest, DefaultsAreValid) {
    CpnConfig config = CpnConfig::Default();
    EXPECT_NO_THROW(config.Validate());
    EXPECT_EQ(config.order, 8);
    EXPECT_EQ(config.samples, 32);
    EXPECT_EQ(config.FourierChannels(), 32);
    EXPECT_DOUBLE_EQ(config.scoreThresh, 0.9);
    EXPECT_DOUBLE_EQ(config.nmsThresh, 0.3);
    EXPECT_EQ(config.refinementIterations, 4);
    EXPECT_EQ(config.refinementBuckets, 6);
    EXPECT_TRUE(config.inputSize.IsZero());
}

TEST(CpnConfigTest, InvalidFieldsNamed) {
    auto expectInvalid = [](CpnConfig config, const std::string& field) {
        try {
            config.Validate();
            ADD_FAILURE() << "expected failure for " << field;
        } catch (const InvalidConfigurationException& e) {
            EXPECT_NE(std::string(e.what()).find(field), std::string::npos) << e.what();
        }
    };

    CpnConfig c;
    c.order = 0;
    expectInvalid(c, "order");

    c = CpnConfig();
    c.samples = -3;
    expectInvalid(c, "samples");

    c = CpnConfig();
    c.minFgDist = 1.2;
    expectInvalid(c, "minFgDist");

    c = CpnConfig();
    c.maxBgDist = 0.8;
    expectInvalid(c, "maxBgDist");

    c = CpnConfig();
    c.minInstanceArea = -1;
    expectInvalid(c, "minInstanceArea");

    c = CpnConfig();
    c.inputSize = Size2i(-1, 10);
    expectInvalid(c, "inputSize");

    c = CpnConfig();
    c.scoreThresh = -0.1;
    expectInvalid(c, "scoreThresh");

    c = CpnConfig();
    c.nmsThresh = 1.01;
    expectInvalid(c, "nmsThresh");

    c = CpnConfig();
    c.stride = 0;
    expectInvalid(c, "stride");

    c = CpnConfig();
    c.refinementIterations = -1;
    expectInvalid(c, "refinementIterations");

    c = CpnConfig();
    c.refinementBuckets = 0;
    expectInvalid(c, "refinementBuckets");

    c = CpnConfig();
    c.refinementMargin = -2.0;
    expectInvalid(c, "refinementMargin");
}

TEST(CpnConfigTest, BoundaryValuesAccepted) {
    CpnConfig c;
    c.minFgDist = 0.5;
    c.maxBgDist = 0.5;
    c.scoreThresh = 0.0;
    c.nmsThresh = 1.0;
    c.refinementIterations = 0;
    c.refinementMargin = 0.0;
    c.minInstanceArea = 0;
    EXPECT_NO_THROW(c.Validate());
}

TEST(CpnConfigTest, ToStringMentionsShape) {
    CpnConfig c;
    c.order = 12;
    std::string s = c.ToString();
    EXPECT_NE(s.find("order=12"), std::string::npos);
    EXPECT_NE(s.find("samples=32"), std::string::npos);
    EXPECT_NE(s.find("nms=0.3(greedy)"), std::string::npos);

    c.nmsMode = Internal::NmsMode::Fast;
    EXPECT_NE(c.ToString().find("(fast)"), std::string::npos);
}
