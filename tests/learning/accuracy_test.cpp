// File: tests/learning/accuracy_test.cpp
#include "learning/accuracy.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace apo {
namespace {

TEST(NormalizedErrorAccuracyTest, ExactMatchScoresOne) {
    NormalizedErrorAccuracy accuracy;
    Payload p{{"temperature", 20.0}, {"humidity", 0.4}};

    EXPECT_DOUBLE_EQ(1.0, accuracy(p, p));
}

TEST(NormalizedErrorAccuracyTest, ErrorScalesLinearly) {
    NormalizedErrorAccuracy::Config config;
    config.default_scale = 10.0;
    NormalizedErrorAccuracy accuracy(config);

    EXPECT_DOUBLE_EQ(0.75, accuracy(Payload{{"t", 20.0}}, Payload{{"t", 22.5}}));
    EXPECT_DOUBLE_EQ(0.0, accuracy(Payload{{"t", 20.0}}, Payload{{"t", 45.0}}));
}

TEST(NormalizedErrorAccuracyTest, AveragesSharedFieldsOnly) {
    NormalizedErrorAccuracy accuracy;
    Payload predicted{{"a", 1.0}, {"b", 1.0}, {"only_predicted", 5.0}};
    Payload actual{{"a", 1.0}, {"b", 2.0}, {"only_actual", 9.0}};

    // a scores 1, b scores 0
    EXPECT_DOUBLE_EQ(0.5, accuracy(predicted, actual));
}

TEST(NormalizedErrorAccuracyTest, NoSharedFieldsScoresZero) {
    NormalizedErrorAccuracy accuracy;
    EXPECT_DOUBLE_EQ(0.0, accuracy(Payload{{"a", 1.0}}, Payload{{"b", 1.0}}));
    EXPECT_DOUBLE_EQ(0.0, accuracy(Payload(), Payload()));
}

TEST(NormalizedErrorAccuracyTest, NonFiniteFieldScoresZero) {
    NormalizedErrorAccuracy accuracy;
    double nan = std::numeric_limits<double>::quiet_NaN();

    Payload predicted{{"a", nan}, {"b", 3.0}};
    Payload actual{{"a", 1.0}, {"b", 3.0}};

    EXPECT_DOUBLE_EQ(0.5, accuracy(predicted, actual));
}

TEST(NormalizedErrorAccuracyTest, FieldScalesOverrideDefault) {
    NormalizedErrorAccuracy::Config config;
    config.default_scale = 1.0;
    config.field_scales["pressure"] = 100.0;
    NormalizedErrorAccuracy accuracy(config);

    EXPECT_DOUBLE_EQ(100.0, accuracy.ScaleFor("pressure"));
    EXPECT_DOUBLE_EQ(1.0, accuracy.ScaleFor("temperature"));
    EXPECT_DOUBLE_EQ(0.9, accuracy(Payload{{"pressure", 1000.0}}, Payload{{"pressure", 1010.0}}));
}

TEST(NormalizedErrorAccuracyTest, RejectsBadScales) {
    NormalizedErrorAccuracy::Config config;
    config.default_scale = 0.0;
    EXPECT_THROW(NormalizedErrorAccuracy{config}, std::invalid_argument);

    config.default_scale = 1.0;
    config.field_scales["x"] = -2.0;
    EXPECT_THROW(NormalizedErrorAccuracy{config}, std::invalid_argument);
}

TEST(NormalizedErrorAccuracyTest, WrapsIntoAccuracyFunction) {
    NormalizedErrorAccuracy::Config config;
    config.default_scale = 4.0;
    AccuracyFunction fn = MakeNormalizedErrorAccuracy(config);

    EXPECT_DOUBLE_EQ(0.5, fn(Payload{{"x", 0.0}}, Payload{{"x", 2.0}}));
}

} // namespace
} // namespace apo
