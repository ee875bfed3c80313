// File: tests/core/pattern_test.cpp
#include "core/pattern.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace apo {
namespace {

Pattern MakePattern() {
    return Pattern(Coordinate(40.7128, -74.0060), "lstm", 0.8, 5,
                   Timestamp::FromMicros(1700000000000000LL));
}

// ============================================================================
// PatternKey Tests
// ============================================================================

TEST(PatternKeyTest, EqualityUsesLocationAndModel) {
    PatternKey a{Coordinate(1.0, 2.0), "m"};
    PatternKey b{Coordinate(1.0, 2.0), "m"};
    PatternKey c{Coordinate(1.0, 2.0), "n"};
    PatternKey d{Coordinate(1.0, 2.5), "m"};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
}

TEST(PatternKeyTest, HashDistinguishesModels) {
    std::unordered_set<PatternKey, PatternKey::Hash> keys;
    keys.insert(PatternKey{Coordinate(1.0, 2.0), "a"});
    keys.insert(PatternKey{Coordinate(1.0, 2.0), "b"});
    keys.insert(PatternKey{Coordinate(1.0, 2.0), "a"});

    EXPECT_EQ(2u, keys.size());
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST(PatternTest, ValidPattern) {
    Pattern p = MakePattern();
    EXPECT_TRUE(p.IsValid());
    EXPECT_TRUE(p.ValidationError().empty());
}

TEST(PatternTest, KeyMatchesFields) {
    Pattern p = MakePattern();
    EXPECT_EQ(p.location, p.Key().location);
    EXPECT_EQ(p.model_id, p.Key().model_id);
}

TEST(PatternTest, RejectsOutOfRangeLatitude) {
    Pattern p = MakePattern();
    p.location.latitude = 90.5;
    EXPECT_FALSE(p.IsValid());
}

TEST(PatternTest, RejectsEmptyModel) {
    Pattern p = MakePattern();
    p.model_id.clear();
    EXPECT_FALSE(p.IsValid());
    EXPECT_NE(std::string::npos, p.ValidationError().find("model_id"));
}

TEST(PatternTest, RejectsConfidenceOutsideUnitInterval) {
    Pattern p = MakePattern();

    p.confidence = 1.0000001;
    EXPECT_FALSE(p.IsValid());

    p.confidence = -0.1;
    EXPECT_FALSE(p.IsValid());

    p.confidence = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(p.IsValid());

    p.confidence = 0.0;
    EXPECT_TRUE(p.IsValid());
    p.confidence = 1.0;
    EXPECT_TRUE(p.IsValid());
}

TEST(PatternTest, RejectsZeroSamples) {
    Pattern p = MakePattern();
    p.sample_count = 0;
    EXPECT_FALSE(p.IsValid());
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST(PatternTest, SerializationRoundTrip) {
    Pattern original = MakePattern();

    std::stringstream ss;
    original.Serialize(ss);
    Pattern restored = Pattern::Deserialize(ss);

    EXPECT_EQ(original, restored);
}

TEST(PatternTest, DeserializeTruncatedThrows) {
    Pattern original = MakePattern();

    std::stringstream full;
    original.Serialize(full);
    std::string bytes = full.str();

    std::stringstream truncated(bytes.substr(0, bytes.size() - 4));
    EXPECT_THROW(Pattern::Deserialize(truncated), std::runtime_error);
}

TEST(PatternTest, DeserializeRejectsHugeModelId) {
    std::stringstream ss;
    Coordinate(1.0, 1.0).Serialize(ss);
    uint32_t bogus_length = 1u << 30;
    ss.write(reinterpret_cast<const char*>(&bogus_length), sizeof(bogus_length));

    EXPECT_THROW(Pattern::Deserialize(ss), std::runtime_error);
}

TEST(PatternTest, ToStringMentionsModel) {
    EXPECT_NE(std::string::npos, MakePattern().ToString().find("lstm"));
}

} // namespace
} // namespace apo
