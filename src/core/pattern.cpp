// File: src/core/pattern.cpp
#include "core/pattern.hpp"
#include "geo/geo_distance.hpp"
#include <cmath>
#include <istream>
#include <ostream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <utility>

namespace apo {

namespace {

// Upper bound on a serialized model id; anything larger means a damaged stream
constexpr uint32_t kMaxModelIdLength = 4096;

} // namespace

// ============================================================================
// PatternKey
// ============================================================================

std::string PatternKey::ToString() const {
    return model_id + "@" + location.ToString();
}

size_t PatternKey::Hash::operator()(const PatternKey& key) const {
    size_t h1 = Coordinate::Hash()(key.location);
    size_t h2 = std::hash<std::string>()(key.model_id);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}

// ============================================================================
// Pattern
// ============================================================================

Pattern::Pattern(const Coordinate& loc, ModelID model, double conf,
                 uint64_t samples, Timestamp used_at)
    : location(loc),
      model_id(std::move(model)),
      confidence(conf),
      sample_count(samples),
      last_used_at(used_at) {}

bool Pattern::IsValid() const {
    return ValidationError().empty();
}

std::string Pattern::ValidationError() const {
    if (!IsValidCoordinate(location)) {
        return "coordinate out of range " + location.ToString();
    }
    if (model_id.empty()) {
        return "empty model_id";
    }
    if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
        return "confidence out of [0, 1]: " + std::to_string(confidence);
    }
    if (sample_count < 1) {
        return "sample_count must be >= 1";
    }
    return "";
}

bool Pattern::operator==(const Pattern& other) const {
    return location == other.location &&
           model_id == other.model_id &&
           confidence == other.confidence &&
           sample_count == other.sample_count &&
           last_used_at == other.last_used_at;
}

std::string Pattern::ToString() const {
    std::ostringstream oss;
    oss << "Pattern{" << model_id << " at " << location.ToString()
        << ", confidence=" << std::fixed << std::setprecision(4) << confidence
        << ", samples=" << sample_count << "}";
    return oss.str();
}

void Pattern::Serialize(std::ostream& out) const {
    location.Serialize(out);

    uint32_t id_length = static_cast<uint32_t>(model_id.size());
    out.write(reinterpret_cast<const char*>(&id_length), sizeof(id_length));
    out.write(model_id.data(), id_length);

    out.write(reinterpret_cast<const char*>(&confidence), sizeof(confidence));
    out.write(reinterpret_cast<const char*>(&sample_count), sizeof(sample_count));
    last_used_at.Serialize(out);
}

Pattern Pattern::Deserialize(std::istream& in) {
    Pattern pattern;
    pattern.location = Coordinate::Deserialize(in);

    uint32_t id_length = 0;
    in.read(reinterpret_cast<char*>(&id_length), sizeof(id_length));
    if (!in || id_length > kMaxModelIdLength) {
        throw std::runtime_error("Truncated or malformed pattern record");
    }
    pattern.model_id.resize(id_length);
    in.read(&pattern.model_id[0], id_length);

    in.read(reinterpret_cast<char*>(&pattern.confidence), sizeof(pattern.confidence));
    in.read(reinterpret_cast<char*>(&pattern.sample_count), sizeof(pattern.sample_count));
    pattern.last_used_at = Timestamp::Deserialize(in);

    if (!in) {
        throw std::runtime_error("Truncated pattern record");
    }
    return pattern;
}

} // namespace apo
