// File: src/core/pattern.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <iosfwd>
#include <string>

namespace apo {

/// PatternKey: Identity of a learned pattern
///
/// Two patterns are the same pattern iff their exact stored coordinates and
/// model ids match.
struct PatternKey {
    Coordinate location;
    ModelID model_id;

    bool operator==(const PatternKey& other) const {
        return location == other.location && model_id == other.model_id;
    }
    bool operator!=(const PatternKey& other) const { return !(*this == other); }

    std::string ToString() const;

    struct Hash {
        size_t operator()(const PatternKey& key) const;
    };
};

/// Pattern: Learned association between a location and a model's observed
/// performance there
struct Pattern {
    Coordinate location;
    ModelID model_id;

    /// Blended accuracy estimate in [0, 1]
    double confidence{0.0};

    /// Number of outcomes folded into confidence; >= 1 once persisted
    uint64_t sample_count{1};

    /// Updated on every read or write through a PatternStore
    Timestamp last_used_at;

    Pattern() = default;
    Pattern(const Coordinate& loc, ModelID model, double conf, uint64_t samples,
            Timestamp used_at = Timestamp::Now());

    PatternKey Key() const { return PatternKey{location, model_id}; }

    /// Check the record invariants (coordinate range, non-empty model id,
    /// confidence in [0, 1], sample_count >= 1)
    bool IsValid() const;

    /// Describe the first violated invariant, or an empty string when valid
    std::string ValidationError() const;

    /// Field-wise equality (including last_used_at)
    bool operator==(const Pattern& other) const;
    bool operator!=(const Pattern& other) const { return !(*this == other); }

    std::string ToString() const;

    // Serialization (binary, used by snapshots)
    void Serialize(std::ostream& out) const;
    static Pattern Deserialize(std::istream& in);
};

} // namespace apo
