// File: src/core/errors.hpp
#pragma once

#include "core/types.hpp"
#include <stdexcept>
#include <string>

namespace apo {

/// Root of all optimizer-specific exceptions
class ApoError : public std::runtime_error {
public:
    explicit ApoError(const std::string& what) : std::runtime_error(what) {}
};

/// Latitude or longitude outside its valid range (or not finite)
class InvalidCoordinateError : public ApoError {
public:
    explicit InvalidCoordinateError(const Coordinate& coordinate)
        : ApoError("Invalid coordinate: " + coordinate.ToString()),
          coordinate_(coordinate) {}

    const Coordinate& coordinate() const { return coordinate_; }

private:
    Coordinate coordinate_;
};

/// Failure of the pattern persistence layer
///
/// kUnavailable aborts the operation and always reaches the caller.
/// kCorrupt is raised when the backing file itself is damaged or is not a
/// database. A single record failing validation on read is not raised; query
/// paths skip it and count it in StoreStats::corrupt_records.
class StorageError : public ApoError {
public:
    enum class Kind : uint8_t {
        kUnavailable = 0,
        kCorrupt = 1,
    };

    StorageError(Kind kind, const std::string& message)
        : ApoError(std::string(KindName(kind)) + ": " + message), kind_(kind) {}

    Kind kind() const { return kind_; }

    static const char* KindName(Kind kind) {
        switch (kind) {
            case Kind::kUnavailable: return "StorageUnavailable";
            case Kind::kCorrupt: return "StorageCorrupt";
            default: return "StorageError";
        }
    }

private:
    Kind kind_;
};

} // namespace apo
