#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>

namespace attrtools {

/// Which component of a DatabaseVersion to bump on retrain.
enum class VersionPart {
    Major,
    Minor,
    Patch,
};

// ─── DatabaseVersion ───────────────────────────────────────────
// (major, minor, patch) tag of a trained model generation.
// Serialized as "(a, b, c)". Ordered lexicographically.

struct DatabaseVersion {
    uint32_t major = 0;
    uint32_t minor = 0;
    uint32_t patch = 1;

    DatabaseVersion() = default;
    DatabaseVersion(uint32_t major, uint32_t minor, uint32_t patch)
        : major(major), minor(minor), patch(patch) {}

    /// Parse "(a, b, c)". Whitespace around numbers is ignored.
    /// Throws InputFormatError on anything else.
    static DatabaseVersion parse(const std::string& text);

    /// "(a, b, c)"
    std::string toString() const;

    /// Bump `part` and reset every lower component to zero.
    /// The result always compares greater than *this. Throws
    /// InputFormatError if the bumped component is already at its maximum.
    DatabaseVersion incremented(VersionPart part = VersionPart::Patch) const;

    bool operator==(const DatabaseVersion& o) const {
        return std::tie(major, minor, patch) == std::tie(o.major, o.minor, o.patch);
    }
    bool operator!=(const DatabaseVersion& o) const { return !(*this == o); }
    bool operator<(const DatabaseVersion& o) const {
        return std::tie(major, minor, patch) < std::tie(o.major, o.minor, o.patch);
    }
    bool operator>(const DatabaseVersion& o) const { return o < *this; }
    bool operator<=(const DatabaseVersion& o) const { return !(o < *this); }
    bool operator>=(const DatabaseVersion& o) const { return !(*this < o); }
};

inline constexpr const char* kDefaultDatabaseVersion = "(0, 0, 1)";

VersionPart parseVersionPart(const std::string& name);

std::ostream& operator<<(std::ostream& os, const DatabaseVersion& v);

} // namespace attrtools
