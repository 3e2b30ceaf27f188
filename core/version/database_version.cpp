#include "version/database_version.hpp"
#include "common/errors.hpp"

#include <cctype>
#include <limits>
#include <sstream>
#include <vector>

namespace attrtools {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

uint32_t parseComponent(const std::string& token, const std::string& text) {
    std::string t = trim(token);
    if (t.empty() || t.size() > 10) {
        throw InputFormatError("Malformed database version: " + text);
    }
    uint64_t value = 0;
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw InputFormatError("Malformed database version: " + text);
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw InputFormatError("Database version component out of range: " + text);
    }
    return static_cast<uint32_t>(value);
}

} // namespace

DatabaseVersion DatabaseVersion::parse(const std::string& text) {
    std::string body = trim(text);
    if (body.size() < 2 || body.front() != '(' || body.back() != ')') {
        throw InputFormatError("Malformed database version: " + text);
    }
    body = body.substr(1, body.size() - 2);

    std::vector<std::string> parts;
    std::istringstream iss(body);
    std::string token;
    while (std::getline(iss, token, ',')) {
        parts.push_back(token);
    }
    if (!body.empty() && body.back() == ',') {
        parts.push_back("");
    }
    if (parts.size() != 3) {
        throw InputFormatError("Database version needs 3 components: " + text);
    }

    return DatabaseVersion(parseComponent(parts[0], text),
                           parseComponent(parts[1], text),
                           parseComponent(parts[2], text));
}

std::string DatabaseVersion::toString() const {
    return "(" + std::to_string(major) + ", " + std::to_string(minor) + ", " +
           std::to_string(patch) + ")";
}

DatabaseVersion DatabaseVersion::incremented(VersionPart part) const {
    constexpr uint32_t kMax = std::numeric_limits<uint32_t>::max();
    uint32_t bumped = part == VersionPart::Major ? major
                    : part == VersionPart::Minor ? minor : patch;
    if (bumped == kMax) {
        throw InputFormatError("Version " + toString() + " can not be incremented further");
    }
    switch (part) {
        case VersionPart::Major: return DatabaseVersion(major + 1, 0, 0);
        case VersionPart::Minor: return DatabaseVersion(major, minor + 1, 0);
        case VersionPart::Patch: return DatabaseVersion(major, minor, patch + 1);
    }
    return DatabaseVersion(major, minor, patch + 1);
}

VersionPart parseVersionPart(const std::string& name) {
    if (name == "major") return VersionPart::Major;
    if (name == "minor") return VersionPart::Minor;
    if (name == "patch") return VersionPart::Patch;
    throw InputFormatError("Unknown version part: " + name);
}

std::ostream& operator<<(std::ostream& os, const DatabaseVersion& v) {
    return os << v.toString();
}

} // namespace attrtools
