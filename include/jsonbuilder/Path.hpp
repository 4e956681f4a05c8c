/**
 * @file Path.hpp
 * @brief Path expression parsing for document mutation
 *
 * Grammar: ["$."] segment ("." segment)*, where segment = name ["[*]"]
 *
 * - The leading "$." root marker is optional; "a.b" and "$.a.b" parse
 *   to the same segments
 * - A "[*]" marker on a segment makes puts at that segment append to
 *   an array instead of overwriting a keyed value
 */

#ifndef JSONBUILDER_PATH_HPP
#define JSONBUILDER_PATH_HPP

#include <string>
#include <vector>

namespace jsonbuilder {

/// Root marker accepted in front of a path.
constexpr const char* kPathRoot = "$.";

/// Array-append marker accepted at the end of a segment.
constexpr const char* kArrayMarker = "[*]";

/**
 * @brief One dot-separated component of a path
 */
struct Segment {
    std::string name;
    bool appends_to_array = false;

    bool operator==(const Segment& other) const {
        return name == other.name && appends_to_array == other.appends_to_array;
    }
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

using Path = std::vector<Segment>;

/**
 * @brief Split a path expression into segments
 *
 * @param raw Path like "$.user.friends[*]"
 * @return Segments in written order
 *
 * Empty tokens are kept as empty names; malformed paths are not
 * rejected.
 *
 * Examples:
 * - "$.user.name" → [{"user"}, {"name"}]
 * - "user.name" → [{"user"}, {"name"}]
 * - "user.friends[*]" → [{"user"}, {"friends", append}]
 * - "" → [{""}]
 */
Path normalize_path(const std::string& raw);

/**
 * @brief Render segments back into a rooted path expression
 *
 * Examples:
 * - [{"a"}, {"b", append}] → "$.a.b[*]"
 * - [] → "$"
 */
std::string format_path(const Path& path);

} // namespace jsonbuilder

#endif // JSONBUILDER_PATH_HPP
