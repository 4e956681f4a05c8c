/**
 * @file Path.cpp
 * @brief Implementation of path parsing
 */

#include "jsonbuilder/Path.hpp"
#include <sstream>

namespace jsonbuilder {

namespace {
    /**
     * @brief Build a segment from one raw token, stripping the array marker
     */
    Segment make_segment(std::string token) {
        Segment seg;
        const std::string marker = kArrayMarker;
        auto pos = token.find(marker);
        if (pos != std::string::npos) {
            seg.appends_to_array = true;
            // Strip every occurrence so "a[*][*]" still names "a"
            while (pos != std::string::npos) {
                token.erase(pos, marker.size());
                pos = token.find(marker);
            }
        }
        seg.name = std::move(token);
        return seg;
    }
}

Path normalize_path(const std::string& raw) {
    std::string body = raw;
    const std::string root = kPathRoot;
    if (body.compare(0, root.size(), root) == 0) {
        body.erase(0, root.size());
    }

    Path segments;
    std::string current;

    for (char c : body) {
        if (c == '.') {
            segments.push_back(make_segment(current));
            current.clear();
        } else {
            current += c;
        }
    }

    // Add final segment
    segments.push_back(make_segment(current));

    return segments;
}

std::string format_path(const Path& path) {
    std::ostringstream oss;
    oss << '$';
    for (const auto& seg : path) {
        oss << '.' << seg.name;
        if (seg.appends_to_array) oss << kArrayMarker;
    }
    return oss.str();
}

} // namespace jsonbuilder
