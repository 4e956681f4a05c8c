/**
 * @file Mutate.cpp
 * @brief Implementation of path-addressed mutation
 */

#include "jsonbuilder/Mutate.hpp"
#include "jsonbuilder/Errors.hpp"
#include "jsonbuilder/Log.hpp"

namespace jsonbuilder {

namespace {
    /**
     * @brief Object that holds keyed children of current, for reading
     * @return current itself, the last element of an array, or nullptr
     */
    template <typename NodeT>
    NodeT* keyed_parent(NodeT& current) {
        if (current.is_object()) return &current;
        if (current.is_array() && !current.empty() && current.back().is_object()) {
            return &current.back();
        }
        return nullptr;
    }

    /**
     * @brief Object that holds keyed children of current, for writing
     *
     * RULE M4: Arrays grow a fresh object element when they have no
     * object at the end.
     */
    Node& keyed_parent_for_write(Node& current, const std::string& where) {
        if (current.is_object()) return current;
        if (current.is_array()) {
            if (current.empty() || !current.back().is_object()) {
                current.push_back(Node::object());
            }
            return current.back();
        }
        // RULE M2: Never coerce an existing scalar into a container
        throw PathTypeError(where, "object or array", type_name(current));
    }

    /**
     * @brief Walk the first count segments without creating anything
     * @return Node reached, or nullptr if a segment is absent
     */
    template <typename NodeT>
    NodeT* walk(NodeT& doc, const Path& path, size_t count, std::string* missing) {
        NodeT* current = &doc;
        for (size_t i = 0; i < count; ++i) {
            const auto& seg = path[i];
            NodeT* parent = keyed_parent(*current);
            if (parent == nullptr) {
                if (missing) *missing = seg.name;
                return nullptr;
            }
            auto it = parent->find(seg.name);
            if (it == parent->end()) {
                if (missing) *missing = seg.name;
                return nullptr;
            }
            current = &(*it);
        }
        return current;
    }
}

void put_at(Node& doc, const Path& path, Node leaf) {
    if (path.empty()) {
        throw PathResolutionError("$", "");
    }
    const std::string where = format_path(path);

    Node* current = &doc;

    for (size_t i = 0; i + 1 < path.size(); ++i) {
        const auto& seg = path[i];
        Node& parent = keyed_parent_for_write(*current, where);

        auto it = parent.find(seg.name);
        if (it == parent.end()) {
            // RULE M1: Create missing intermediate
            parent[seg.name] = seg.appends_to_array ? Node::array() : Node::object();
            JSONBUILDER_TRACE("created {} '{}' for {}",
                              seg.appends_to_array ? "array" : "object", seg.name, where);
            current = &parent[seg.name];
        } else {
            current = &(*it);
        }
    }

    // Set final value
    const auto& last = path.back();
    Node& parent = keyed_parent_for_write(*current, where);

    if (!last.appends_to_array) {
        // RULE M3: Last write wins
        parent[last.name] = std::move(leaf);
        return;
    }

    auto it = parent.find(last.name);
    if (it == parent.end()) {
        parent[last.name] = Node::array();
    } else if (!it->is_array()) {
        throw PathTypeError(where, "array", type_name(*it));
    }
    parent[last.name].push_back(std::move(leaf));
}

void erase_at(Node& doc, const Path& path) {
    if (path.empty()) {
        throw PathResolutionError("$", "");
    }
    const std::string where = format_path(path);

    std::string missing;
    Node* current = walk(doc, path, path.size() - 1, &missing);
    if (current == nullptr) {
        throw PathResolutionError(where, missing);
    }

    const auto& last = path.back();
    Node* parent = keyed_parent(*current);
    if (parent == nullptr) {
        throw PathResolutionError(where, last.name);
    }

    auto it = parent->find(last.name);
    if (it == parent->end()) {
        throw PathResolutionError(where, last.name);
    }

    if (last.appends_to_array) {
        // RULE M5: "[*]" addresses every element; the array itself stays
        if (!it->is_array()) {
            throw PathResolutionError(where, last.name + kArrayMarker);
        }
        it->clear();
        return;
    }

    parent->erase(it);
}

const Node* find_at(const Node& doc, const Path& path) {
    return walk(doc, path, path.size(), nullptr);
}

} // namespace jsonbuilder
