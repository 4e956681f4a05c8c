/**
 * @file Mutate.hpp
 * @brief Path-addressed mutation of a document tree
 *
 * Behavioral rules:
 * - RULE M1: put_at() creates missing intermediate containers: an array
 *            when the segment carries "[*]", an object otherwise
 * - RULE M2: put_at() never replaces an existing intermediate node; a
 *            scalar or null in the way raises PathTypeError
 * - RULE M3: A final "[*]" segment appends one element per put; any
 *            other final segment overwrites its key
 * - RULE M4: A name resolved against an array addresses its last
 *            element; put_at() appends an empty object first when the
 *            array is empty or ends in a non-object
 * - RULE M5: erase_at() raises PathResolutionError for unresolvable
 *            paths; a final "[*]" segment empties the addressed array
 */

#ifndef JSONBUILDER_MUTATE_HPP
#define JSONBUILDER_MUTATE_HPP

#include "jsonbuilder/Path.hpp"
#include "jsonbuilder/Value.hpp"

namespace jsonbuilder {

/**
 * @brief Write a leaf at path, creating intermediates as needed
 *
 * @param doc Target document (modified in place)
 * @param path Normalized path, at least one segment
 * @param leaf Node to store
 * @throws PathTypeError if a non-container blocks the walk, or a final
 *         "[*]" segment addresses an existing non-array
 * @throws PathResolutionError if path is empty
 *
 * Containers created before a PathTypeError is raised stay in place.
 *
 * Examples:
 * ```cpp
 * Node doc = Node::object();
 * put_at(doc, normalize_path("user.name"), "John");
 * // {"user": {"name": "John"}}
 * put_at(doc, normalize_path("user.tags[*]"), "a");
 * put_at(doc, normalize_path("user.tags[*]"), "b");
 * // {"user": {"name": "John", "tags": ["a", "b"]}}
 * put_at(doc, normalize_path("user.name.first"), "x");
 * // Throws PathTypeError (name is a string)
 * ```
 */
void put_at(Node& doc, const Path& path, Node leaf);

/**
 * @brief Remove the node addressed by path from its parent
 *
 * @param doc Target document (modified in place)
 * @param path Normalized path
 * @throws PathResolutionError if any segment is absent, the path is
 *         empty, or a final "[*]" segment addresses a non-array
 */
void erase_at(Node& doc, const Path& path);

/**
 * @brief Look up the node addressed by path
 * @return Pointer into doc, or nullptr if any segment is absent
 */
const Node* find_at(const Node& doc, const Path& path);

} // namespace jsonbuilder

#endif // JSONBUILDER_MUTATE_HPP
