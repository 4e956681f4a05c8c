/**
 * @file Classify.hpp
 * @brief Leaf value classification for put()
 *
 * Classification rules (first match wins):
 * - C1: Null node → stored as explicit null, never omitted
 * - C2: Mapping, or object Node → nested structure, stored as an
 *       independent object subtree
 * - C3: String containing '{' → embedded JSON text, decoded by the
 *       codec and stored as an object subtree; any other decoded
 *       root is rejected
 * - C4: Anything else → literal, stored as given
 *
 * C3 is a plain substring check: a literal string that happens to
 * contain a brace is decoded too, and fails the put if it is not
 * valid text for the codec.
 */

#ifndef JSONBUILDER_CLASSIFY_HPP
#define JSONBUILDER_CLASSIFY_HPP

#include "jsonbuilder/Codec.hpp"
#include "jsonbuilder/Value.hpp"

namespace jsonbuilder {

enum class LeafKind {
    Null,
    EmbeddedJsonText,
    NestedStructure,
    Literal
};

/**
 * @brief Human-readable name of a leaf kind, for diagnostics
 */
const char* leaf_kind_name(LeafKind kind) noexcept;

LeafKind classify(const Node& value);

inline LeafKind classify(const Mapping&) {
    return LeafKind::NestedStructure;
}

/**
 * @brief Produce the node that put() stores for a value
 *
 * @param value Value supplied to put()
 * @param codec Codec used to decode embedded text
 * @return Node to insert into the document
 * @throws DecodeError if embedded text does not decode to an object
 *
 * Examples:
 * ```cpp
 * resolve_leaf(Node(nullptr), codec)           // → null
 * resolve_leaf("{\"a\": 1}", codec)            // → {"a": 1} (object)
 * resolve_leaf("hello", codec)                 // → "hello"
 * resolve_leaf(42, codec)                      // → 42
 * resolve_leaf("{oops", codec)                 // throws DecodeError
 * resolve_leaf("[{\"a\": 1}]", codec)        // throws DecodeError (array root)
 * ```
 */
Node resolve_leaf(const Node& value, const Codec& codec);

/**
 * @brief Re-encode a mapping as an object subtree
 * @throws EncodeError if the mapping holds unsupported types
 */
Node resolve_leaf(const Mapping& value, const Codec& codec);

} // namespace jsonbuilder

#endif // JSONBUILDER_CLASSIFY_HPP
