/**
 * @file Generic.hpp
 * @brief Conversions between Node trees and generic mappings
 *
 * The generic form is what JsonBuilder::build_as_map() hands out and
 * what put() accepts back as a nested structure:
 *
 * | Node kind        | std::any holds   |
 * |------------------|------------------|
 * | null             | std::nullptr_t   |
 * | boolean          | bool             |
 * | integer          | std::int64_t     |
 * | unsigned integer | std::uint64_t    |
 * | float            | double           |
 * | string           | std::string      |
 * | array            | Sequence         |
 * | object           | Mapping          |
 */

#ifndef JSONBUILDER_GENERIC_HPP
#define JSONBUILDER_GENERIC_HPP

#include "jsonbuilder/Value.hpp"

namespace jsonbuilder {

/**
 * @brief Convert any Node into its generic representation
 * @throws EncodeError for node kinds with no generic form (binary)
 */
std::any to_generic(const Node& node);

/**
 * @brief Convert an object Node into a Mapping
 * @throws EncodeError if node is not an object
 */
Mapping to_mapping(const Node& node);

/**
 * @brief Convert a generic value back into a Node
 *
 * Besides the types listed above, accepts the other built-in integer
 * widths, float, const char*, an empty std::any (as null) and a Node.
 *
 * @throws EncodeError for any other held type
 */
Node from_generic(const std::any& value);

/**
 * @brief Convert a Mapping into an object Node
 * @throws EncodeError if a nested value has an unsupported type
 */
Node from_mapping(const Mapping& mapping);

} // namespace jsonbuilder

#endif // JSONBUILDER_GENERIC_HPP
