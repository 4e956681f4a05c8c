/**
 * @file Value.hpp
 * @brief Node and generic mapping types for built documents
 *
 * Uses nlohmann::ordered_json as the document tree so object keys keep
 * their insertion order:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Node, ...])
 * - Object ({String: Node, ...})
 *
 * The generic mapping form (Mapping / Sequence) holds the same data as
 * std::any leaves and carries no nlohmann types.
 */

#ifndef JSONBUILDER_VALUE_HPP
#define JSONBUILDER_VALUE_HPP

#include <nlohmann/json.hpp>
#include <any>
#include <map>
#include <string>
#include <vector>

namespace jsonbuilder {

/**
 * @brief Tree node of a built document
 *
 * Alias for nlohmann::ordered_json. See nlohmann::json documentation
 * for the complete API.
 */
using Node = nlohmann::ordered_json;

/**
 * @brief Generic nested mapping
 *
 * Values are one of: std::nullptr_t, bool, std::int64_t, std::uint64_t,
 * double, std::string, Sequence, Mapping.
 */
using Mapping = std::map<std::string, std::any>;

/**
 * @brief Generic sequence, element types as for Mapping
 */
using Sequence = std::vector<std::any>;

/**
 * @brief Get human-readable type name for a Node
 * @param node The node to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Node& node) {
    if (node.is_null()) return "null";
    if (node.is_boolean()) return "boolean";
    if (node.is_number_integer()) return "integer";
    if (node.is_number_float()) return "float";
    if (node.is_string()) return "string";
    if (node.is_array()) return "array";
    if (node.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if node is a container (array or object)
 */
inline bool is_container(const Node& node) {
    return node.is_array() || node.is_object();
}

} // namespace jsonbuilder

#endif // JSONBUILDER_VALUE_HPP
