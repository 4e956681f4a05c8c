/**
 * @file Codec.cpp
 * @brief Implementation of the JSON codec
 */

#include "jsonbuilder/Codec.hpp"
#include "jsonbuilder/Errors.hpp"
#include "jsonbuilder/Generic.hpp"
#include <cmath>

namespace jsonbuilder {

Mapping Codec::to_mapping(const Node& node) const {
    return jsonbuilder::to_mapping(node);
}

Node Codec::from_mapping(const Mapping& mapping) const {
    return jsonbuilder::from_mapping(mapping);
}

namespace {
    /**
     * @brief Find a NaN or infinite float, which JSON text cannot carry
     * @return Pointer to the offending leaf, or nullptr
     */
    const Node* find_non_finite(const Node& node) {
        if (node.is_number_float()) {
            return std::isfinite(node.get<double>()) ? nullptr : &node;
        }
        if (is_container(node)) {
            for (const auto& child : node) {
                if (const Node* bad = find_non_finite(child)) return bad;
            }
        }
        return nullptr;
    }
}

Node JsonCodec::decode(const std::string& text) const {
    try {
        return Node::parse(text, nullptr, true, opts_.ignore_comments);
    } catch (const nlohmann::json::exception& e) {
        // parse_error for syntax, out_of_range for number overflow
        throw DecodeError(text, e.what());
    }
}

std::string JsonCodec::encode(const Node& node) const {
    // dump() would silently write these as null
    if (const Node* bad = find_non_finite(node)) {
        throw EncodeError("non-finite number " + std::to_string(bad->get<double>()) +
                          " has no JSON form");
    }
    try {
        return node.dump(opts_.indent);
    } catch (const nlohmann::json::exception& e) {
        // dump() rejects strings that are not valid UTF-8
        throw EncodeError(e.what());
    }
}

std::shared_ptr<const Codec> default_codec() {
    static const std::shared_ptr<const Codec> codec = std::make_shared<JsonCodec>();
    return codec;
}

} // namespace jsonbuilder
