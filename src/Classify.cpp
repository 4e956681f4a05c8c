/**
 * @file Classify.cpp
 * @brief Implementation of leaf classification
 */

#include "jsonbuilder/Classify.hpp"
#include "jsonbuilder/Errors.hpp"
#include "jsonbuilder/Log.hpp"

namespace jsonbuilder {

const char* leaf_kind_name(LeafKind kind) noexcept {
    switch (kind) {
        case LeafKind::Null: return "null";
        case LeafKind::EmbeddedJsonText: return "embedded-json-text";
        case LeafKind::NestedStructure: return "nested-structure";
        case LeafKind::Literal: return "literal";
    }
    return "unknown";
}

LeafKind classify(const Node& value) {
    // C1: Null
    if (value.is_null()) {
        return LeafKind::Null;
    }

    // C2: Previously built tree
    if (value.is_object()) {
        return LeafKind::NestedStructure;
    }

    // C3: Embedded JSON text
    if (value.is_string() &&
        value.get_ref<const std::string&>().find('{') != std::string::npos) {
        return LeafKind::EmbeddedJsonText;
    }

    // C4: Literal (fallback)
    return LeafKind::Literal;
}

Node resolve_leaf(const Node& value, const Codec& codec) {
    const LeafKind kind = classify(value);
    JSONBUILDER_TRACE("classified {} value as {}", type_name(value), leaf_kind_name(kind));

    switch (kind) {
        case LeafKind::Null:
            return Node(nullptr);
        case LeafKind::EmbeddedJsonText: {
            const auto& text = value.get_ref<const std::string&>();
            Node decoded = codec.decode(text);
            if (!decoded.is_object()) {
                throw DecodeError(text, "embedded value decodes to " + type_name(decoded) +
                                        ", expected object");
            }
            return decoded;
        }
        case LeafKind::NestedStructure:
        case LeafKind::Literal:
            break;
    }
    // Copy so later mutation never reaches back into the caller's node
    return value;
}

Node resolve_leaf(const Mapping& value, const Codec& codec) {
    JSONBUILDER_TRACE("classified mapping of {} keys as {}", value.size(),
                      leaf_kind_name(classify(value)));
    return codec.from_mapping(value);
}

} // namespace jsonbuilder
