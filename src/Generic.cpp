/**
 * @file Generic.cpp
 * @brief Implementation of Node <-> generic mapping conversions
 */

#include "jsonbuilder/Generic.hpp"
#include "jsonbuilder/Errors.hpp"
#include <cstdint>

namespace jsonbuilder {

std::any to_generic(const Node& node) {
    if (node.is_null()) {
        return std::any(nullptr);
    } else if (node.is_boolean()) {
        return std::any(node.get<bool>());
    } else if (node.is_number_unsigned()) {
        return std::any(node.get<std::uint64_t>());
    } else if (node.is_number_integer()) {
        return std::any(node.get<std::int64_t>());
    } else if (node.is_number_float()) {
        return std::any(node.get<double>());
    } else if (node.is_string()) {
        return std::any(node.get<std::string>());
    } else if (node.is_array()) {
        Sequence seq;
        seq.reserve(node.size());
        for (const auto& elem : node) seq.push_back(to_generic(elem));
        return std::any(std::move(seq));
    } else if (node.is_object()) {
        Mapping map;
        for (auto it = node.begin(); it != node.end(); ++it) {
            map[it.key()] = to_generic(it.value());
        }
        return std::any(std::move(map));
    }
    throw EncodeError("no generic form for " + type_name(node) + " node");
}

Mapping to_mapping(const Node& node) {
    if (!node.is_object()) {
        throw EncodeError("expected object root, got " + type_name(node));
    }
    return std::any_cast<Mapping>(to_generic(node));
}

namespace {
    template <typename T>
    bool holds(const std::any& value) {
        return std::any_cast<T>(&value) != nullptr;
    }

    template <typename T>
    const T& held(const std::any& value) {
        return *std::any_cast<T>(&value);
    }
}

Node from_generic(const std::any& value) {
    if (!value.has_value() || holds<std::nullptr_t>(value)) {
        return Node(nullptr);
    }

    if (holds<bool>(value)) return Node(held<bool>(value));

    if (holds<int>(value)) return Node(held<int>(value));
    if (holds<long>(value)) return Node(held<long>(value));
    if (holds<long long>(value)) return Node(held<long long>(value));
    if (holds<unsigned>(value)) return Node(held<unsigned>(value));
    if (holds<unsigned long>(value)) return Node(held<unsigned long>(value));
    if (holds<unsigned long long>(value)) return Node(held<unsigned long long>(value));

    if (holds<float>(value)) return Node(held<float>(value));
    if (holds<double>(value)) return Node(held<double>(value));

    if (holds<std::string>(value)) return Node(held<std::string>(value));
    if (holds<const char*>(value)) {
        const char* s = held<const char*>(value);
        return s ? Node(s) : Node(nullptr);
    }

    if (holds<Sequence>(value)) {
        Node arr = Node::array();
        for (const auto& elem : held<Sequence>(value)) {
            arr.push_back(from_generic(elem));
        }
        return arr;
    }

    if (holds<Mapping>(value)) return from_mapping(held<Mapping>(value));

    if (holds<Node>(value)) return held<Node>(value);

    throw EncodeError(std::string("unsupported value type in mapping: ") +
                      value.type().name());
}

Node from_mapping(const Mapping& mapping) {
    Node obj = Node::object();
    for (const auto& [key, val] : mapping) {
        obj[key] = from_generic(val);
    }
    return obj;
}

} // namespace jsonbuilder
