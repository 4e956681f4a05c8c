#ifndef JSONBUILDER_JSONBUILDER_HPP
#define JSONBUILDER_JSONBUILDER_HPP

#include "jsonbuilder/Codec.hpp"
#include "jsonbuilder/Errors.hpp"
#include "jsonbuilder/Value.hpp"
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace jsonbuilder {

/**
 * @brief Builds one document from path-addressed puts and removes.
 *
 * Every mutating call returns the builder itself:
 * ```cpp
 * Node doc = JsonBuilder::builder()
 *     .put("$.user.firstName", "John")
 *     .put("$.user.friends[*]", "Marco")
 *     .put("$.user.friends[*]", "Polo")
 *     .build();
 * // {"user":{"firstName":"John","friends":["Marco","Polo"]}}
 * ```
 *
 * The document is owned by the builder and is not synchronized; use one
 * builder per writer.
 */
class JsonBuilder {
public:
    // Builder using the process-wide default codec
    static JsonBuilder builder();
    // Builder using a custom codec; throws std::invalid_argument on null
    static JsonBuilder builder(std::shared_ptr<const Codec> codec);

    // A fresh, empty materialized document
    static Node build_empty();

    // Put entry; throws BuildError
    JsonBuilder& put(const std::string& path, const Node& value);
    JsonBuilder& put(const std::string& path, const Mapping& value);

    // Put entry from a supplier returning a Node or a Mapping, called once
    template <typename Supplier,
              typename = std::enable_if_t<std::is_invocable_v<Supplier&>>>
    JsonBuilder& put(const std::string& path, Supplier&& supplier) {
        return put(path, supplier());
    }

    // Put entry, logging and ignoring any BuildError
    JsonBuilder& silent_put(const std::string& path, const Node& value);
    JsonBuilder& silent_put(const std::string& path, const Mapping& value);

    template <typename Supplier,
              typename = std::enable_if_t<std::is_invocable_v<Supplier&>>>
    JsonBuilder& silent_put(const std::string& path, Supplier&& supplier) {
        try {
            return put(path, supplier());
        } catch (const BuildError& e) {
            return skip_put(path, e);
        }
    }

    // Delete entry; missing paths are ignored
    JsonBuilder& remove(const std::string& path);

    // Materialization; throws BuildError. The document is not modified.
    Node build() const;
    Mapping build_as_map() const;

    // Materialization that logs any BuildError and returns an empty result
    Node silent_build() const;
    Mapping silent_build_as_map() const;

    // Codec-encoded text of the current document
    std::string to_string() const;

    // Access the live document
    const Node& document() const noexcept { return document_; }
    const Codec& codec() const noexcept { return *codec_; }

private:
    explicit JsonBuilder(std::shared_ptr<const Codec> codec);

    // Log a failed silent_put and hand back the unchanged builder
    JsonBuilder& skip_put(const std::string& path, const BuildError& e);

    template <typename T>
    JsonBuilder& put_value(const std::string& path, const T& value);

    Node document_ = Node::object();
    std::shared_ptr<const Codec> codec_;
};

} // namespace jsonbuilder

#endif // JSONBUILDER_JSONBUILDER_HPP
