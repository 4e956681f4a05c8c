#include "jsonbuilder/JsonBuilder.hpp"
#include "jsonbuilder/Classify.hpp"
#include "jsonbuilder/Log.hpp"
#include "jsonbuilder/Mutate.hpp"
#include "jsonbuilder/Path.hpp"
#include <stdexcept>

namespace jsonbuilder {

JsonBuilder::JsonBuilder(std::shared_ptr<const Codec> codec)
    : codec_(std::move(codec)) {}

JsonBuilder JsonBuilder::builder() {
    return JsonBuilder(default_codec());
}

JsonBuilder JsonBuilder::builder(std::shared_ptr<const Codec> codec) {
    if (!codec) throw std::invalid_argument("JsonBuilder requires a codec");
    return JsonBuilder(std::move(codec));
}

Node JsonBuilder::build_empty() {
    return Node::object();
}

// ---- put ----------------------------------------------------------------

template <typename T>
JsonBuilder& JsonBuilder::put_value(const std::string& path, const T& value) {
    const Path segments = normalize_path(path);
    // Resolve before walking: a value that fails to decode leaves no trace
    Node leaf = resolve_leaf(value, *codec_);
    put_at(document_, segments, std::move(leaf));
    JSONBUILDER_DEBUG("put {}", format_path(segments));
    return *this;
}

JsonBuilder& JsonBuilder::put(const std::string& path, const Node& value) {
    return put_value(path, value);
}

JsonBuilder& JsonBuilder::put(const std::string& path, const Mapping& value) {
    return put_value(path, value);
}

JsonBuilder& JsonBuilder::silent_put(const std::string& path, const Node& value) {
    try {
        return put(path, value);
    } catch (const BuildError& e) {
        return skip_put(path, e);
    }
}

JsonBuilder& JsonBuilder::silent_put(const std::string& path, const Mapping& value) {
    try {
        return put(path, value);
    } catch (const BuildError& e) {
        return skip_put(path, e);
    }
}

JsonBuilder& JsonBuilder::skip_put(const std::string& path, const BuildError& e) {
    JSONBUILDER_WARN("silent_put '{}' ignored: {}", path, e.what());
    return *this;
}

// ---- remove -------------------------------------------------------------

JsonBuilder& JsonBuilder::remove(const std::string& path) {
    const Path segments = normalize_path(path);
    try {
        erase_at(document_, segments);
        JSONBUILDER_DEBUG("removed {}", format_path(segments));
    } catch (const PathResolutionError& e) {
        JSONBUILDER_DEBUG("remove '{}' skipped: {}", path, e.what());
    }
    return *this;
}

// ---- build --------------------------------------------------------------

Node JsonBuilder::build() const {
    return codec_->decode(codec_->encode(document_));
}

Mapping JsonBuilder::build_as_map() const {
    return codec_->to_mapping(build());
}

Node JsonBuilder::silent_build() const {
    try {
        return build();
    } catch (const BuildError& e) {
        JSONBUILDER_WARN("silent_build failed: {}", e.what());
        return build_empty();
    }
}

Mapping JsonBuilder::silent_build_as_map() const {
    try {
        return build_as_map();
    } catch (const BuildError& e) {
        JSONBUILDER_WARN("silent_build_as_map failed: {}", e.what());
        return Mapping{};
    }
}

std::string JsonBuilder::to_string() const {
    return codec_->encode(document_);
}

} // namespace jsonbuilder
