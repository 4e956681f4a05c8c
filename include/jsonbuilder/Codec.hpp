/**
 * @file Codec.hpp
 * @brief Text <-> tree conversion used by JsonBuilder
 *
 * The codec is the only place where documents touch text. A builder
 * uses it to decode embedded JSON values, to re-encode nested
 * mappings, and to materialize the document on build(). It never
 * takes part in path resolution or mutation.
 */

#ifndef JSONBUILDER_CODEC_HPP
#define JSONBUILDER_CODEC_HPP

#include "jsonbuilder/Value.hpp"
#include <memory>
#include <string>

namespace jsonbuilder {

/**
 * @brief Pluggable encoder/decoder
 *
 * Implementations must be reentrant: a single instance may be shared by
 * any number of builders.
 */
class Codec {
public:
    virtual ~Codec() = default;

    /**
     * @brief Parse text into a Node
     * @throws DecodeError if text is malformed
     */
    virtual Node decode(const std::string& text) const = 0;

    /**
     * @brief Render a Node as text
     * @throws EncodeError if the node cannot be represented
     */
    virtual std::string encode(const Node& node) const = 0;

    /**
     * @brief Convert an object Node into a generic Mapping
     * @throws EncodeError if node is not an object
     */
    virtual Mapping to_mapping(const Node& node) const;

    /**
     * @brief Convert a generic Mapping into an object Node
     * @throws EncodeError for unsupported held types
     */
    virtual Node from_mapping(const Mapping& mapping) const;
};

/**
 * @brief JSON text codec backed by nlohmann::json
 */
class JsonCodec : public Codec {
public:
    struct Options {
        int indent = -1;              // -1 renders compact text
        bool ignore_comments = false; // accept /* */ and // comments on decode
    };

    JsonCodec() = default;
    explicit JsonCodec(Options opts) : opts_(opts) {}

    Node decode(const std::string& text) const override;
    std::string encode(const Node& node) const override;

    const Options& options() const noexcept { return opts_; }

private:
    Options opts_;
};

/**
 * @brief Process-wide default codec (a JsonCodec with default options)
 */
std::shared_ptr<const Codec> default_codec();

} // namespace jsonbuilder

#endif // JSONBUILDER_CODEC_HPP
