/**
 * @file wire_schema.hpp
 * @brief Known positions inside the service's nested-array payloads
 *
 * The service never declares its schema; every position consumed by the
 * parser is listed here so a layout change is fixed in one place.
 */

#ifndef GEMINIWEB_WIRE_SCHEMA_HPP
#define GEMINIWEB_WIRE_SCHEMA_HPP

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geminiweb {
namespace wire {

constexpr int SCHEMA_VERSION = 1;

// Zero-based line of the response text holding the parts array
constexpr size_t PAYLOAD_LINE = 2;

// Negative indices count from the end of an array
using FieldPath = std::vector<int>;

enum class Field {
    // Relative to a part of the outer array
    PartPayload,
    PartTag,
    // Relative to the parsed body payload
    BodyLineage,
    BodyCandidates,
    // Relative to the outer array
    ErrorCode,
    // Relative to a candidate
    CandidateId,
    CandidateText,
    CandidateCardText,
    CandidateThoughts,
    CandidateWebImages,
    CandidateGeneratedImages,
    // Relative to a web image entry
    WebImageUrl,
    WebImageTitle,
    WebImageAlt,
    // Relative to a generated image entry
    GeneratedImageUrl,
    GeneratedImageNumber,
    GeneratedImageAlts,
    // Relative to a gem listing payload
    GemList,
    // Relative to a gem entry
    GemId,
    GemName,
    GemDescription,
    GemPrompt
};

/**
 * Index path for a semantic field
 */
const FieldPath& path(Field field);

const char* field_name(Field field);

/**
 * Walk `root` along `path`; nullptr when any step is missing or not an array
 */
const json* lookup(const json& root, const FieldPath& path);
const json* lookup(const json& root, Field field);

/**
 * Walk `prefix`, then the path of `field` from there
 */
const json* lookup(const json& root, const FieldPath& prefix, Field field);

std::optional<std::string> string_at(const json& root, Field field);

/**
 * Loose truthiness of the service's payloads: null, false, zero,
 * empty strings and empty arrays are all falsy
 */
bool truthy(const json* value);

} // namespace wire
} // namespace geminiweb

#endif // GEMINIWEB_WIRE_SCHEMA_HPP
