/**
 * @file wire_schema.cpp
 * @brief Field-index table for geminiweb payloads
 */

#include "geminiweb/wire_schema.hpp"
#include <map>

namespace geminiweb {
namespace wire {

struct FieldSpec {
    const char* name;
    FieldPath path;
};

static const std::map<Field, FieldSpec>& field_table() {
    static const std::map<Field, FieldSpec> table = {
        {Field::PartPayload, {"part.payload", {2}}},
        {Field::PartTag, {"part.tag", {-1}}},
        {Field::BodyLineage, {"body.lineage", {1}}},
        {Field::BodyCandidates, {"body.candidates", {4}}},
        {Field::ErrorCode, {"response.error_code", {0, 5, 2, 0, 1, 0}}},
        {Field::CandidateId, {"candidate.rcid", {0}}},
        {Field::CandidateText, {"candidate.text", {1, 0}}},
        {Field::CandidateCardText, {"candidate.card_text", {22, 0}}},
        {Field::CandidateThoughts, {"candidate.thoughts", {37, 0, 0}}},
        {Field::CandidateWebImages, {"candidate.web_images", {12, 1}}},
        {Field::CandidateGeneratedImages, {"candidate.generated_images", {12, 7, 0}}},
        {Field::WebImageUrl, {"web_image.url", {0, 0, 0}}},
        {Field::WebImageTitle, {"web_image.title", {7, 0}}},
        {Field::WebImageAlt, {"web_image.alt", {0, 4}}},
        {Field::GeneratedImageUrl, {"generated_image.url", {0, 3, 3}}},
        {Field::GeneratedImageNumber, {"generated_image.number", {3, 6}}},
        {Field::GeneratedImageAlts, {"generated_image.alts", {3, 5}}},
        {Field::GemList, {"gems.list", {2}}},
        {Field::GemId, {"gem.id", {0}}},
        {Field::GemName, {"gem.name", {1, 0}}},
        {Field::GemDescription, {"gem.description", {1, 1}}},
        {Field::GemPrompt, {"gem.prompt", {2, 0}}}
    };
    return table;
}

const FieldPath& path(Field field) {
    return field_table().at(field).path;
}

const char* field_name(Field field) {
    return field_table().at(field).name;
}

const json* lookup(const json& root, const FieldPath& path) {
    const json* current = &root;
    for (int index : path) {
        if (!current->is_array()) {
            return nullptr;
        }
        long size = static_cast<long>(current->size());
        long position = index < 0 ? size + index : index;
        if (position < 0 || position >= size) {
            return nullptr;
        }
        current = &(*current)[static_cast<size_t>(position)];
    }
    return current;
}

const json* lookup(const json& root, Field field) {
    return lookup(root, path(field));
}

const json* lookup(const json& root, const FieldPath& prefix, Field field) {
    const json* base = lookup(root, prefix);
    if (!base) {
        return nullptr;
    }
    return lookup(*base, path(field));
}

std::optional<std::string> string_at(const json& root, Field field) {
    const json* value = lookup(root, field);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return std::nullopt;
}

bool truthy(const json* value) {
    if (!value || value->is_null()) return false;
    if (value->is_boolean()) return value->get<bool>();
    if (value->is_number_integer()) return value->get<long long>() != 0;
    if (value->is_number_float()) return value->get<double>() != 0.0;
    if (value->is_string()) return !value->get_ref<const std::string&>().empty();
    if (value->is_array() || value->is_object()) return !value->empty();
    return true;
}

} // namespace wire
} // namespace geminiweb
