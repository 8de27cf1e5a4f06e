/**
 * @file response_parser.cpp
 * @brief Response decoding for geminiweb
 */

#include "geminiweb/response_parser.hpp"
#include "geminiweb/errors.hpp"
#include "geminiweb/logging.hpp"
#include "geminiweb/wire_schema.hpp"
#include <algorithm>
#include <regex>
#include <sstream>

namespace geminiweb {

using wire::Field;

static const char* const INVALID_RESPONSE_MESSAGE =
    "Failed to generate contents. Invalid response data received. "
    "Client will try to re-initialize on next request.";
static const char* const INVALID_BODY_MESSAGE =
    "Failed to parse response body. Data structure is invalid.";

static const std::regex& card_content_pattern() {
    static const std::regex pattern(R"(^http://googleusercontent\.com/card_content/\d+)");
    return pattern;
}

static const std::regex& image_generation_pattern() {
    static const std::regex pattern(R"(http://googleusercontent\.com/image_generation_content/\d+)");
    return pattern;
}

static std::string rstrip(const std::string& value) {
    size_t end = value.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? "" : value.substr(0, end + 1);
}

static std::string required_string(const json& root, Field field) {
    auto value = wire::string_at(root, field);
    if (!value.has_value()) {
        log::debug(std::string("Missing field ") + wire::field_name(field));
        throw APIError(INVALID_BODY_MESSAGE);
    }
    return *value;
}

// The announcing body only flags the images; a delivering part lists entries with urls
static bool delivers_generated_images(const json* list) {
    if (!wire::truthy(list) || !list->is_array()) {
        return false;
    }
    return std::any_of(list->begin(), list->end(), [](const json& entry) {
        return wire::string_at(entry, Field::GeneratedImageUrl).has_value();
    });
}

ResponseParser::ResponseParser(const ParserOptions& options)
    : options_(options) {
    // The body part itself is always examined
    options_.image_scan_limit = std::max<size_t>(options_.image_scan_limit, 1);
}

std::optional<json> ResponseParser::parse_parts(const std::string& raw) {
    std::istringstream stream(raw);
    std::string line;
    for (size_t i = 0; i <= wire::PAYLOAD_LINE; i++) {
        if (!std::getline(stream, line)) {
            return std::nullopt;
        }
    }

    json parts = json::parse(line, nullptr, false);
    if (parts.is_discarded() || !parts.is_array()) {
        return std::nullopt;
    }
    return parts;
}

std::optional<json> ResponseParser::parse_part_payload(const json& part) {
    const json* payload = wire::lookup(part, Field::PartPayload);
    if (!payload || !payload->is_string()) {
        return std::nullopt;
    }

    json parsed = json::parse(payload->get_ref<const std::string&>(), nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<ResponseParser::BodyLocation> ResponseParser::locate_body(const json& parts) {
    for (size_t index = 0; index < parts.size(); index++) {
        auto payload = parse_part_payload(parts[index]);
        if (payload && wire::truthy(wire::lookup(*payload, Field::BodyCandidates))) {
            return BodyLocation{std::move(*payload), index};
        }
    }
    return std::nullopt;
}

void ResponseParser::raise_structural_failure(const json& parts, const ParseContext& context) {
    const json* code = wire::lookup(parts, Field::ErrorCode);
    if (code && code->is_number_integer()) {
        int value = code->get<int>();
        auto error_code = error_code_from_int(value);
        if (error_code.has_value()) {
            switch (*error_code) {
                case ErrorCode::UsageLimitExceeded:
                    throw UsageLimitExceeded(
                        "Failed to generate contents. Usage limit of " + context.model_name +
                            " model has exceeded. Please try switching to another model.",
                        value
                    );
                case ErrorCode::ModelHeaderInvalid:
                    throw ModelInvalid(
                        "Failed to generate contents. The specified model is not available.",
                        value
                    );
                case ErrorCode::IpTemporarilyBlocked:
                    throw TemporarilyBlocked(
                        "Failed to generate contents. Your IP address is temporarily blocked by Google. "
                        "Please try using a proxy or waiting for a while.",
                        value
                    );
            }
        }
    }

    throw APIError(INVALID_RESPONSE_MESSAGE);
}

ModelOutput ResponseParser::parse_generation(const std::string& raw, const ParseContext& context) const {
    auto parts = parse_parts(raw);
    if (!parts.has_value()) {
        log::debug("Invalid response: " + raw);
        throw APIError(INVALID_RESPONSE_MESSAGE);
    }

    auto location = locate_body(*parts);
    if (!location.has_value()) {
        log::debug("Invalid response: " + raw);
        raise_structural_failure(*parts, context);
    }

    const json& body = location->body;
    const json* entries = wire::lookup(body, Field::BodyCandidates);
    if (!entries->is_array()) {
        log::debug("Invalid response: " + raw);
        throw APIError(INVALID_BODY_MESSAGE);
    }

    std::vector<Candidate> candidates;
    for (size_t i = 0; i < entries->size(); i++) {
        const json& entry = (*entries)[i];
        // Empty slots carry no reply
        if (!wire::truthy(&entry)) {
            continue;
        }
        candidates.push_back(parse_candidate(entry, i, *parts, location->index, context));
    }

    if (candidates.empty()) {
        throw GeminiError("Failed to generate contents. No output data found in response.");
    }

    std::vector<ConversationLineage::Slot> lineage;
    const json* lineage_json = wire::lookup(body, Field::BodyLineage);
    if (lineage_json && lineage_json->is_array()) {
        for (const auto& value : *lineage_json) {
            if (lineage.size() == ConversationLineage::SIZE) break;
            lineage.push_back(value.is_string() ? ConversationLineage::Slot(value.get<std::string>()) : std::nullopt);
        }
    }

    return ModelOutput(lineage, candidates);
}

Candidate ResponseParser::parse_candidate(
    const json& candidate,
    size_t candidate_index,
    const json& parts,
    size_t body_index,
    const ParseContext& context
) const {
    if (!candidate.is_array()) {
        throw APIError(INVALID_BODY_MESSAGE);
    }

    Candidate result;
    result.rcid = required_string(candidate, Field::CandidateId);
    result.text = required_string(candidate, Field::CandidateText);

    if (std::regex_search(result.text, card_content_pattern())) {
        auto card_text = wire::string_at(candidate, Field::CandidateCardText);
        if (card_text.has_value() && !card_text->empty()) {
            result.text = *card_text;
        }
    }

    result.thoughts = wire::string_at(candidate, Field::CandidateThoughts);
    result.web_images = parse_web_images(candidate);

    if (wire::truthy(wire::lookup(candidate, Field::CandidateGeneratedImages))) {
        auto image_body = find_image_body(parts, body_index, candidate_index);
        if (!image_body.has_value()) {
            throw ImageGenerationError(
                "Failed to parse generated images. The images were announced but did not "
                "arrive within the scanned response parts."
            );
        }

        const json* image_candidate = wire::lookup(
            *image_body,
            wire::FieldPath{wire::path(Field::BodyCandidates)[0], static_cast<int>(candidate_index)}
        );
        if (!image_candidate) {
            throw APIError(INVALID_BODY_MESSAGE);
        }

        result.text = rstrip(std::regex_replace(
            required_string(*image_candidate, Field::CandidateText),
            image_generation_pattern(),
            ""
        ));
        result.generated_images = parse_generated_images(*image_candidate, context);
    }

    return result;
}

std::vector<WebImage> ResponseParser::parse_web_images(const json& candidate) const {
    std::vector<WebImage> images;

    const json* container = wire::lookup(candidate, Field::CandidateWebImages);
    if (!wire::truthy(container) || !container->is_array()) {
        return images;
    }

    for (const auto& entry : *container) {
        images.emplace_back(
            required_string(entry, Field::WebImageUrl),
            wire::string_at(entry, Field::WebImageTitle).value_or("[Image]"),
            wire::string_at(entry, Field::WebImageAlt).value_or("")
        );
    }
    return images;
}

std::vector<GeneratedImage> ResponseParser::parse_generated_images(
    const json& image_candidate,
    const ParseContext& context
) const {
    std::vector<GeneratedImage> images;

    const json* list = wire::lookup(image_candidate, Field::CandidateGeneratedImages);
    if (!list || !list->is_array()) {
        throw APIError(INVALID_BODY_MESSAGE);
    }

    for (size_t k = 0; k < list->size(); k++) {
        const json& entry = (*list)[k];

        std::string number;
        const json* number_json = wire::lookup(entry, Field::GeneratedImageNumber);
        if (number_json && number_json->is_string()) {
            number = number_json->get<std::string>();
        } else if (number_json && number_json->is_number()) {
            number = number_json->dump();
        }

        std::string alt;
        const json* alts = wire::lookup(entry, Field::GeneratedImageAlts);
        if (alts && alts->is_array() && !alts->empty()) {
            const json& chosen = alts->size() > k ? (*alts)[k] : (*alts)[0];
            if (chosen.is_string()) {
                alt = chosen.get<std::string>();
            }
        }

        images.emplace_back(
            required_string(entry, Field::GeneratedImageUrl),
            "[Generated Image " + number + "]",
            alt,
            context.cookies
        );
    }
    return images;
}

std::optional<json> ResponseParser::find_image_body(
    const json& parts,
    size_t body_index,
    size_t candidate_index
) const {
    size_t end = std::min(parts.size(), body_index + options_.image_scan_limit);
    wire::FieldPath candidate_path{wire::path(Field::BodyCandidates)[0], static_cast<int>(candidate_index)};

    for (size_t index = body_index; index < end; index++) {
        auto payload = parse_part_payload(parts[index]);
        if (!payload) {
            continue;
        }
        if (delivers_generated_images(wire::lookup(*payload, candidate_path, Field::CandidateGeneratedImages))) {
            return payload;
        }
    }

    log::debug("Generated images not found after scanning " + std::to_string(end - body_index) + " parts");
    return std::nullopt;
}

std::vector<Gem> ResponseParser::parse_gems(const std::string& raw) const {
    static const char* const invalid_message =
        "Failed to fetch gems. Invalid response data received. "
        "Client will try to re-initialize on next request.";

    auto parts = parse_parts(raw);
    if (!parts.has_value()) {
        log::debug("Invalid response: " + raw);
        throw APIError(invalid_message);
    }

    const json* predefined = nullptr;
    const json* custom = nullptr;
    std::vector<json> payloads;
    payloads.reserve(parts->size());

    for (const auto& part : *parts) {
        auto tag = wire::string_at(part, Field::PartTag);
        if (!tag.has_value() || (*tag != "system" && *tag != "custom")) {
            continue;
        }

        auto payload = parse_part_payload(part);
        if (!payload.has_value()) {
            log::debug("Invalid response: " + raw);
            throw APIError(invalid_message);
        }
        payloads.push_back(std::move(*payload));
        const json& stored = payloads.back();

        if (*tag == "system") {
            predefined = wire::lookup(stored, Field::GemList);
        } else if (wire::truthy(&stored)) {
            custom = wire::lookup(stored, Field::GemList);
        }
    }

    bool has_predefined = wire::truthy(predefined) && predefined->is_array();
    bool has_custom = wire::truthy(custom) && custom->is_array();
    if (!has_predefined && !has_custom) {
        log::debug("Invalid response: " + raw);
        throw APIError(invalid_message);
    }

    std::vector<Gem> gems;
    auto collect = [&](const json& list, bool is_predefined) {
        for (const auto& entry : list) {
            Gem gem;
            gem.id = required_string(entry, Field::GemId);
            gem.name = required_string(entry, Field::GemName);
            gem.description = wire::string_at(entry, Field::GemDescription).value_or("");
            if (wire::truthy(wire::lookup(entry, wire::FieldPath{wire::path(Field::GemPrompt)[0]}))) {
                gem.prompt = wire::string_at(entry, Field::GemPrompt);
            }
            gem.predefined = is_predefined;
            gems.push_back(gem);
        }
    };

    if (has_predefined) collect(*predefined, true);
    if (has_custom) collect(*custom, false);

    return gems;
}

} // namespace geminiweb
