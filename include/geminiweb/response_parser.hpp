/**
 * @file response_parser.hpp
 * @brief Decodes the service's multi-line responses
 */

#ifndef GEMINIWEB_RESPONSE_PARSER_HPP
#define GEMINIWEB_RESPONSE_PARSER_HPP

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geminiweb {

/**
 * What the parser needs to know about the call that produced the response
 */
struct ParseContext {
    std::string model_name = "unspecified";
    // Attached to generated images so they can be fetched later
    CookieJar cookies;
};

struct ParserOptions {
    // Parts examined from the body onwards when looking for generated images; at least 1
    size_t image_scan_limit = 64;
};

class ResponseParser {
public:
    explicit ResponseParser(const ParserOptions& options = {});

    /**
     * Decode a generation response
     * @throws APIError when no body can be located or the body is malformed
     * @throws UsageLimitExceeded, ModelInvalid, TemporarilyBlocked for known rejections
     * @throws ImageGenerationError when announced generated images are missing
     * @throws GeminiError when the body holds no candidates
     */
    ModelOutput parse_generation(const std::string& raw, const ParseContext& context = {}) const;

    /**
     * Decode a gem listing batch response
     * @throws APIError when neither gem list is present or a part is malformed
     */
    std::vector<Gem> parse_gems(const std::string& raw) const;

    /**
     * Parse the parts array out of the response text
     * @return Array of parts, or nullopt when the text is not in the expected framing
     */
    static std::optional<json> parse_parts(const std::string& raw);

    /**
     * Parse a part's embedded JSON payload; nullopt when absent or invalid
     */
    static std::optional<json> parse_part_payload(const json& part);

private:
    struct BodyLocation {
        json body;
        size_t index;
    };

    static std::optional<BodyLocation> locate_body(const json& parts);
    [[noreturn]] static void raise_structural_failure(const json& parts, const ParseContext& context);

    Candidate parse_candidate(
        const json& candidate,
        size_t candidate_index,
        const json& parts,
        size_t body_index,
        const ParseContext& context
    ) const;

    std::vector<WebImage> parse_web_images(const json& candidate) const;

    std::vector<GeneratedImage> parse_generated_images(
        const json& image_candidate,
        const ParseContext& context
    ) const;

    std::optional<json> find_image_body(const json& parts, size_t body_index, size_t candidate_index) const;

    ParserOptions options_;
};

} // namespace geminiweb

#endif // GEMINIWEB_RESPONSE_PARSER_HPP
