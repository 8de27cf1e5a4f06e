/**
 * @file request_codec.hpp
 * @brief Builds the service's positional request payloads
 */

#ifndef GEMINIWEB_REQUEST_CODEC_HPP
#define GEMINIWEB_REQUEST_CODEC_HPP

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geminiweb {

/**
 * File already pushed through the uploader
 */
struct UploadedFile {
    std::string upload_ref;
    std::string file_name;
};

struct TurnRequest {
    std::string prompt;
    std::vector<UploadedFile> files;
    std::optional<ConversationLineage> lineage;
    std::optional<std::string> gem_id;
};

/**
 * One named call inside a batchexecute request
 */
struct RpcCall {
    std::string rpc_id;
    std::string payload;
    std::string identifier = "generic";
};

/**
 * Pure encoder for generation and batch requests; performs no I/O
 */
class RequestCodec {
public:
    // Slots between the lineage and the gem id that this client leaves empty
    static constexpr size_t GEM_PADDING = 16;

    /**
     * [prompt] or [prompt, 0, null, [[[ref], name], ...]]
     */
    static json encode_content(const std::string& prompt, const std::vector<UploadedFile>& files);

    /**
     * [content, null, lineage or null] plus the padded gem id when set
     */
    static json encode_turn(const TurnRequest& turn);

    /**
     * Form body for a generation request
     * @throws ValidationError when the prompt, a file name or the gem id is not valid UTF-8
     */
    static FormFields generation_form(const std::string& access_token, const TurnRequest& turn);

    static json encode_batch(const std::vector<RpcCall>& calls);
    static FormFields batch_form(const std::string& access_token, const std::vector<RpcCall>& calls);

    /**
     * The two calls listing custom and predefined gems
     */
    static std::vector<RpcCall> gems_rpc_calls(const std::string& language = "en");
};

} // namespace geminiweb

#endif // GEMINIWEB_REQUEST_CODEC_HPP
