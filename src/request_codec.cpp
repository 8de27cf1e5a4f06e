/**
 * @file request_codec.cpp
 * @brief Request payload encoding for geminiweb
 */

#include "geminiweb/request_codec.hpp"
#include "geminiweb/errors.hpp"

namespace geminiweb {

static constexpr const char* GEMS_RPC_ID = "CNgdBe";

json RequestCodec::encode_content(const std::string& prompt, const std::vector<UploadedFile>& files) {
    if (files.empty()) {
        return json::array({prompt});
    }

    json attachments = json::array();
    for (const auto& file : files) {
        attachments.push_back(json::array({json::array({file.upload_ref}), file.file_name}));
    }

    return json::array({prompt, 0, nullptr, attachments});
}

json RequestCodec::encode_turn(const TurnRequest& turn) {
    json lineage = nullptr;
    if (turn.lineage.has_value() && !turn.lineage->empty()) {
        lineage = turn.lineage->to_json();
    }

    json envelope = json::array({encode_content(turn.prompt, turn.files), nullptr, lineage});

    if (turn.gem_id.has_value() && !turn.gem_id->empty()) {
        for (size_t i = 0; i < GEM_PADDING; i++) {
            envelope.push_back(nullptr);
        }
        envelope.push_back(*turn.gem_id);
    }

    return envelope;
}

FormFields RequestCodec::generation_form(const std::string& access_token, const TurnRequest& turn) {
    std::string encoded;
    try {
        encoded = encode_turn(turn).dump();
    } catch (const json::type_error& e) {
        throw ValidationError(std::string("Request text must be valid UTF-8: ") + e.what(), "turn");
    }

    json request = json::array({nullptr, encoded});
    return {
        {"at", access_token},
        {"f.req", request.dump()}
    };
}

json RequestCodec::encode_batch(const std::vector<RpcCall>& calls) {
    json entries = json::array();
    for (const auto& call : calls) {
        entries.push_back(json::array({call.rpc_id, call.payload, nullptr, call.identifier}));
    }
    return json::array({entries});
}

FormFields RequestCodec::batch_form(const std::string& access_token, const std::vector<RpcCall>& calls) {
    return {
        {"at", access_token},
        {"f.req", encode_batch(calls).dump()}
    };
}

std::vector<RpcCall> RequestCodec::gems_rpc_calls(const std::string& language) {
    json language_list = json::array({language});
    return {
        {GEMS_RPC_ID, json::array({2, language_list, 0}).dump(), "custom"},
        {GEMS_RPC_ID, json::array({3, language_list, 0}).dump(), "system"}
    };
}

} // namespace geminiweb
