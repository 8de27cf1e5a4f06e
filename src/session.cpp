/**
 * @file session.cpp
 * @brief Session implementation for geminiweb
 */

#include "geminiweb/session.hpp"
#include "geminiweb/client.hpp"
#include "geminiweb/errors.hpp"

namespace geminiweb {

ChatSession::ChatSession(Client& client, const ChatOptions& options)
    : client_(client),
      model_(Model::from_name(options.model).name),
      gem_(options.gem) {
    lineage_.assign(options.lineage);

    if (options.cid.has_value()) lineage_.set_cid(options.cid);
    if (options.rid.has_value()) lineage_.set_rid(options.rid);
    if (options.rcid.has_value()) lineage_.set_rcid(options.rcid);
}

ModelOutput ChatSession::send(const std::string& prompt, const std::vector<std::string>& files) {
    GenerateOptions options;
    options.prompt = prompt;
    options.files = files;
    options.model = model_;
    options.gem = gem_;

    ModelOutput output = client_.generate_content(options, lineage_);
    apply_output(output);
    return output;
}

void ChatSession::apply_output(const ModelOutput& output) {
    last_output_ = output;
    lineage_.assign(output.lineage());
    lineage_.set_rcid(output.rcid());
}

const ModelOutput& ChatSession::choose_candidate(size_t index) {
    if (!last_output_.has_value()) {
        throw ValidationError("No previous output data found in this chat session.", "index");
    }

    if (index >= last_output_->candidates().size()) {
        throw ValidationError(
            "Index " + std::to_string(index) + " exceeds the number of candidates in last model output.",
            "index",
            std::to_string(index)
        );
    }

    last_output_->set_chosen(index);
    lineage_.set_rcid(last_output_->rcid());
    return *last_output_;
}

void ChatSession::set_lineage(const std::vector<ConversationLineage::Slot>& prefix) {
    lineage_.assign(prefix);
}

void ChatSession::set_model(const std::string& model) {
    model_ = Model::from_name(model).name;
}

std::string ChatSession::describe() const {
    auto quote = [](const ConversationLineage::Slot& slot) {
        return slot.has_value() ? "'" + *slot + "'" : std::string("null");
    };

    return "ChatSession(cid=" + quote(lineage_.cid()) +
           ", rid=" + quote(lineage_.rid()) +
           ", rcid=" + quote(lineage_.rcid()) + ")";
}

} // namespace geminiweb
