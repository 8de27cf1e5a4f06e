/**
 * @file session.hpp
 * @brief Conversation sessions for geminiweb
 */

#ifndef GEMINIWEB_SESSION_HPP
#define GEMINIWEB_SESSION_HPP

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geminiweb {

class Client;

/**
 * Multi-turn conversation. Threads the [cid, rid, rcid] lineage from
 * one turn into the next.
 *
 * Holds a reference to the client that created it and must not outlive it.
 */
class ChatSession {
public:
    /**
     * @throws ValidationError for an unknown model or a lineage longer than 3
     */
    ChatSession(Client& client, const ChatOptions& options = {});

    /**
     * Send a message in this conversation
     * @param prompt Message text
     * @param files Local files to attach
     * @return The new output, also stored as last_output()
     */
    ModelOutput send(const std::string& prompt, const std::vector<std::string>& files = {});

    /**
     * Make `output` the latest turn: stores it, copies its lineage snapshot
     * into the session and takes rcid from its chosen candidate
     */
    void apply_output(const ModelOutput& output);

    /**
     * Continue the conversation from another candidate of the last output
     * @throws ValidationError when there is no output or index is out of range
     */
    const ModelOutput& choose_candidate(size_t index);

    const ConversationLineage& lineage() const { return lineage_; }
    const std::optional<ModelOutput>& last_output() const { return last_output_; }

    const ConversationLineage::Slot& cid() const { return lineage_.cid(); }
    const ConversationLineage::Slot& rid() const { return lineage_.rid(); }
    const ConversationLineage::Slot& rcid() const { return lineage_.rcid(); }

    void set_cid(const ConversationLineage::Slot& cid) { lineage_.set_cid(cid); }
    void set_rid(const ConversationLineage::Slot& rid) { lineage_.set_rid(rid); }
    void set_rcid(const ConversationLineage::Slot& rcid) { lineage_.set_rcid(rcid); }

    /**
     * Overwrite the leading lineage slots
     * @throws ValidationError when more than 3 values are given
     */
    void set_lineage(const std::vector<ConversationLineage::Slot>& prefix);

    const std::string& model() const { return model_; }
    void set_model(const std::string& model);

    const std::optional<std::string>& gem() const { return gem_; }
    void set_gem(const std::optional<std::string>& gem) { gem_ = gem; }

    /**
     * ChatSession(cid='..', rid='..', rcid='..')
     */
    std::string describe() const;

private:
    Client& client_;
    ConversationLineage lineage_;
    std::optional<ModelOutput> last_output_;
    std::string model_;
    std::optional<std::string> gem_;
};

} // namespace geminiweb

#endif // GEMINIWEB_SESSION_HPP
