/**
 * @file test_session.cpp
 * @brief Tests for conversation sessions
 */

#include <geminiweb/client.hpp>
#include <geminiweb/errors.hpp>
#include <gtest/gtest.h>
#include "mock_transport.hpp"
#include "wire_fixtures.hpp"

using namespace geminiweb;
using namespace geminiweb::testing;

static std::string two_candidate_response() {
    json body = make_body(
        json::array({"c_1", "r_1"}),
        json::array({make_candidate("rc_a", "First draft"), make_candidate("rc_b", "Second draft")})
    );
    return frame(json::array({make_part(body)}));
}

class ChatSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<MockTransport>([this](const HttpRequest& request) {
            if (request.url == INIT_ENDPOINT) {
                return HttpResponse{200, app_page(), {}};
            }
            std::string body = replies.empty() ? simple_response("Done") : replies.front();
            if (!replies.empty()) replies.erase(replies.begin());
            return HttpResponse{200, body, {}};
        });

        ClientOptions options;
        options.secure_1psid = "sid";
        options.auto_refresh = false;
        options.retry_delay = std::chrono::milliseconds(0);
        options.log_level = LogLevel::None;
        client = std::make_unique<Client>(options, transport, std::make_shared<MockUploader>());
    }

    json last_turn() const {
        json outer = json::parse(form_value(transport->requests().back(), "f.req"));
        return json::parse(outer[1].get<std::string>());
    }

    std::vector<std::string> replies;
    std::shared_ptr<MockTransport> transport;
    std::unique_ptr<Client> client;
};

TEST_F(ChatSessionTest, SendThreadsLineageIntoNextTurn) {
    replies = {simple_response("One", "c_1", "r_1", "rc_1"), simple_response("Two", "c_1", "r_2", "rc_2")};
    ChatSession chat = client->start_chat();

    chat.send("first");
    EXPECT_TRUE(last_turn()[2].is_null());
    EXPECT_EQ(chat.cid(), "c_1");
    EXPECT_EQ(chat.rid(), "r_1");
    EXPECT_EQ(chat.rcid(), "rc_1");

    ModelOutput second = chat.send("second");
    EXPECT_EQ(last_turn()[2], json::parse(R"(["c_1", "r_1", "rc_1"])"));
    EXPECT_EQ(second.text(), "Two");
    EXPECT_EQ(chat.rid(), "r_2");
    EXPECT_EQ(chat.rcid(), "rc_2");
    ASSERT_TRUE(chat.last_output().has_value());
    EXPECT_EQ(*chat.last_output(), second);
}

TEST_F(ChatSessionTest, ChooseCandidateNeedsOutput) {
    ChatSession chat = client->start_chat();

    EXPECT_THROW(chat.choose_candidate(0), ValidationError);
}

TEST_F(ChatSessionTest, ChooseCandidateUpdatesReplyCandidate) {
    replies = {two_candidate_response()};
    ChatSession chat = client->start_chat();
    chat.send("draft something");
    EXPECT_EQ(chat.rcid(), "rc_a");

    const ModelOutput& output = chat.choose_candidate(1);

    EXPECT_EQ(output.chosen(), 1u);
    EXPECT_EQ(output.text(), "Second draft");
    EXPECT_EQ(chat.rcid(), "rc_b");
    EXPECT_EQ(chat.cid(), "c_1");
}

TEST_F(ChatSessionTest, ChooseCandidateOutOfRange) {
    replies = {two_candidate_response()};
    ChatSession chat = client->start_chat();
    chat.send("draft something");

    EXPECT_THROW(chat.choose_candidate(2), ValidationError);
    EXPECT_EQ(chat.rcid(), "rc_a");
    EXPECT_EQ(chat.last_output()->chosen(), 0u);
}

TEST_F(ChatSessionTest, ApplyOutputIsTheOnlyLineageSideEffect) {
    ChatSession chat = client->start_chat();

    Candidate candidate;
    candidate.rcid = "rc_x";
    candidate.text = "x";
    ModelOutput output({std::string("c_x")}, {candidate});

    chat.set_rid(std::string("r_keep"));
    chat.apply_output(output);

    EXPECT_EQ(chat.cid(), "c_x");
    EXPECT_EQ(chat.rid(), "r_keep");
    EXPECT_EQ(chat.rcid(), "rc_x");
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(ChatSessionTest, SetLineageKeepsTrailingSlots) {
    ChatSession chat = client->start_chat();
    chat.set_lineage({std::string("c"), std::string("r"), std::string("rc")});

    chat.set_lineage({std::string("c2")});

    std::vector<ConversationLineage::Slot> expected = {std::string("c2"), std::string("r"), std::string("rc")};
    EXPECT_EQ(chat.lineage().values(), expected);

    std::vector<ConversationLineage::Slot> too_long(4, std::string("x"));
    EXPECT_THROW(chat.set_lineage(too_long), ValidationError);
    EXPECT_EQ(chat.lineage().values(), expected);
}

TEST_F(ChatSessionTest, StartFromExistingConversation) {
    ChatOptions options;
    options.lineage = {std::string("c_old"), std::string("r_old")};
    options.rcid = std::string("rc_old");
    options.model = "gemini-2.5-pro";
    options.gem = "gem-1";
    ChatSession chat = client->start_chat(options);

    EXPECT_EQ(chat.describe(), "ChatSession(cid='c_old', rid='r_old', rcid='rc_old')");

    chat.send("continue");
    json turn = last_turn();
    EXPECT_EQ(turn[2], json::parse(R"(["c_old", "r_old", "rc_old"])"));
    EXPECT_EQ(turn[19], "gem-1");
    EXPECT_EQ(transport->requests().back().headers.count(MODEL_HEADER_KEY), 1u);
}

TEST_F(ChatSessionTest, UnknownModelIsRejected) {
    ChatOptions options;
    options.model = "gemini-unknown";

    EXPECT_THROW(client->start_chat(options), ValidationError);

    ChatSession chat = client->start_chat();
    EXPECT_THROW(chat.set_model("gemini-unknown"), ValidationError);
    EXPECT_EQ(chat.model(), "unspecified");
}

TEST_F(ChatSessionTest, DescribeNewSession) {
    ChatSession chat = client->start_chat();

    EXPECT_EQ(chat.describe(), "ChatSession(cid=null, rid=null, rcid=null)");
}
