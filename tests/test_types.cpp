/**
 * @file test_types.cpp
 * @brief Tests for data model types and configuration helpers
 */

#include <geminiweb/errors.hpp>
#include <geminiweb/types.hpp>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace geminiweb;

TEST(LineageTest, SettersTouchOneSlot) {
    ConversationLineage lineage;
    lineage.set_rid(std::string("r_1"));

    EXPECT_FALSE(lineage.cid().has_value());
    EXPECT_EQ(lineage.rid(), "r_1");
    EXPECT_FALSE(lineage.rcid().has_value());
    EXPECT_FALSE(lineage.empty());
}

TEST(LineageTest, AssignOverwritesOnlyThePrefix) {
    ConversationLineage lineage;
    lineage.assign({std::string("c_1"), std::string("r_1"), std::string("rc_1")});

    lineage.assign({std::string("c_2")});
    EXPECT_EQ(lineage.cid(), "c_2");
    EXPECT_EQ(lineage.rid(), "r_1");
    EXPECT_EQ(lineage.rcid(), "rc_1");

    lineage.assign({std::string("c_3"), std::string("r_3")});
    std::vector<ConversationLineage::Slot> expected = {std::string("c_3"), std::string("r_3"), std::string("rc_1")};
    EXPECT_EQ(lineage.values(), expected);
}

TEST(LineageTest, AssignRejectsMoreThanThree) {
    ConversationLineage lineage;
    lineage.assign({std::string("c_1")});

    std::vector<ConversationLineage::Slot> too_long = {
        std::string("a"), std::string("b"), std::string("c"), std::string("d")
    };
    EXPECT_THROW(lineage.assign(too_long), ValidationError);
    EXPECT_EQ(lineage.cid(), "c_1");
}

TEST(LineageTest, EmptyPrefixChangesNothing) {
    ConversationLineage lineage;
    lineage.assign({});
    EXPECT_TRUE(lineage.empty());
    EXPECT_EQ(lineage.to_json(), json::parse("[null, null, null]"));
}

TEST(ModelOutputTest, ChosenCandidateDrivesAccessors) {
    Candidate first;
    first.rcid = "rc_a";
    first.text = "A";
    Candidate second;
    second.rcid = "rc_b";
    second.text = "B";
    second.thoughts = "hmm";

    ModelOutput output({std::string("c"), std::string("r")}, {first, second});
    EXPECT_EQ(output.chosen(), 0u);
    EXPECT_EQ(output.text(), "A");

    output.set_chosen(1);
    EXPECT_EQ(output.text(), "B");
    EXPECT_EQ(output.rcid(), "rc_b");
    EXPECT_EQ(output.thoughts(), "hmm");

    EXPECT_THROW(output.set_chosen(2), ValidationError);
    EXPECT_EQ(output.chosen(), 1u);
}

TEST(ModelTest, KnownModelsCarryHeaders) {
    Model pro = Model::from_name("gemini-2.5-pro");
    EXPECT_EQ(pro.name, "gemini-2.5-pro");
    EXPECT_EQ(pro.headers.count(MODEL_HEADER_KEY), 1u);

    EXPECT_TRUE(Model::unspecified().headers.empty());
}

TEST(ModelTest, UnknownModelIsRejected) {
    try {
        Model::from_name("gemini-0.1-imaginary");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "model");
        EXPECT_EQ(e.value(), "gemini-0.1-imaginary");
    }
}

TEST(GemCacheTest, LookupAndFilter) {
    Gem coding{"g1", "Coding partner", "code", std::nullopt, true};
    Gem mine{"g2", "Mine", "custom", std::string("Be terse"), false};
    Gem other{"g3", "Other", "custom", std::nullopt, false};
    GemCache cache({coding, mine, other});

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.get("g2"), mine);
    EXPECT_FALSE(cache.get("missing").has_value());
    EXPECT_EQ(cache.find_by_name("Coding partner"), coding);

    GemCache custom = cache.filter(false);
    EXPECT_EQ(custom.size(), 2u);
    EXPECT_FALSE(custom.get("g1").has_value());

    GemCache named = cache.filter(false, std::string("Other"));
    ASSERT_EQ(named.size(), 1u);
    EXPECT_EQ(named.begin()->second, other);

    EXPECT_EQ(cache.filter().size(), 3u);
}

TEST(ErrorCodeTest, MapsKnownCodesOnly) {
    EXPECT_EQ(error_code_from_int(1037), ErrorCode::UsageLimitExceeded);
    EXPECT_EQ(error_code_from_int(1052), ErrorCode::ModelHeaderInvalid);
    EXPECT_EQ(error_code_from_int(1060), ErrorCode::IpTemporarilyBlocked);
    EXPECT_FALSE(error_code_from_int(1000).has_value());
}

class EnvCookiesTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(ENV_SECURE_1PSID);
        unsetenv(ENV_SECURE_1PSIDTS);
        env_file_ = std::filesystem::temp_directory_path() / "geminiweb_test.env";
    }

    void TearDown() override {
        unsetenv(ENV_SECURE_1PSID);
        unsetenv(ENV_SECURE_1PSIDTS);
        std::filesystem::remove(env_file_);
    }

    std::filesystem::path env_file_;
};

TEST_F(EnvCookiesTest, EnvironmentVariablesWin) {
    setenv(ENV_SECURE_1PSID, "env-sid", 1);
    setenv(ENV_SECURE_1PSIDTS, "env-ts", 1);

    std::ofstream(env_file_) << "GEMINI_SECURE_1PSID=file-sid\n";

    CookieJar cookies = load_cookies_from_env(env_file_.string());
    EXPECT_EQ(cookies.at(SECURE_1PSID), "env-sid");
    EXPECT_EQ(cookies.at(SECURE_1PSIDTS), "env-ts");
}

TEST_F(EnvCookiesTest, FallsBackToEnvFile) {
    std::ofstream(env_file_)
        << "# cookies\n"
        << "GEMINI_SECURE_1PSID=\"file-sid\"\n"
        << "GEMINI_SECURE_1PSIDTS='file-ts'\n";

    CookieJar cookies = load_cookies_from_env(env_file_.string());
    EXPECT_EQ(cookies.at(SECURE_1PSID), "file-sid");
    EXPECT_EQ(cookies.at(SECURE_1PSIDTS), "file-ts");
}

TEST_F(EnvCookiesTest, NothingConfiguredGivesEmptyJar) {
    EXPECT_TRUE(load_cookies_from_env(env_file_.string()).empty());
}

TEST(TimestampTest, FormatsUtc) {
    auto epoch = std::chrono::system_clock::time_point{};
    EXPECT_EQ(format_timestamp(epoch), "1970-01-01T00:00:00Z");
}
