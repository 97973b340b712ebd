#include "config.hpp"
#include "message.hpp"
#include "test_support.hpp"

using namespace agentgate_test;

namespace {

TEST(ConfigTest, DefaultArgumentsNeverCarrySecrets) {
    Config cfg;
    auto args = cfg.agent_arguments();
    std::vector<std::string> expected = {"--interactive", "--confirm-actions"};
    EXPECT_EQ(args, expected);
}

TEST(ConfigTest, JsonModeAndModel) {
    Config cfg;
    cfg.agent.json_mode = true;
    cfg.agent.model = "gemini-2.5-pro";
    cfg.agent.confirm_actions = false;
    std::vector<std::string> expected = {"--json", "--model", "gemini-2.5-pro"};
    EXPECT_EQ(cfg.agent_arguments(), expected);
}

TEST(ConfigTest, SaveAndLoadKeepsSettings) {
    TempDir dir;
    Config cfg;
    cfg.agent.executable = "/opt/agent/bin/gemini";
    cfg.engine.max_concurrency = 5;
    cfg.classifier.deny_list = {"shred"};
    cfg.retry.rate_limit_base_ms = 9000;
    cfg.save(dir.file("nested/config.json"));

    Config loaded = Config::load(dir.file("nested/config.json"));
    EXPECT_EQ(loaded.agent.executable, "/opt/agent/bin/gemini");
    EXPECT_EQ(loaded.engine.max_concurrency, 5);
    EXPECT_EQ(loaded.classifier.deny_list, std::vector<std::string>{"shred"});
    EXPECT_EQ(loaded.retry.rate_limit_base_ms, 9000);
}

TEST(ConfigTest, MissingOrBrokenFileFallsBackToDefaults) {
    TempDir dir;
    EXPECT_EQ(Config::load(dir.file("absent.json")).agent.executable, "gemini");

    write_text(dir.file("broken.json"), "{ not json");
    EXPECT_EQ(Config::load(dir.file("broken.json")).engine.max_concurrency, 2);
}

TEST(ConfigTest, ConcurrencyIsAtLeastOne) {
    auto cfg = Config::from_json(nlohmann::json{{"engine", {{"max_concurrency", 0}}}});
    EXPECT_EQ(cfg.engine.max_concurrency, 1);
}

TEST(ConversationTest, FormatsRolesAndPreamble) {
    std::vector<Message> history = {
        {"user", "List the drafts"},
        {"assistant", "There are two."},
        {"user", "Delete them"},
    };
    std::string text = format_conversation("Be careful.", history);
    EXPECT_EQ(text,
              "System: Be careful.\n\n"
              "Human: List the drafts\n\n"
              "Assistant: There are two.\n\n"
              "Human: Delete them");
}

TEST(ConversationTest, NonTextBlocksAreMarked) {
    auto j = nlohmann::json::parse(R"({"role": "user", "content": [
        {"type": "text", "text": "look at this"},
        {"type": "image", "source": {}}
    ]})");
    Message m = Message::from_json(j);
    EXPECT_EQ(m.content, "look at this [Non-text content]");
}

TEST(ConfigTest, TimingAndRetentionSettings) {
    Config defaults;
    EXPECT_EQ(defaults.agent.stdin_idle_close_ms, 5000);
    EXPECT_EQ(defaults.classifier.prompt_idle_ms, 250);
    EXPECT_EQ(defaults.logging.memory_records, 10000u);

    nlohmann::json j = {
        {"agent", {{"stdin_idle_close_ms", -1}}},
        {"classifier", {{"prompt_idle_ms", 100}}},
        {"logging", {{"memory_records", 50}}},
    };
    Config cfg = Config::from_json(j);
    EXPECT_EQ(cfg.agent.stdin_idle_close_ms, 0);
    EXPECT_EQ(cfg.classifier.prompt_idle_ms, 100);
    EXPECT_EQ(cfg.logging.memory_records, 50u);
}

} // namespace
