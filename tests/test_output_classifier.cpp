#include "output_classifier.hpp"
#include "test_support.hpp"

using namespace agentgate_test;

namespace {

class OutputClassifierTest : public ::testing::Test {
protected:
    std::shared_ptr<LogSink> sink = std::make_shared<LogSink>();
    ClassifierConfig cfg;

    OutputClassifier make() { return OutputClassifier(cfg, Logger(sink, "classifier", "cid-1")); }
};

TEST_F(OutputClassifierTest, ReasoningLine) {
    auto c = make();
    auto events = c.feed("Thinking: I should list the files first\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind(), EventKind::reasoning);
    EXPECT_EQ(events[0].as<ReasoningEvent>()->content, "Thinking: I should list the files first");
    EXPECT_EQ(events[0].raw, "Thinking: I should list the files first\n");
    EXPECT_EQ(events[0].correlation_id, "cid-1");
}

TEST_F(OutputClassifierTest, DangerousToolCallKeepsLiteralAction) {
    auto c = make();
    auto events = c.feed("Tool: rm -rf ./drafts\n");
    ASSERT_EQ(events.size(), 1u);
    auto* tc = events[0].as<ToolCallEvent>();
    ASSERT_NE(tc, nullptr);
    EXPECT_EQ(tc->action, "rm -rf ./drafts");
    EXPECT_TRUE(tc->dangerous);
    EXPECT_FALSE(tc->decision.has_value());
}

TEST_F(OutputClassifierTest, HarmlessToolCall) {
    auto c = make();
    auto events = c.feed("Action: ls -la src\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].as<ToolCallEvent>()->action, "ls -la src");
    EXPECT_FALSE(events[0].is_dangerous_tool_call());
}

TEST_F(OutputClassifierTest, DenyListIsCaseInsensitive) {
    EXPECT_TRUE(OutputClassifier::is_dangerous("DROP TABLE users", cfg.deny_list));
    EXPECT_TRUE(OutputClassifier::is_dangerous("Sudo apt install x", cfg.deny_list));
    EXPECT_TRUE(OutputClassifier::is_dangerous("echo hi > /dev/null", cfg.deny_list));
    EXPECT_FALSE(OutputClassifier::is_dangerous("cat README.md", cfg.deny_list));
}

TEST_F(OutputClassifierTest, ReasoningWinsOverActionMarker) {
    auto c = make();
    auto events = c.feed("Thinking: next Tool: rm -rf /\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind(), EventKind::reasoning);
}

TEST_F(OutputClassifierTest, PromptWithoutNewlineWaitsForQuietStream) {
    auto c = make();
    EXPECT_TRUE(c.feed("Proceed? [Y/n] ").empty());
    EXPECT_TRUE(c.prompt_pending());
    auto events = c.flush_prompt();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind(), EventKind::confirmation_request);
    EXPECT_FALSE(c.prompt_pending());
    EXPECT_TRUE(c.finish().empty());
}

TEST_F(OutputClassifierTest, ActionLineSplitAcrossChunksStaysOneToolCall) {
    auto c = make();
    EXPECT_TRUE(c.feed("Confirm: next step. Too").empty());
    auto events = c.feed("l: rm -rf ./drafts\n");
    ASSERT_EQ(events.size(), 1u);
    auto* tc = events[0].as<ToolCallEvent>();
    ASSERT_NE(tc, nullptr);
    EXPECT_EQ(tc->action, "rm -rf ./drafts");
    EXPECT_TRUE(tc->dangerous);
}

TEST_F(OutputClassifierTest, PartialActionLineIsNotFlushedAsPrompt) {
    auto c = make();
    c.feed("Confirm: Tool: rm -rf ./dra");
    EXPECT_FALSE(c.prompt_pending());
    EXPECT_TRUE(c.flush_prompt().empty());
    auto events = c.feed("fts\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].is_dangerous_tool_call());
    EXPECT_EQ(events[0].as<ToolCallEvent>()->action, "rm -rf ./drafts");
}

TEST_F(OutputClassifierTest, PartialLineWaitsForNewline) {
    auto c = make();
    EXPECT_TRUE(c.feed("hel").empty());
    auto events = c.feed("lo world\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].as<TextEvent>()->content, "hello world");
    EXPECT_EQ(events[0].raw, "hello world\n");
}

TEST_F(OutputClassifierTest, CompleteObjectInOneChunk) {
    auto c = make();
    auto events = c.feed(R"({"summary": "done"})");
    ASSERT_EQ(events.size(), 1u);
    auto* s = events[0].as<StructuredEvent>();
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->value["summary"], "done");
}

TEST_F(OutputClassifierTest, ObjectSplitAcrossChunks) {
    auto c = make();
    EXPECT_TRUE(c.feed(R"({"a": {"b")").empty());
    auto events = c.feed(": 1}}\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].as<StructuredEvent>()->value["a"]["b"], 1);
}

TEST_F(OutputClassifierTest, MultiLineObject) {
    auto c = make();
    std::vector<OutputEvent> events;
    for (const char* part : {"{\n", "  \"files\": [\"a.md\",\n", "            \"b.md\"]\n", "}\n"}) {
        auto got = c.feed(part);
        events.insert(events.end(), got.begin(), got.end());
    }
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].as<StructuredEvent>()->value["files"].size(), 2u);
}

TEST_F(OutputClassifierTest, BraceInsideStringDoesNotCloseObject) {
    auto c = make();
    auto events = c.feed("{\"text\": \"a } b \\\" }\"}\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].as<StructuredEvent>()->value["text"], "a } b \" }");
}

TEST_F(OutputClassifierTest, MarkerInsideObjectTakesPriority) {
    auto c = make();
    auto events = c.feed("{\"note\": \"Thinking: about it\"}\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind(), EventKind::reasoning);
}

TEST_F(OutputClassifierTest, TextAfterObjectMakesLineText) {
    auto c = make();
    auto events = c.feed("{\"a\": 1} and more\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind(), EventKind::text);
    EXPECT_EQ(events[0].as<TextEvent>()->content, "{\"a\": 1} and more");
}

TEST_F(OutputClassifierTest, BraceLineThatIsNotJsonBecomesText) {
    auto c = make();
    auto events = c.feed("{not json at all\nnext line\n");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].as<TextEvent>()->content, "{not json at all");
    EXPECT_EQ(events[1].as<TextEvent>()->content, "next line");
}

TEST_F(OutputClassifierTest, UnterminatedObjectDegradesAtFinish) {
    auto c = make();
    EXPECT_TRUE(c.feed("{\"a\": 1,\n").empty());
    auto events = c.finish();
    ASSERT_EQ(events.size(), 1u);
    auto* t = events[0].as<TextEvent>();
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->warning, "unterminated structured output");
    EXPECT_TRUE(c.saw_malformed_output());

    bool logged = false;
    for (auto& r : sink->records()) {
        if (r.message.find("MalformedOutput") != std::string::npos) logged = true;
    }
    EXPECT_TRUE(logged);
}

TEST_F(OutputClassifierTest, OversizedObjectDegradesToText) {
    cfg.max_json_bytes = 16;
    auto c = make();
    auto events = c.feed(R"({"a": "0123456789012345678901"})");
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events[0].kind(), EventKind::text);
    EXPECT_NE(events[0].as<TextEvent>()->warning.find("size limit"), std::string::npos);
}

TEST_F(OutputClassifierTest, MixedStreamKeepsOrderAndBytes) {
    auto c = make();
    std::string input =
        "Thinking: plan the change\n"
        "Tool: cat notes.md\n"
        "{\"status\": \"ok\"}\n"
        "All done.\n";
    auto events = c.feed(input);
    auto tail = c.finish();
    events.insert(events.end(), tail.begin(), tail.end());

    ASSERT_EQ(events.size(), 4u);
    std::string raw;
    for (size_t i = 0; i < events.size(); i++) {
        EXPECT_EQ(events[i].sequence, i + 1);
        raw += events[i].raw;
    }
    EXPECT_EQ(raw, input);
}

TEST_F(OutputClassifierTest, ByteAtATimeGivesSameEvents) {
    auto c = make();
    std::string input =
        "Thinking: plan the change\n"
        "Tool: cat notes.md\n"
        "{\"status\": \"ok\"}\n"
        "All done.\n";
    std::vector<OutputEvent> events;
    // The worst chunking a pipe can produce
    for (char ch : input) {
        auto got = c.feed(std::string(1, ch));
        events.insert(events.end(), got.begin(), got.end());
    }
    auto tail = c.finish();
    events.insert(events.end(), tail.begin(), tail.end());

    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].kind(), EventKind::reasoning);
    EXPECT_EQ(events[1].kind(), EventKind::tool_call);
    EXPECT_EQ(events[2].kind(), EventKind::structured);
    EXPECT_EQ(events[2].as<StructuredEvent>()->value["status"], "ok");
    EXPECT_EQ(events[3].kind(), EventKind::text);
    EXPECT_LT(events[0].sequence, events[3].sequence);
}

TEST_F(OutputClassifierTest, SequenceContinuesAfterReset) {
    auto c = make();
    c.feed("first\n");
    c.feed("partial");
    c.reset();
    auto events = c.feed("second\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].sequence, 2u);
    EXPECT_EQ(events[0].as<TextEvent>()->content, "second");
}

TEST_F(OutputClassifierTest, TrailingLineFlushedAtFinish) {
    auto c = make();
    EXPECT_TRUE(c.feed("no newline here").empty());
    auto events = c.finish();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].as<TextEvent>()->content, "no newline here");
}

} // namespace
