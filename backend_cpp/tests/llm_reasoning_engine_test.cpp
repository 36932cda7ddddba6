#include <gtest/gtest.h>
#include "LogManager.hpp"
#include "agent/AgentExecutor.hpp"
#include "agent/LlmReasoningEngine.hpp"
#include "test_helpers.hpp"

using namespace code_query;
using namespace code_query::testing_support;

class LlmReasoningEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<ScriptedChatClient> chat = std::make_shared<ScriptedChatClient>();
    AppConfig config;

    void SetUp() override {
        config.chat_model = "big-model";
        config.helper_model = "small-model";
        LogManager::instance().clear();
    }

    LlmReasoningEngine engine() { return LlmReasoningEngine(chat, config); }

    static std::vector<HistoryEntry> one_turn() {
        return {{"what is main?", "main starts the app", 0}};
    }
};

TEST_F(LlmReasoningEngineTest, HelperCallsUseHelperModel) {
    chat->responses = {
        R"({"action": "SEARCH_CODE", "reason": "codebase question"})",
        R"({"files": ["src/a.py"], "sufficient": false})",
        R"({"confidence": "MEDIUM", "suggestion": "timers"})",
    };
    auto e = engine();

    Classification c = e.classify({"where is the timer?", {}, {}});
    FileSelection s = e.select_files({"where is the timer?", {{"src/a.py", 10, ".py", ""}}, 1, {}, {}, std::nullopt});
    ConfidenceAssessment a = e.assess_confidence({"where is the timer?", {{"src/a.py", "x = 1"}}, {}});

    EXPECT_EQ(c.action, QueryAction::SearchCode);
    EXPECT_EQ(s.paths, (std::vector<std::string>{"src/a.py"}));
    EXPECT_EQ(a.level, ConfidenceLevel::Medium);
    EXPECT_EQ(a.suggested_term.value_or(""), "timers");
    EXPECT_EQ(chat->models, (std::vector<std::string>{"small-model", "small-model", "small-model"}));
}

TEST_F(LlmReasoningEngineTest, AnswerUsesChatModelAndReplaysHistory) {
    chat->responses = {"It is in main.py"};
    auto e = engine();

    std::string answer = e.generate_answer({"and where is it called?", "File: main.py\n```\nx\n```", one_turn(),
                                            AnswerMode::Evidence});

    EXPECT_EQ(answer, "It is in main.py");
    ASSERT_EQ(chat->models.size(), 1u);
    EXPECT_EQ(chat->models[0], "big-model");

    const auto& messages = chat->requests[0];
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].role, "user");
    EXPECT_EQ(messages[0].content, "what is main?");
    EXPECT_EQ(messages[1].role, "assistant");
    EXPECT_EQ(messages[1].content, "main starts the app");
    EXPECT_EQ(messages[2].role, "user");
    EXPECT_NE(messages[2].content.find("and where is it called?"), std::string::npos);
    EXPECT_NE(messages[2].content.find("File: main.py"), std::string::npos);
}

TEST_F(LlmReasoningEngineTest, ClassificationDoesNotReplayHistory) {
    chat->responses = {R"({"action": "DIRECT"})"};
    auto e = engine();

    e.classify({"hello", {}, one_turn()});

    ASSERT_EQ(chat->requests.size(), 1u);
    EXPECT_EQ(chat->requests[0].size(), 1u);
}

TEST_F(LlmReasoningEngineTest, TransportFailureIsReportedAndLogged) {
    chat->fail = true;
    auto e = engine();

    EXPECT_THROW(e.classify({"q", {}, {}}), ReasoningUnavailable);

    auto logs = LogManager::instance().recent(1);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].call, "classify");
    EXPECT_FALSE(logs[0].ok);
}

TEST_F(LlmReasoningEngineTest, EmptyAnswerIsAFailure) {
    chat->responses = {""};
    auto e = engine();

    EXPECT_THROW(e.generate_answer({"q", "", {}, AnswerMode::Direct}), ReasoningUnavailable);
}

TEST_F(LlmReasoningEngineTest, SuccessfulCallsAreTraced) {
    chat->responses = {R"({"action": "USE_MEMORY"})"};
    auto e = engine();

    e.classify({"q", {"a.py"}, {}});

    auto logs = LogManager::instance().recent(10);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_TRUE(logs[0].ok);
    EXPECT_EQ(logs[0].model, "small-model");
    EXPECT_EQ(LogManager::instance().get_logs_json().size(), 1u);
}

TEST_F(LlmReasoningEngineTest, SelectionPromptShowsOverflowAndSuggestion) {
    auto e = engine();
    SelectionRequest req{"how are jobs scheduled?",
                         {{"a.py", 12, ".py", "def schedule(job):\n    queue.put(job)\n"}, {"b.py", 3, ".py", ""}},
                         5,
                         {"a.py"},
                         {"c.py"},
                         std::string("scheduler")};

    std::string prompt = e.build_selection_prompt(req);

    EXPECT_NE(prompt.find("1. a.py (12 lines, .py)"), std::string::npos);
    EXPECT_NE(prompt.find("   def schedule(job): queue.put(job)\n2. b.py"), std::string::npos);
    EXPECT_NE(prompt.find("... and 3 more files"), std::string::npos);
    EXPECT_NE(prompt.find("scheduler"), std::string::npos);
    EXPECT_NE(prompt.find("- c.py"), std::string::npos);
    EXPECT_NE(prompt.find("how are jobs scheduled?"), std::string::npos);
}

TEST_F(LlmReasoningEngineTest, ClassifyPromptListsCachedFiles) {
    auto e = engine();

    std::string prompt = e.build_classify_prompt({"q", {"src/loop.cpp"}, {}});

    EXPECT_NE(prompt.find("- src/loop.cpp"), std::string::npos);
    EXPECT_NE(prompt.find("SEARCH_CODE"), std::string::npos);
}

TEST_F(LlmReasoningEngineTest, AnswerPromptWithoutEvidenceSaysSo) {
    auto e = engine();

    std::string prompt = e.build_answer_prompt({"q", "", {}, AnswerMode::Evidence});

    EXPECT_NE(prompt.find("(no files could be analyzed)"), std::string::npos);
}

TEST_F(LlmReasoningEngineTest, LongPreviewIsCutToOneLine) {
    std::string preview = ContextManager::one_line_preview(std::string(300, 'x') + "\n\nmore");

    EXPECT_EQ(preview, std::string(ContextManager::kPreviewLineChars, 'x') + "...");
    EXPECT_EQ(ContextManager::one_line_preview("  \n\t "), "");
}

TEST_F(LlmReasoningEngineTest, FreeTextSelectionMatchesPathsBeyondOverview) {
    chat->responses = {"I would open deep/z_last.py first."};
    auto e = engine();
    SelectionRequest req{"q", {{"a.py", 1, ".py", ""}}, 2, {}, {}, std::nullopt, {"a.py", "deep/z_last.py"}};

    FileSelection s = e.select_files(req);

    EXPECT_EQ(s.paths, (std::vector<std::string>{"deep/z_last.py"}));
}

TEST_F(LlmReasoningEngineTest, NullReasonFieldsDoNotAbortTheQuery) {
    chat->responses = {
        R"({"action": "SEARCH_CODE", "reason": null})",
        R"({"files": ["a.py"], "reasoning": null})",
        R"({"confidence": "HIGH", "reason": ["x"]})",
        "a.py prints hello",
    };
    auto reader = std::make_shared<FakeFileReader>();
    reader->files["a.py"] = "print('hello')";
    FileMemoryCache cache(reader);
    ConversationHistory history;
    AgentExecutor executor(std::make_shared<LlmReasoningEngine>(chat, config));

    SearchOutcome outcome = executor.run("what does a.py print?", make_index({"a.py"}), cache, history);

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.answer, "a.py prints hello");
    EXPECT_EQ(outcome.analyzed_files, (std::vector<std::string>{"a.py"}));
}
