#include "agent/LlmReasoningEngine.hpp"
#include "agent/ContextManager.hpp"
#include "agent/ResponseParser.hpp"
#include "LogManager.hpp"
#include "errors.hpp"
#include "text_util.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace code_query {

LlmReasoningEngine::LlmReasoningEngine(std::shared_ptr<IChatClient> chat, AppConfig config)
    : chat_(std::move(chat)), config_(std::move(config)) {}

std::string LlmReasoningEngine::call(const std::string& kind,
                                     const std::string& prompt,
                                     const std::string& model,
                                     int ctx_window,
                                     const std::vector<HistoryEntry>& history) {
    std::vector<ChatMessage> messages;
    for (const auto& h : history) {
        messages.push_back({"user", h.query});
        messages.push_back({"assistant", h.answer});
    }
    messages.push_back({"user", prompt});

    auto start = std::chrono::high_resolution_clock::now();
    std::string response;
    std::string error;
    bool ok = true;
    try {
        response = chat_->chat(messages, model, ctx_window);
    } catch (const ReasoningUnavailable& e) {
        ok = false;
        error = e.what();
        response = "ERROR: " + error;
    }
    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::milli>(end - start).count();

    LogManager::instance().add_log({
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count(),
        kind,
        model,
        utf8_safe_substr(prompt, 300),
        utf8_safe_substr(response, 1000),
        static_cast<int>((prompt.size() + response.size()) / 4),
        duration,
        ok
    });

    spdlog::debug("🛰️  {} ({}) answered in {:.0f} ms", kind, model, duration);
    if (!ok) throw ReasoningUnavailable(kind + " failed: " + error);
    return response;
}

// --- PROMPTS ---

std::string LlmReasoningEngine::build_classify_prompt(const ClassifyRequest& req) const {
    std::string memory_info;
    if (!req.cached_paths.empty()) {
        memory_info = "\n\nCurrently loaded files in memory:\n" + ContextManager::render_path_list(req.cached_paths);
    }

    return
        "### ROLE\n"
        "You are a query classifier for a code analysis assistant. Decide whether the user's query "
        "needs the codebase, can be answered from files already in memory, or needs only general "
        "programming knowledge.\n\n"
        "### QUERY\n" + req.query + memory_info + "\n\n"
        "### RULES\n"
        "- SEARCH_CODE: implementation details, features, locations, structure or debugging of THIS codebase. "
        "The assistant cannot see the codebase unless it searches, so anything about it is SEARCH_CODE.\n"
        "- USE_MEMORY: follow-up questions about the files currently loaded in memory.\n"
        "- DIRECT: general or conceptual programming questions, tutorials, greetings, small talk.\n\n"
        "### OUTPUT (JSON only)\n"
        "{\"action\": \"SEARCH_CODE|USE_MEMORY|DIRECT\", \"reason\": \"brief explanation\"}";
}

std::string LlmReasoningEngine::build_selection_prompt(const SelectionRequest& req) const {
    std::string already_loaded;
    if (!req.already_analyzed.empty()) {
        already_loaded = "\nFiles already analyzed in this search:\n" + ContextManager::render_path_list(req.already_analyzed);
    }
    std::string memory_context;
    if (!req.cached_elsewhere.empty()) {
        memory_context = "\nFiles in cache (available instantly):\n" + ContextManager::render_path_list(req.cached_elsewhere);
    }
    std::string hint;
    if (req.suggested_term) {
        hint = "\nSuggested focus from the previous round: " + *req.suggested_term + "\n";
    }

    return
        "### ROLE\n"
        "You are a code analysis assistant helping to find relevant files.\n\n"
        "### AVAILABLE FILES\n" +
        ContextManager::render_index_overview(req.index_view, req.total_files) +
        already_loaded + memory_context + hint + "\n"
        "### USER QUESTION\n" + req.query + "\n\n"
        "### TASK\n"
        "Select up to 3 NEW files that would help answer this question.\n"
        "- Focus on files NOT already analyzed\n"
        "- Prefer files from cache if they're relevant\n"
        "- Use exact paths from the list above\n"
        "- If the analyzed files are already enough, return an empty list\n\n"
        "### OUTPUT (JSON only)\n"
        "{\"files\": [\"path1\", \"path2\"], \"reasoning\": \"why these files\", \"sufficient\": true/false}";
}

std::string LlmReasoningEngine::build_assessment_prompt(const AssessmentRequest& req) const {
    return
        "### ROLE\n"
        "You are assessing whether the provided code files are enough to answer a question.\n\n"
        "### QUESTION\n" + req.query + "\n\n"
        "### FILES ANALYZED\n" + ContextManager::build_evidence_bundle(req.files) + "\n\n"
        "### RULES\n"
        "1. Rate confidence: HIGH, MEDIUM, or LOW\n"
        "   - HIGH: the files directly contain what is needed\n"
        "   - MEDIUM: partially covered, more files would help\n"
        "   - LOW: important files are missing\n"
        "2. If confidence is not HIGH, suggest a short search term or file name to look for next.\n\n"
        "### OUTPUT (JSON only)\n"
        "{\"confidence\": \"HIGH|MEDIUM|LOW\", \"reason\": \"brief explanation\", \"suggestion\": \"what to search next or null\"}";
}

std::string LlmReasoningEngine::build_answer_prompt(const AnswerRequest& req) const {
    if (req.mode == AnswerMode::Direct) {
        return
            "You are " + config_.bot_name + ", a programming assistant with access to a specific codebase. "
            "Answer the following programming question using your general knowledge. If the user seems "
            "confused, suggest asking something about the codebase.\n\n"
            "User Question: " + req.query + "\n\n"
            "Instructions:\n"
            "- Provide clear, accurate information about programming concepts\n"
            "- Include code examples if helpful\n"
            "- Be concise but thorough\n"
            "- Consider conversation history for context\n\n"
            "Answer:";
    }

    std::string intro = req.mode == AnswerMode::Memory
        ? "You are a code analysis assistant. Answer based on the previously loaded files."
        : "You are a code analysis assistant. Answer the question based on the provided code files.";
    std::string evidence = req.evidence_bundle.empty() ? "(no files could be analyzed)" : req.evidence_bundle;

    return
        intro + "\n\n"
        "Code Context:\n" + evidence + "\n\n"
        "Instructions:\n"
        "- Provide accurate analysis based on the code\n"
        "- Reference specific files and functions when possible\n"
        "- If information is incomplete, clearly state what's missing\n"
        "- Consider conversation history for follow-up questions\n"
        "- Never ask the user about the codebase. If you really don't know, answer \"I don't know.\"\n\n"
        "User Question: " + req.query + "\n\n"
        "Answer:";
}

// --- CALLS ---

Classification LlmReasoningEngine::classify(const ClassifyRequest& req) {
    std::string raw = call("classify", build_classify_prompt(req),
                           config_.helper_model, config_.helper_ctx_window, {});
    return response_parser::parse_classification(raw);
}

FileSelection LlmReasoningEngine::select_files(const SelectionRequest& req) {
    std::string raw = call("select_files", build_selection_prompt(req),
                           config_.helper_model, config_.helper_ctx_window, {});

    std::vector<std::string> candidates = req.index_paths;
    if (candidates.empty()) {
        for (const auto& entry : req.index_view) candidates.push_back(entry.path);
    }

    auto selection = response_parser::parse_selection(raw, candidates);
    if (!selection.reasoning.empty()) spdlog::info("Selection: {}", selection.reasoning);
    return selection;
}

ConfidenceAssessment LlmReasoningEngine::assess_confidence(const AssessmentRequest& req) {
    std::string raw = call("assess_confidence", build_assessment_prompt(req),
                           config_.helper_model, config_.helper_ctx_window, req.history);
    return response_parser::parse_assessment(raw);
}

std::string LlmReasoningEngine::generate_answer(const AnswerRequest& req) {
    std::string answer = call("generate_answer", build_answer_prompt(req),
                              config_.chat_model, config_.chat_ctx_window, req.history);
    if (answer.empty()) throw ReasoningUnavailable("reasoning engine returned an empty answer");
    return answer;
}

} // namespace code_query
