// =================================================================
// include/Maestro/ContextManager.hpp
// =================================================================
// Bounded per-conversation history used to enrich prompts.

#pragma once

#include "Maestro/Config.hpp"
#include "Maestro/ModelClient.hpp"
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Maestro {

/**
 * @brief One completed exchange
 */
struct ConversationTurn {
    std::string query;                                  ///< User query text
    std::string response;                               ///< Synthesized answer
    std::chrono::system_clock::time_point timestamp;    ///< When the turn completed
};

/**
 * @brief Exclusive hold on one conversation's turn
 *
 * Shares ownership of the per-conversation mutex, so the manager may
 * prune idle entries while a turn is still in progress. Empty for
 * stateless queries.
 */
class TurnLock {
public:
    TurnLock() = default;
    explicit TurnLock(std::shared_ptr<std::mutex> mutex);

    TurnLock(TurnLock&&) = default;
    TurnLock& operator=(TurnLock&& other);

    bool ownsLock() const { return m_lock.owns_lock(); }
    void unlock();

private:
    std::shared_ptr<std::mutex> m_mutex;    // declared first: outlives m_lock
    std::unique_lock<std::mutex> m_lock;
};

/**
 * @brief Rolling window of turns per conversation
 *
 * Windows never exceed the configured length; the oldest turn is dropped
 * first. An empty conversation id means stateless mode: reads return an
 * empty window and writes are ignored. Windows idle for longer than the
 * configured TTL read as empty and are discarded.
 */
class ContextManager {
public:
    explicit ContextManager(const ContextConfig& config = ContextConfig());

    /**
     * @brief Append a completed turn
     * @param conversation_id Conversation identifier
     * @param query Query text
     * @param response Final response content
     */
    void append(const std::string& conversation_id, const std::string& query, const std::string& response);

    /**
     * @brief Turns of a conversation, oldest first
     */
    std::vector<ConversationTurn> window(const std::string& conversation_id) const;

    void clear(const std::string& conversation_id);

    /**
     * @brief Store caller preferences for a conversation
     *
     * Preferences are merged into existing ones and surfaced to models
     * through the system message.
     */
    void updatePreferences(const std::string& conversation_id, const std::map<std::string, std::string>& preferences);

    std::map<std::string, std::string> getPreferences(const std::string& conversation_id) const;

    /**
     * @brief Serialize turns of one conversation
     *
     * The returned lock must be held from classification until the turn
     * is appended. Returns an empty lock for stateless queries.
     */
    TurnLock beginTurn(const std::string& conversation_id);

    /**
     * @brief Build the prompt for a query
     *
     * Includes the optional system prompt, preferences, the most recent
     * turns (prompt_history_turns) and finally the query itself.
     */
    Prompt buildPrompt(const std::string& conversation_id, const std::string& query_text) const;

    /**
     * @brief Drop expired conversations and idle turn locks
     * @return Number of conversations removed
     */
    size_t cleanupExpired();

    size_t conversationCount() const;
    size_t turnLockCount() const;
    size_t getMaxHistory() const { return m_config.max_history; }

private:
    struct Conversation {
        std::deque<ConversationTurn> turns;
        std::map<std::string, std::string> preferences;
        std::chrono::steady_clock::time_point last_update;
    };

    ContextConfig m_config;
    std::unordered_map<std::string, Conversation> m_conversations;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> m_turn_locks;
    mutable std::mutex m_mutex;

    bool isExpired(const Conversation& conversation) const;
};

} // namespace Maestro
