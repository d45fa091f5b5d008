// =================================================================
// src/Maestro/ContextManager.cpp
// =================================================================
// Implementation of the conversation context manager.

#include "Maestro/ContextManager.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace Maestro {

TurnLock::TurnLock(std::shared_ptr<std::mutex> mutex)
    : m_mutex(std::move(mutex)), m_lock(*m_mutex) {
}

TurnLock& TurnLock::operator=(TurnLock&& other) {
    if (this != &other) {
        // Release the held mutex before dropping our reference to it
        m_lock = std::move(other.m_lock);
        m_mutex = std::move(other.m_mutex);
    }
    return *this;
}

void TurnLock::unlock() {
    if (m_lock.owns_lock()) {
        m_lock.unlock();
    }
}

ContextManager::ContextManager(const ContextConfig& config)
    : m_config(config) {
    if (m_config.max_history == 0) {
        m_config.max_history = 1;
    }
}

void ContextManager::append(const std::string& conversation_id, const std::string& query,
                            const std::string& response) {
    if (conversation_id.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto& conversation = m_conversations[conversation_id];
    if (isExpired(conversation)) {
        conversation.turns.clear();
        conversation.preferences.clear();
    }

    conversation.turns.push_back({query, response, std::chrono::system_clock::now()});
    while (conversation.turns.size() > m_config.max_history) {
        conversation.turns.pop_front();
    }
    conversation.last_update = std::chrono::steady_clock::now();
}

std::vector<ConversationTurn> ContextManager::window(const std::string& conversation_id) const {
    if (conversation_id.empty()) {
        return {};
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_conversations.find(conversation_id);
    if (it == m_conversations.end() || isExpired(it->second)) {
        return {};
    }
    return std::vector<ConversationTurn>(it->second.turns.begin(), it->second.turns.end());
}

void ContextManager::clear(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_conversations.erase(conversation_id);
}

void ContextManager::updatePreferences(const std::string& conversation_id,
                                       const std::map<std::string, std::string>& preferences) {
    if (conversation_id.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto& conversation = m_conversations[conversation_id];
    for (const auto& [key, value] : preferences) {
        conversation.preferences[key] = value;
    }
    conversation.last_update = std::chrono::steady_clock::now();
}

std::map<std::string, std::string> ContextManager::getPreferences(const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_conversations.find(conversation_id);
    if (it == m_conversations.end() || isExpired(it->second)) {
        return {};
    }
    return it->second.preferences;
}

TurnLock ContextManager::beginTurn(const std::string& conversation_id) {
    if (conversation_id.empty()) {
        return TurnLock();
    }

    std::shared_ptr<std::mutex> turn_mutex;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& slot = m_turn_locks[conversation_id];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        turn_mutex = slot;
    }

    return TurnLock(std::move(turn_mutex));
}

Prompt ContextManager::buildPrompt(const std::string& conversation_id, const std::string& query_text) const {
    Prompt prompt;

    std::string system = m_config.system_prompt;
    auto preferences = getPreferences(conversation_id);
    if (!preferences.empty()) {
        std::ostringstream prefs;
        if (!system.empty()) {
            prefs << system << "\n\n";
        }
        prefs << "User preferences:";
        for (const auto& [key, value] : preferences) {
            prefs << "\n- " << key << ": " << value;
        }
        system = prefs.str();
    }
    if (!system.empty()) {
        prompt.messages.push_back({"system", system});
    }

    auto turns = window(conversation_id);
    size_t keep = std::min(turns.size(), m_config.prompt_history_turns);
    for (size_t i = turns.size() - keep; i < turns.size(); ++i) {
        prompt.messages.push_back({"user", turns[i].query});
        prompt.messages.push_back({"assistant", turns[i].response});
    }

    prompt.messages.push_back({"user", query_text});
    return prompt;
}

size_t ContextManager::cleanupExpired() {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t removed = 0;
    for (auto it = m_conversations.begin(); it != m_conversations.end();) {
        if (isExpired(it->second)) {
            it = m_conversations.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    // Only the map holds a reference when no turn is running or waiting;
    // beginTurn copies the pointer under m_mutex, so this check cannot race.
    for (auto it = m_turn_locks.begin(); it != m_turn_locks.end();) {
        if (it->second.use_count() == 1) {
            it = m_turn_locks.erase(it);
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        Logger::getInstance().debug("ContextManager", "Removed expired conversations",
                                    std::to_string(removed));
    }
    return removed;
}

size_t ContextManager::conversationCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_conversations.size();
}

size_t ContextManager::turnLockCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_turn_locks.size();
}

bool ContextManager::isExpired(const Conversation& conversation) const {
    if (conversation.turns.empty() && conversation.preferences.empty()) {
        return false;
    }
    return std::chrono::steady_clock::now() - conversation.last_update > m_config.ttl;
}

} // namespace Maestro
