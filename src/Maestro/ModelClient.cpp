// =================================================================
// src/Maestro/ModelClient.cpp
// =================================================================
// Shared helpers for model client implementations.

#include "Maestro/ModelClient.hpp"
#include <algorithm>

namespace Maestro {

Prompt Prompt::fromText(const std::string& text) {
    Prompt prompt;
    prompt.messages.push_back({"user", text});
    return prompt;
}

std::string Prompt::userText() const {
    for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
        if (it->role == "user") {
            return it->content;
        }
    }
    return "";
}

double estimateConfidence(const std::string& content) {
    double length_factor = std::min(static_cast<double>(content.size()) / 1000.0, 1.0);
    return 0.8 + length_factor * 0.2;
}

} // namespace Maestro
