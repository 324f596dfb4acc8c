#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "session/session_store.hpp"

namespace conductor {

inline constexpr size_t kDefaultHistoryTokens = 20000;

// Renders stored updates as a USER/ASSISTANT transcript to prepend to the
// first prompt after an agent restart. Oldest messages are dropped until the
// estimate (~4 chars per token) fits max_tokens. Returns nullopt when there
// is nothing to replay.
std::optional<std::string> format_history_for_replay(const std::vector<StoredUpdate>& updates,
                                                     size_t max_tokens = kDefaultHistoryTokens);

// At least one user message and one assistant text chunk
bool has_replayable_history(const std::vector<StoredUpdate>& updates);

}  // namespace conductor
