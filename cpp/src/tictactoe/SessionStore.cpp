#include "tictactoe/SessionStore.hpp"

namespace tictactoe {

std::optional<std::string> InMemorySessionStore::get(const std::string& session_id) const {
  auto it = map_.find(session_id);
  if (it == map_.end()) return std::nullopt;
  return it->second;
}

void InMemorySessionStore::put(const std::string& session_id, const std::string& value) {
  map_[session_id] = value;
}

void InMemorySessionStore::erase(const std::string& session_id) { map_.erase(session_id); }

}  // namespace tictactoe
