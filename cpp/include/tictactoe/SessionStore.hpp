#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace tictactoe {

/*
 * Key-value storage for serialized games, keyed by session id. GameService reads a session's game
 * at the start of each request and writes it back at the end; it keeps nothing in between.
 *
 * Implementations are not required to be thread-safe.
 */
class SessionStore {
 public:
  virtual ~SessionStore() = default;

  virtual std::optional<std::string> get(const std::string& session_id) const = 0;
  virtual void put(const std::string& session_id, const std::string& value) = 0;

  // No-op if session_id is not present.
  virtual void erase(const std::string& session_id) = 0;
};

class InMemorySessionStore : public SessionStore {
 public:
  std::optional<std::string> get(const std::string& session_id) const override;
  void put(const std::string& session_id, const std::string& value) override;
  void erase(const std::string& session_id) override;

  size_t size() const { return map_.size(); }

 private:
  std::unordered_map<std::string, std::string> map_;
};

}  // namespace tictactoe
