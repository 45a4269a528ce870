#pragma once
/*
 * CommandRegistry
 *
 * Purpose: named editor actions shared by the key map, ~/.meditrc lines and "help".
 * Note: "set <option>" entries are registered under their full two-word name.
 */
#include <functional>
#include <map>
#include <string>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;

  void register_command(const std::string& name, std::string usage, Handler h) {
    entries_[name] = Entry{std::move(usage), std::move(h)};
  }
  bool contains(const std::string& name) const { return entries_.count(name) != 0; }
  /*false when no such command; the handler reports its own errors*/
  bool execute(const std::string& name, const std::vector<std::string>& args = {}) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return false;
    it->second.fn(args);
    return true;
  }
  std::string usage(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? std::string() : it->second.usage;
  }
  // sorted, since entries_ is ordered
  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
  }

private:
  struct Entry {
    std::string usage;
    Handler fn;
  };
  std::map<std::string, Entry> entries_;
};
