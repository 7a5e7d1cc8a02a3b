#pragma once
/*
 * CommandRegistry
 *
 * Purpose: ex command table (":w", ":b 2", ":set tabsize=8", ...).
 * Each command has one canonical name, any number of aliases and a usage
 * line; the help page lists the usage lines in registration order.
 * The rc file is executed through the same table.
 */
#include <functional>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;

  // names.begin() is the canonical name, the rest resolve to it.
  void add(std::initializer_list<std::string> names, std::string usage, Handler h) {
    if (names.size() == 0) return;
    const std::string& canonical = *names.begin();
    if (!commands_.count(canonical)) order_.push_back(canonical);
    commands_[canonical] = Entry{std::move(usage), std::move(h)};
    for (const auto& n : names) aliases_[n] = canonical;
  }

  bool contains(const std::string& name) const { return aliases_.count(name) != 0; }

  // false when name is neither a command nor an alias.
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto a = aliases_.find(name);
    if (a == aliases_.end()) return false;
    commands_.at(a->second).handler(args);
    return true;
  }

  std::vector<std::string> usage_lines() const {
    std::vector<std::string> out;
    for (const auto& name : order_) {
      const std::string& u = commands_.at(name).usage;
      if (!u.empty()) out.push_back(u);
    }
    return out;
  }

private:
  struct Entry {
    std::string usage;
    Handler handler;
  };

  std::unordered_map<std::string, Entry> commands_;
  std::unordered_map<std::string, std::string> aliases_;
  std::vector<std::string> order_;
};
