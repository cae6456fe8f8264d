#include "identity_resolver.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace agsq {

namespace {

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

} // namespace

AliasTable AliasTable::from_entries(const std::vector<AliasEntry> &entries) {
  AliasTable table;
  auto add = [&table](const std::string &identifier,
                      const std::string &canonical) {
    if (identifier.empty()) {
      throw ConfigError("Alias for '" + canonical +
                        "' contains an empty identifier");
    }
    auto key = to_lower_copy(identifier);
    auto [it, inserted] = table.table_.emplace(key, canonical);
    if (!inserted && it->second != canonical) {
      throw ConfigError("Identifier '" + identifier +
                        "' is mapped to both '" + it->second + "' and '" +
                        canonical + "'");
    }
  };
  for (const auto &entry : entries) {
    if (entry.canonical.empty()) {
      throw ConfigError("Alias entry is missing its canonical identity");
    }
    add(entry.canonical, entry.canonical);
    for (const auto &identifier : entry.identifiers) {
      add(identifier, entry.canonical);
    }
  }
  return table;
}

const std::string *AliasTable::find(const std::string &identifier) const {
  auto it = table_.find(to_lower_copy(identifier));
  return it == table_.end() ? nullptr : &it->second;
}

std::string IdentityResolver::resolve(const std::string &identifier) const {
  if (const auto *canonical = aliases_.find(identifier)) {
    return *canonical;
  }
  return identifier;
}

std::string IdentityResolver::resolve_author(const std::string &name,
                                             const std::string &email) const {
  const std::string full = format_author(name, email);
  for (const auto *candidate : {&full, &email, &name}) {
    if (candidate->empty()) {
      continue;
    }
    if (const auto *canonical = aliases_.find(*candidate)) {
      return *canonical;
    }
  }
  return full;
}

std::string format_author(const std::string &name, const std::string &email) {
  return name + " <" + email + ">";
}

} // namespace agsq
