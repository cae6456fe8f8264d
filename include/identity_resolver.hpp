/**
 * @file identity_resolver.hpp
 * @brief Alias table and canonical author resolution.
 */

#ifndef AUTOGITSQUASH_IDENTITY_RESOLVER_HPP
#define AUTOGITSQUASH_IDENTITY_RESOLVER_HPP

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace agsq {

/// One configured person: canonical identity plus every identifier they use.
struct AliasEntry {
  std::string canonical;                ///< Identity reported after resolving
  std::vector<std::string> identifiers; ///< Names, emails or `Name <email>`
};

/**
 * Case-insensitive mapping from identifier to canonical identity.
 *
 * Built once from configuration and read-only afterwards.
 */
class AliasTable {
public:
  AliasTable() = default;

  /**
   * Build a table from configured entries. The canonical identity of each
   * entry also resolves to itself.
   *
   * @throws ConfigError When an entry has an empty canonical identity or
   *         identifier, or when one identifier maps to two different
   *         canonical identities.
   */
  static AliasTable from_entries(const std::vector<AliasEntry> &entries);

  /// Canonical identity for @p identifier, or nullptr when unknown.
  const std::string *find(const std::string &identifier) const;

  std::size_t size() const { return table_.size(); }
  bool empty() const { return table_.empty(); }

private:
  std::unordered_map<std::string, std::string> table_;
};

/**
 * Maps raw author identities to canonical identities through an AliasTable.
 *
 * The resolver borrows the table; the table must outlive it.
 */
class IdentityResolver {
public:
  explicit IdentityResolver(const AliasTable &aliases) : aliases_(aliases) {}

  /**
   * Resolve one identifier. Unknown identifiers resolve to themselves
   * unchanged.
   */
  std::string resolve(const std::string &identifier) const;

  /**
   * Resolve an author given as name and email. The full `Name <email>` form
   * is tried first, then the email, then the name. On a miss the full form
   * is returned.
   */
  std::string resolve_author(const std::string &name,
                             const std::string &email) const;

private:
  const AliasTable &aliases_;
};

/// Format an author as `Name <email>`.
std::string format_author(const std::string &name, const std::string &email);

} // namespace agsq

#endif // AUTOGITSQUASH_IDENTITY_RESOLVER_HPP
