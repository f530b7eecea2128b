#pragma once

#include "courtline/roster.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace courtline {

// Lowercase, trimmed, with Latin diacritics folded to ASCII ("Dončić" -> "doncic").
// Bytes that are not valid UTF-8 are dropped.
std::string normalize_name(std::string_view name);

// Normalized name forms of one roster player, computed once per resolver.
struct NameCandidate {
  const Player* player = nullptr;
  std::string full;           // "first family"
  std::string initial_family; // "f. family"
  std::string display;
  std::string family;
};

class NameMatcher {
 public:
  virtual ~NameMatcher() = default;
  virtual const char* name() const = 0;
  // `query` is already normalized; `team` lists the acting team in roster order.
  virtual std::optional<PlayerId> match(const std::string& query,
                                        const std::vector<NameCandidate>& team) const = 0;
};

// Play-by-play text truncates common first names ("Jay. Williams"); each entry
// lists the full names it may stand for, in preference order.
class AbbreviationTableMatcher : public NameMatcher {
 public:
  AbbreviationTableMatcher();
  const char* name() const override { return "abbreviation_table"; }
  std::optional<PlayerId> match(const std::string& query, const std::vector<NameCandidate>& team) const override;

 private:
  std::map<std::string, std::vector<std::string>> table_;
};

class ExactNameMatcher : public NameMatcher {
 public:
  const char* name() const override { return "exact"; }
  std::optional<PlayerId> match(const std::string& query, const std::vector<NameCandidate>& team) const override;
};

class FamilyNameMatcher : public NameMatcher {
 public:
  const char* name() const override { return "family_name"; }
  std::optional<PlayerId> match(const std::string& query, const std::vector<NameCandidate>& team) const override;
};

class PartialNameMatcher : public NameMatcher {
 public:
  const char* name() const override { return "partial"; }
  std::optional<PlayerId> match(const std::string& query, const std::vector<NameCandidate>& team) const override;
};

// Highest precision first.
std::vector<std::unique_ptr<NameMatcher>> default_name_matchers();

class PlayerNameResolver {
 public:
  explicit PlayerNameResolver(const Roster& roster);
  PlayerNameResolver(const Roster& roster, std::vector<std::unique_ptr<NameMatcher>> matchers);

  std::optional<PlayerId> resolve(std::string_view name, TeamId team, bool suppress_warnings) const;

  const std::vector<NameCandidate>& team_candidates(TeamId team) const;
  const std::vector<std::unique_ptr<NameMatcher>>& matchers() const { return matchers_; }

 private:
  std::map<TeamId, std::vector<NameCandidate>> candidates_;
  std::vector<std::unique_ptr<NameMatcher>> matchers_;
};

} // namespace courtline
