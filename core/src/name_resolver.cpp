#include "courtline/name_resolver.h"

#include "courtline/log.h"

#include <cctype>
#include <cstdint>

namespace courtline {

namespace {
// U+00C0..U+00FF; '_' keeps the code point.
constexpr char kLatin1Fold[] =
    "aaaaaa_c" "eeeeiiii" "dnooooo_" "ouuuuy__"
    "aaaaaa_c" "eeeeiiii" "dnooooo_" "ouuuuy_y";
static_assert(sizeof(kLatin1Fold) - 1 == 64, "Latin-1 fold table covers U+00C0..U+00FF");

// U+0100..U+017F.
constexpr char kLatinExtendedAFold[] =
    "aaaaaa" "cccccccc" "dddd" "eeeeeeeeee" "gggggggg" "hhhh" "iiiiiiiiii" "__" "jj" "kkk"
    "llllllllll" "nnnnnnn" "nn" "oooooo" "__" "rrrrrr" "ssssssss" "tttttt" "uuuuuuuuuuuu"
    "ww" "yyy" "zzzzzz" "s";
static_assert(sizeof(kLatinExtendedAFold) - 1 == 128, "Latin Extended-A fold table covers U+0100..U+017F");

constexpr uint32_t kReplacementChar = 0xFFFD;

// Decodes one UTF-8 sequence at `pos`. A stray continuation byte, a bad lead
// byte or a truncated sequence consumes one byte and yields U+FFFD.
uint32_t decode_utf8(std::string_view text, size_t& pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  if (lead < 0x80) {
    ++pos;
    return lead;
  }
  size_t extra = 0;
  uint32_t cp = 0;
  if (lead >= 0xF0 && lead < 0xF8) {
    extra = 3;
    cp = lead & 0x07;
  } else if (lead >= 0xE0 && lead < 0xF0) {
    extra = 2;
    cp = lead & 0x0F;
  } else if (lead >= 0xC0 && lead < 0xE0) {
    extra = 1;
    cp = lead & 0x1F;
  }
  if (extra == 0 || pos + extra >= text.size()) {
    ++pos;
    return kReplacementChar;
  }
  for (size_t i = 1; i <= extra; ++i) {
    const auto next = static_cast<unsigned char>(text[pos + i]);
    if ((next & 0xC0) != 0x80) {
      ++pos;
      return kReplacementChar;
    }
    cp = (cp << 6) | (next & 0x3F);
  }
  pos += extra + 1;
  return cp;
}

void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::string last_token(const std::string& text) {
  const size_t space = text.find_last_of(' ');
  return space == std::string::npos ? text : text.substr(space + 1);
}

std::vector<NameCandidate> build_candidates(const std::vector<const Player*>& players) {
  std::vector<NameCandidate> out;
  out.reserve(players.size());
  for (const Player* player : players) {
    NameCandidate c;
    c.player = player;
    const std::string first = normalize_name(player->first_name);
    c.family = normalize_name(player->family_name);
    c.full = normalize_name(player->first_name + " " + player->family_name);
    c.initial_family = first.empty() ? c.family : std::string(1, first.front()) + ". " + c.family;
    c.display = normalize_name(player->display_name);
    out.push_back(std::move(c));
  }
  return out;
}
} // namespace

std::string normalize_name(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  size_t pos = 0;
  while (pos < name.size()) {
    const uint32_t cp = decode_utf8(name, pos);
    if (cp < 0x80) {
      out.push_back(static_cast<char>(std::tolower(static_cast<int>(cp))));
    } else if ((cp >= 0x0300 && cp <= 0x036F) || cp == kReplacementChar) {
      // combining mark or undecodable byte
    } else if (cp >= 0x00C0 && cp <= 0x00FF && kLatin1Fold[cp - 0x00C0] != '_') {
      out.push_back(kLatin1Fold[cp - 0x00C0]);
    } else if (cp >= 0x0100 && cp <= 0x017F && kLatinExtendedAFold[cp - 0x0100] != '_') {
      out.push_back(kLatinExtendedAFold[cp - 0x0100]);
    } else if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) {
      append_utf8(out, cp + 0x20);
    } else {
      append_utf8(out, cp);
    }
  }
  const size_t begin = out.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const size_t end = out.find_last_not_of(" \t\r\n");
  return out.substr(begin, end - begin + 1);
}

AbbreviationTableMatcher::AbbreviationTableMatcher() {
  table_ = {
      {"jay. williams", {"jaylin williams", "jay williams"}},
      {"jal. williams", {"jalen williams"}},
      {"ja. green", {"jamychal green", "javonte green", "jalen green"}},
      {"je. green", {"jeff green"}},
      {"ke. johnson", {"keldon johnson", "keyontae johnson"}},
      {"mar. morris", {"marcus morris"}},
      {"mak. morris", {"markieff morris"}},
  };
}

std::optional<PlayerId> AbbreviationTableMatcher::match(const std::string& query,
                                                        const std::vector<NameCandidate>& team) const {
  auto it = table_.find(query);
  if (it == table_.end()) return std::nullopt;
  for (const auto& full_name : it->second) {
    for (const auto& c : team) {
      if (c.full == full_name) {
        return c.player->id;
      }
    }
  }
  return std::nullopt;
}

std::optional<PlayerId> ExactNameMatcher::match(const std::string& query,
                                                const std::vector<NameCandidate>& team) const {
  for (const auto& c : team) {
    if (query == c.display || query == c.full || query == c.initial_family) {
      return c.player->id;
    }
  }
  return std::nullopt;
}

std::optional<PlayerId> FamilyNameMatcher::match(const std::string& query,
                                                 const std::vector<NameCandidate>& team) const {
  for (const auto& c : team) {
    if (!c.family.empty() && query == c.family) {
      return c.player->id;
    }
  }
  return std::nullopt;
}

std::optional<PlayerId> PartialNameMatcher::match(const std::string& query,
                                                  const std::vector<NameCandidate>& team) const {
  if (query.empty()) return std::nullopt;
  for (const auto& c : team) {
    if (c.full.find(query) != std::string::npos || last_token(c.full) == query) {
      return c.player->id;
    }
  }
  return std::nullopt;
}

std::vector<std::unique_ptr<NameMatcher>> default_name_matchers() {
  std::vector<std::unique_ptr<NameMatcher>> matchers;
  matchers.push_back(std::make_unique<AbbreviationTableMatcher>());
  matchers.push_back(std::make_unique<ExactNameMatcher>());
  matchers.push_back(std::make_unique<FamilyNameMatcher>());
  matchers.push_back(std::make_unique<PartialNameMatcher>());
  return matchers;
}

PlayerNameResolver::PlayerNameResolver(const Roster& roster)
    : PlayerNameResolver(roster, default_name_matchers()) {}

PlayerNameResolver::PlayerNameResolver(const Roster& roster, std::vector<std::unique_ptr<NameMatcher>> matchers)
    : matchers_(std::move(matchers)) {
  for (TeamId team : {roster.home_team_id(), roster.away_team_id()}) {
    candidates_[team] = build_candidates(roster.team_players(team));
  }
}

const std::vector<NameCandidate>& PlayerNameResolver::team_candidates(TeamId team) const {
  static const std::vector<NameCandidate> kEmpty;
  auto it = candidates_.find(team);
  return it == candidates_.end() ? kEmpty : it->second;
}

std::optional<PlayerId> PlayerNameResolver::resolve(std::string_view name, TeamId team,
                                                    bool suppress_warnings) const {
  const std::string query = normalize_name(name);
  const auto& candidates = team_candidates(team);
  if (!query.empty()) {
    for (const auto& matcher : matchers_) {
      if (auto id = matcher->match(query, candidates)) {
        log::debug(std::string("name '") + std::string(name) + "' matched by " + matcher->name());
        return id;
      }
    }
  }
  if (!suppress_warnings) {
    log::warn("could not find player '" + std::string(name) + "' on team " + std::to_string(team));
  }
  return std::nullopt;
}

} // namespace courtline
