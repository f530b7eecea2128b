#include "courtline/diagnostics.h"

#include <algorithm>

namespace courtline {

const char* diagnostic_kind_name(DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::FormatError: return "format_error";
    case DiagnosticKind::DataError: return "data_error";
    case DiagnosticKind::ResolutionMiss: return "resolution_miss";
    case DiagnosticKind::UnparsedSubstitution: return "unparsed_substitution";
    case DiagnosticKind::OutgoingNotOnCourt: return "outgoing_not_on_court";
    case DiagnosticKind::IncomingAlreadyOnCourt: return "incoming_already_on_court";
    case DiagnosticKind::UnknownTeam: return "unknown_team";
    case DiagnosticKind::LineupFallback: return "lineup_fallback";
  }
  return "unknown";
}

size_t count_diagnostics(const std::vector<Diagnostic>& diagnostics, DiagnosticKind kind) {
  return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
                                           [kind](const Diagnostic& d) { return d.kind == kind; }));
}

bool is_lossy(DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::ResolutionMiss:
    case DiagnosticKind::UnparsedSubstitution:
    case DiagnosticKind::OutgoingNotOnCourt:
    case DiagnosticKind::IncomingAlreadyOnCourt:
    case DiagnosticKind::UnknownTeam:
      return true;
    default:
      return false;
  }
}

} // namespace courtline
