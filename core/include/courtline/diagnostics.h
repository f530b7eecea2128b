#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace courtline {

enum class DiagnosticKind {
  FormatError,
  DataError,
  ResolutionMiss,
  UnparsedSubstitution,
  OutgoingNotOnCourt,
  IncomingAlreadyOnCourt,
  UnknownTeam,
  LineupFallback
};

struct Diagnostic {
  DiagnosticKind kind = DiagnosticKind::DataError;
  int64_t action_number = 0;
  int period = 0;
  std::string message;
};

const char* diagnostic_kind_name(DiagnosticKind kind);
size_t count_diagnostics(const std::vector<Diagnostic>& diagnostics, DiagnosticKind kind);

// Kinds that mean a substitution was dropped or had no effect on the timeline.
bool is_lossy(DiagnosticKind kind);

} // namespace courtline
