#pragma once

#include <string>
#include <optional>
#include "replay/ReplayTypes.hpp"

namespace blockdrop::replay {

/// Serialize a replay as UTF-8 text: one METADATA line, then one EVENT line
/// per event, each terminated by '\n'.
///
///   METADATA;version=1.0;startTimestamp=...;boardWidth=10;...;durationMs=...
///   EVENT;kind=PlayerInput;input=MoveLeft;frame=0
///   EVENT;kind=PieceSpawn;shape=T;frame=3
std::string serialize(const ReplayData& replay);

/// Parse text produced by serialize(). Returns std::nullopt on any error
/// (unknown line type or event kind, unknown shape/input, missing field,
/// non-numeric value).
std::optional<ReplayData> deserialize(const std::string& text);

/// Single-event helpers, exposed for tests and streaming writers.
std::string serializeEvent(const ReplayEvent& event);
std::optional<ReplayEvent> deserializeEvent(const std::string& line);

} // namespace blockdrop::replay
