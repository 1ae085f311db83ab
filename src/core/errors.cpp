#include "core/errors.h"

namespace tabbit {

namespace {

std::string describe(Constraint constraint, int room, int rank, const std::string& detail) {
    std::string msg = "Infeasible (";
    msg += to_string(constraint);
    msg += ")";
    if (room > 0) msg += " in room " + std::to_string(room);
    if (rank > 0) msg += " at rank " + std::to_string(rank);
    msg += ": " + detail;
    return msg;
}

}  // namespace

const char* to_string(Constraint constraint) {
    switch (constraint) {
        case Constraint::RepeatPairing: return "repeat pairing";
        case Constraint::InstitutionClash: return "institution clash";
        case Constraint::TeamCount: return "team count";
        case Constraint::PanelSize: return "panel size";
    }
    return "unknown";
}

InfeasibleError::InfeasibleError(Constraint constraint, int room, int rank, const std::string& detail)
    : Error(describe(constraint, room, rank, detail)),
      constraint_(constraint),
      room_(room),
      rank_(rank) {}

}  // namespace tabbit
