#pragma once
#ifndef TABBIT_ERRORS_H
#define TABBIT_ERRORS_H

#include <stdexcept>
#include <string>

namespace tabbit {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Referenced entity not found, or duplicate participation. Fatal.
class DataIntegrityError : public Error {
public:
    using Error::Error;
};

// Rejected before any computation begins
class ConfigurationError : public Error {
public:
    using Error::Error;
};

// Illegal round lifecycle step (drawing out of order, completing early, ...)
class RoundStateError : public Error {
public:
    using Error::Error;
};

enum class Constraint {
    RepeatPairing,
    InstitutionClash,
    TeamCount,
    PanelSize,
};

const char* to_string(Constraint constraint);

// No legal draw or allocation exists under the current configuration.
// Carries enough detail for an operator to relax the configuration.
class InfeasibleError : public Error {
public:
    InfeasibleError(Constraint constraint, int room, int rank, const std::string& detail);

    Constraint constraint() const { return constraint_; }
    int room() const { return room_; }  // 0 when no single room is at fault
    int rank() const { return rank_; }  // 0 when not tied to a team

private:
    Constraint constraint_;
    int room_;
    int rank_;
};

}  // namespace tabbit

#endif  // TABBIT_ERRORS_H
