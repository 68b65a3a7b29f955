#pragma once

#include <string>

namespace leaguesched::core::model {

enum class ErrorKind {
    None,
    InsufficientTeams,
    UnfairSchedule,
    Capacity,
    NoSingleSlot,
    InsufficientCapacity,
    Conflict,
    DeleteUnsafe,
    InvalidRequest,
    NotFound,
    Persistence,
    Internal
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

std::string ErrorKindName(ErrorKind kind);

// Fills *error when non-null and returns false so callers can `return Fail(...)`.
bool Fail(Error* error, ErrorKind kind, std::string message);

}  // namespace leaguesched::core::model
