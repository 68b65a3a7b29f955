#include "leaguesched/core/model/Error.h"

#include <utility>

namespace leaguesched::core::model {

std::string ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::InsufficientTeams:
            return "insufficient_teams";
        case ErrorKind::UnfairSchedule:
            return "unfair_schedule";
        case ErrorKind::Capacity:
            return "capacity";
        case ErrorKind::NoSingleSlot:
            return "no_single_slot";
        case ErrorKind::InsufficientCapacity:
            return "insufficient_capacity";
        case ErrorKind::Conflict:
            return "conflict";
        case ErrorKind::DeleteUnsafe:
            return "delete_unsafe";
        case ErrorKind::InvalidRequest:
            return "invalid_request";
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::Persistence:
            return "persistence";
        case ErrorKind::Internal:
            return "internal";
    }
    return "unknown";
}

bool Fail(Error* error, ErrorKind kind, std::string message) {
    if (error) {
        error->kind = kind;
        error->message = std::move(message);
    }
    return false;
}

}  // namespace leaguesched::core::model
