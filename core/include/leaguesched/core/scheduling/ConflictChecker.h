#pragma once

#include "leaguesched/core/model/Error.h"
#include "leaguesched/core/model/LeagueTypes.h"
#include "leaguesched/core/persist/ILeagueStore.h"

#include <vector>

namespace leaguesched::core::scheduling {

struct ConflictSettings {
    int match_duration_minutes = 180;
    bool block_team_same_day = true;
};

// Every query reads current bookings from the store; nothing is cached
// between calls.
class ConflictChecker {
public:
    ConflictChecker(const persist::ILeagueStore& store, ConflictSettings settings);

    // The facility's slots on `date` less the lines other matches already hold.
    std::vector<model::TimeSlot> RemainingSlots(const model::Facility& facility,
                                                const model::CalendarDate& date,
                                                int exclude_match_id) const;

    // An empty `times` means the whole day is claimed.
    bool CheckTeams(const model::Match& match,
                    const model::CalendarDate& date,
                    const std::vector<model::TimeOfDay>& times,
                    model::Error* error) const;
    bool CheckFacility(const model::Match& match,
                       const model::Facility& facility,
                       const model::CalendarDate& date,
                       const std::vector<model::TimeOfDay>& times,
                       model::Error* error) const;
    bool Check(const model::Match& match,
               const model::Facility& facility,
               const model::CalendarDate& date,
               const std::vector<model::TimeOfDay>& times,
               model::Error* error) const;

    const ConflictSettings& settings() const { return settings_; }

private:
    bool Overlaps(const std::vector<model::TimeOfDay>& a, const std::vector<model::TimeOfDay>& b) const;

    const persist::ILeagueStore& store_;
    ConflictSettings settings_;
};

}  // namespace leaguesched::core::scheduling
