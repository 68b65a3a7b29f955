#pragma once

#include "leaguesched/core/model/Error.h"
#include "leaguesched/core/model/LeagueTypes.h"

#include <string>
#include <vector>

namespace leaguesched::core::scheduling {

enum class TimeOption {
    Auto,
    Same,
    Custom
};

struct PlanRequest {
    int num_lines = 0;
    TimeOption time_option = TimeOption::Auto;
    bool allow_split_lines = false;
    // Same: first entry is the shared time. Custom: one entry per line.
    std::vector<model::TimeOfDay> times;
    bool partial_schedule = false;
};

class SlotPlanner {
public:
    // `slots` carries the capacity still free at each start time. On success
    // `times` holds one start time per line in ascending order.
    static bool Plan(const PlanRequest& request,
                     const std::vector<model::TimeSlot>& slots,
                     std::vector<model::TimeOfDay>& times,
                     model::Error* error);

private:
    static bool PlanSame(const PlanRequest& request,
                         const std::vector<model::TimeSlot>& slots,
                         std::vector<model::TimeOfDay>& times,
                         model::Error* error);
    static bool PlanCustom(const PlanRequest& request,
                           const std::vector<model::TimeSlot>& slots,
                           std::vector<model::TimeOfDay>& times,
                           model::Error* error);
    static bool PlanAuto(const PlanRequest& request,
                         const std::vector<model::TimeSlot>& slots,
                         std::vector<model::TimeOfDay>& times,
                         model::Error* error);
};

}  // namespace leaguesched::core::scheduling
