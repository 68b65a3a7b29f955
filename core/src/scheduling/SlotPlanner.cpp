#include "leaguesched/core/scheduling/SlotPlanner.h"

#include "leaguesched/core/facility/AvailabilityModel.h"

#include <algorithm>
#include <map>

namespace leaguesched::core::scheduling {

namespace {

using model::ErrorKind;

const model::TimeSlot* FindSlot(const std::vector<model::TimeSlot>& slots, const model::TimeOfDay& time) {
    for (const auto& slot : slots) {
        if (slot.start_time == time) {
            return &slot;
        }
    }
    return nullptr;
}

std::string Lines(int count) {
    return std::to_string(count) + (count == 1 ? " line" : " lines");
}

}  // namespace

bool SlotPlanner::Plan(const PlanRequest& request,
                       const std::vector<model::TimeSlot>& slots,
                       std::vector<model::TimeOfDay>& times,
                       model::Error* error) {
    times.clear();
    if (request.partial_schedule) {
        return true;
    }
    if (request.num_lines < 1) {
        return model::Fail(error, ErrorKind::InvalidRequest, "num_lines must be at least 1");
    }
    switch (request.time_option) {
        case TimeOption::Same:
            return PlanSame(request, slots, times, error);
        case TimeOption::Custom:
            return PlanCustom(request, slots, times, error);
        case TimeOption::Auto:
            return PlanAuto(request, slots, times, error);
    }
    return model::Fail(error, ErrorKind::InvalidRequest, "Unknown time option");
}

bool SlotPlanner::PlanSame(const PlanRequest& request,
                           const std::vector<model::TimeSlot>& slots,
                           std::vector<model::TimeOfDay>& times,
                           model::Error* error) {
    if (request.times.empty()) {
        return model::Fail(error, ErrorKind::InvalidRequest, "Time option 'same' needs a start time");
    }
    const auto& time = request.times.front();
    const auto* slot = FindSlot(slots, time);
    if (slot == nullptr) {
        return model::Fail(error, ErrorKind::Capacity, "No slot starts at " + time.ToString());
    }
    if (slot->available_courts < request.num_lines) {
        return model::Fail(error, ErrorKind::Capacity,
                           "Slot " + time.ToString() + " has " + std::to_string(slot->available_courts) +
                               " court(s) for " + Lines(request.num_lines));
    }
    times.assign(static_cast<size_t>(request.num_lines), time);
    return true;
}

bool SlotPlanner::PlanCustom(const PlanRequest& request,
                             const std::vector<model::TimeSlot>& slots,
                             std::vector<model::TimeOfDay>& times,
                             model::Error* error) {
    if (static_cast<int>(request.times.size()) != request.num_lines) {
        return model::Fail(error, ErrorKind::InvalidRequest,
                           "Time option 'custom' needs exactly " + Lines(request.num_lines) + ", got " +
                               std::to_string(request.times.size()));
    }
    std::map<int, int> remaining;
    for (const auto& slot : slots) {
        remaining[slot.start_time.minutes] += slot.available_courts;
    }
    for (const auto& time : request.times) {
        const auto it = remaining.find(time.minutes);
        if (it == remaining.end()) {
            return model::Fail(error, ErrorKind::Capacity, "No slot starts at " + time.ToString());
        }
        if (it->second < 1) {
            return model::Fail(error, ErrorKind::Capacity, "Slot " + time.ToString() + " is over-subscribed");
        }
        it->second -= 1;
    }
    times = request.times;
    std::sort(times.begin(), times.end());
    return true;
}

bool SlotPlanner::PlanAuto(const PlanRequest& request,
                           const std::vector<model::TimeSlot>& slots,
                           std::vector<model::TimeOfDay>& times,
                           model::Error* error) {
    for (const auto& slot : slots) {
        if (slot.available_courts >= request.num_lines) {
            times.assign(static_cast<size_t>(request.num_lines), slot.start_time);
            return true;
        }
    }
    if (!request.allow_split_lines) {
        int best = 0;
        for (const auto& slot : slots) {
            best = std::max(best, slot.available_courts);
        }
        return model::Fail(error, ErrorKind::NoSingleSlot,
                           "No single slot fits " + Lines(request.num_lines) + " (largest has " +
                               std::to_string(best) + " court(s))");
    }

    const int total = facility::AvailabilityModel::TotalCourts(slots);
    if (total < request.num_lines) {
        return model::Fail(error, ErrorKind::InsufficientCapacity,
                           "Only " + std::to_string(total) + " court(s) free across the day for " +
                               Lines(request.num_lines));
    }
    int left = request.num_lines;
    for (const auto& slot : slots) {
        const int take = std::min(left, std::max(0, slot.available_courts));
        times.insert(times.end(), static_cast<size_t>(take), slot.start_time);
        left -= take;
        if (left == 0) {
            break;
        }
    }
    return true;
}

}  // namespace leaguesched::core::scheduling
