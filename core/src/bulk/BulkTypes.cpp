#include "leaguesched/core/bulk/BulkTypes.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>
#include <utility>

namespace leaguesched::core::bulk {

namespace {

int CountOutcome(const std::vector<BulkEntry>& entries, BulkOutcome outcome) {
    return static_cast<int>(std::count_if(entries.begin(), entries.end(), [outcome](const BulkEntry& entry) {
        return entry.outcome == outcome;
    }));
}

}  // namespace

std::string BulkOperationName(BulkOperation operation) {
    switch (operation) {
        case BulkOperation::AutoSchedule:
            return "auto_schedule";
        case BulkOperation::Unschedule:
            return "unschedule";
        case BulkOperation::Delete:
            return "delete";
    }
    return "auto_schedule";
}

bool ParseBulkOperation(const std::string& text, BulkOperation& operation) {
    if (text == "auto_schedule" || text == "auto-schedule") {
        operation = BulkOperation::AutoSchedule;
    } else if (text == "unschedule") {
        operation = BulkOperation::Unschedule;
    } else if (text == "delete") {
        operation = BulkOperation::Delete;
    } else {
        return false;
    }
    return true;
}

BulkScope BulkScope::AllMatches() {
    return BulkScope{};
}

BulkScope BulkScope::ForLeague(int league_id) {
    BulkScope scope;
    scope.kind = Kind::League;
    scope.league_id = league_id;
    return scope;
}

BulkScope BulkScope::Filtered(std::string label, Predicate predicate) {
    BulkScope scope;
    scope.kind = Kind::Filtered;
    scope.label = std::move(label);
    scope.predicate = std::move(predicate);
    return scope;
}

bool BulkScope::Includes(const model::Match& match) const {
    switch (kind) {
        case Kind::All:
            return true;
        case Kind::League:
            return match.league_id == league_id;
        case Kind::Filtered:
            return !predicate || predicate(match);
    }
    return false;
}

std::string BulkScope::Describe() const {
    switch (kind) {
        case Kind::All:
            return "all matches";
        case Kind::League:
            return "league " + std::to_string(league_id);
        case Kind::Filtered:
            return label.empty() ? "filtered matches" : label;
    }
    return "all matches";
}

std::string BulkOutcomeName(BulkOutcome outcome) {
    switch (outcome) {
        case BulkOutcome::Succeeded:
            return "succeeded";
        case BulkOutcome::Skipped:
            return "skipped";
        case BulkOutcome::Failed:
            return "failed";
    }
    return "failed";
}

int BulkOperationResult::succeeded_count() const {
    return CountOutcome(entries, BulkOutcome::Succeeded);
}

int BulkOperationResult::skipped_count() const {
    return CountOutcome(entries, BulkOutcome::Skipped);
}

int BulkOperationResult::failed_count() const {
    return CountOutcome(entries, BulkOutcome::Failed);
}

std::string BulkOperationResult::Summary() const {
    std::ostringstream out;
    out << BulkOperationName(operation) << " over " << scope << ": " << succeeded_count() << " succeeded, "
        << skipped_count() << " skipped, " << failed_count() << " failed";
    return out.str();
}

std::string BulkOperationResult::ToJsonString() const {
    nlohmann::json json;
    json["operation"] = BulkOperationName(operation);
    json["scope"] = scope;
    json["succeeded_count"] = succeeded_count();
    json["skipped_count"] = skipped_count();
    json["failed_count"] = failed_count();
    json["details"] = nlohmann::json::array();
    for (const auto& entry : entries) {
        nlohmann::json item = {
            {"match_id", entry.match_id},
            {"outcome", BulkOutcomeName(entry.outcome)},
            {"detail", entry.detail},
        };
        if (entry.error_kind != model::ErrorKind::None) {
            item["error"] = model::ErrorKindName(entry.error_kind);
        }
        json["details"].push_back(std::move(item));
    }
    return json.dump(2);
}

}  // namespace leaguesched::core::bulk
