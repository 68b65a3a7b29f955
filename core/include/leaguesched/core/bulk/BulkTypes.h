#pragma once

#include "leaguesched/core/model/Error.h"
#include "leaguesched/core/model/LeagueTypes.h"

#include <functional>
#include <string>
#include <vector>

namespace leaguesched::core::bulk {

enum class BulkOperation {
    AutoSchedule,
    Unschedule,
    Delete
};

std::string BulkOperationName(BulkOperation operation);
// Accepts "auto_schedule" and "auto-schedule".
bool ParseBulkOperation(const std::string& text, BulkOperation& operation);

// Explicit description of which matches a bulk run touches.
struct BulkScope {
    enum class Kind {
        All,
        League,
        Filtered
    };

    using Predicate = std::function<bool(const model::Match&)>;

    Kind kind = Kind::All;
    int league_id = 0;
    Predicate predicate{};
    std::string label;

    static BulkScope AllMatches();
    static BulkScope ForLeague(int league_id);
    static BulkScope Filtered(std::string label, Predicate predicate);

    bool Includes(const model::Match& match) const;
    std::string Describe() const;
};

enum class BulkOutcome {
    Succeeded,
    Skipped,
    Failed
};

std::string BulkOutcomeName(BulkOutcome outcome);

struct BulkEntry {
    int match_id = 0;
    BulkOutcome outcome = BulkOutcome::Succeeded;
    model::ErrorKind error_kind = model::ErrorKind::None;
    std::string detail;
};

struct BulkOperationResult {
    BulkOperation operation = BulkOperation::AutoSchedule;
    std::string scope;
    // Same order the matches were processed in.
    std::vector<BulkEntry> entries;

    int succeeded_count() const;
    int skipped_count() const;
    int failed_count() const;
    bool HasWarnings() const { return skipped_count() > 0 || failed_count() > 0; }

    std::string Summary() const;
    std::string ToJsonString() const;
};

}  // namespace leaguesched::core::bulk
