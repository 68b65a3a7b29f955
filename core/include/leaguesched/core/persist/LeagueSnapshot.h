#pragma once

#include "leaguesched/core/persist/InMemoryLeagueStore.h"

#include <string>

namespace leaguesched::core::persist {

// One JSON document holding leagues, teams, facilities and matches.
constexpr int kSnapshotVersion = 1;

// Replaces the store's contents only when the whole document parses.
bool LoadSnapshot(const std::string& path, InMemoryLeagueStore& store, std::string* error);
bool LoadSnapshotFromString(const std::string& text, InMemoryLeagueStore& store, std::string* error);

bool SaveSnapshot(const std::string& path, const InMemoryLeagueStore& store, std::string* error);
std::string SnapshotToJsonString(const InMemoryLeagueStore& store);

}  // namespace leaguesched::core::persist
