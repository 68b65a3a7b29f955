#include "leaguesched/core/fixtures/FixtureGenerator.h"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <map>
#include <sstream>
#include <unordered_map>
#include <variant>

namespace leaguesched::core::fixtures {

namespace {

struct RealTeam {
    size_t index = 0;
};

struct Bye {};

using Seat = std::variant<RealTeam, Bye>;

struct Game {
    size_t home = 0;
    size_t away = 0;
};

std::vector<Seat> BuildSeats(size_t team_count) {
    std::vector<Seat> seats;
    seats.reserve(team_count + 1);
    for (size_t i = 0; i < team_count; ++i) {
        seats.emplace_back(RealTeam{i});
    }
    if (team_count % 2 == 1) {
        seats.emplace_back(Bye{});
    }
    return seats;
}

void RotateSeats(std::vector<Seat>& seats) {
    if (seats.size() <= 2) {
        return;
    }
    const Seat last = seats.back();
    for (size_t i = seats.size() - 1; i > 1; --i) {
        seats[i] = seats[i - 1];
    }
    seats[1] = last;
}

std::vector<std::pair<size_t, size_t>> CircleOrder(size_t team_count) {
    std::vector<std::pair<size_t, size_t>> order;
    auto seats = BuildSeats(team_count);
    const size_t seat_count = seats.size();
    for (size_t round = 0; round + 1 < seat_count; ++round) {
        for (size_t i = 0; i < seat_count / 2; ++i) {
            const auto* a = std::get_if<RealTeam>(&seats[i]);
            const auto* b = std::get_if<RealTeam>(&seats[seat_count - 1 - i]);
            if (a == nullptr || b == nullptr) {
                continue;
            }
            order.emplace_back(std::min(a->index, b->index), std::max(a->index, b->index));
        }
        RotateSeats(seats);
    }
    return order;
}

long long PairKey(size_t a, size_t b) {
    const size_t low = std::min(a, b);
    const size_t high = std::max(a, b);
    return (static_cast<long long>(low) << 32) | static_cast<unsigned int>(high);
}

std::uint64_t Fnv1a64(const std::string& payload) {
    constexpr std::uint64_t kOffset = 14695981039346656037ULL;
    constexpr std::uint64_t kPrime = 1099511628211ULL;
    std::uint64_t hash = kOffset;
    for (unsigned char ch : payload) {
        hash ^= static_cast<std::uint64_t>(ch);
        hash *= kPrime;
    }
    return hash;
}

// Completes a selection stuck with a single team still short of games by
// splitting an existing pair (x, y) into (t, x) and (t, y).
bool SplitPairFor(size_t team,
                  std::vector<std::pair<size_t, size_t>>& selected,
                  std::unordered_map<long long, int>& meetings) {
    int best_index = -1;
    int best_cost = 0;
    for (size_t i = 0; i < selected.size(); ++i) {
        const auto [x, y] = selected[i];
        if (x == team || y == team) {
            continue;
        }
        const int cost = meetings[PairKey(team, x)] + meetings[PairKey(team, y)];
        if (best_index < 0 || cost < best_cost) {
            best_index = static_cast<int>(i);
            best_cost = cost;
        }
    }
    if (best_index < 0) {
        return false;
    }
    const auto [x, y] = selected[static_cast<size_t>(best_index)];
    selected.erase(selected.begin() + best_index);
    meetings[PairKey(x, y)] -= 1;
    selected.emplace_back(std::min(team, x), std::max(team, x));
    selected.emplace_back(std::min(team, y), std::max(team, y));
    meetings[PairKey(team, x)] += 1;
    meetings[PairKey(team, y)] += 1;
    return true;
}

// Moves one home game from `from` to the first reachable team accepted by
// `accept`, flipping every new game on the path. Edges run home -> away when
// `forward`, away -> home otherwise.
template <typename Accept>
bool FlipPath(size_t from, bool forward, std::vector<Game>& games, std::vector<int>& home, Accept accept) {
    const size_t team_count = home.size();
    std::vector<int> via(team_count, -1);
    std::vector<bool> seen(team_count, false);
    std::deque<size_t> queue{from};
    seen[from] = true;
    while (!queue.empty()) {
        const size_t current = queue.front();
        queue.pop_front();
        if (current != from && accept(current)) {
            size_t node = current;
            while (node != from) {
                auto& game = games[static_cast<size_t>(via[node])];
                const size_t previous = forward ? game.home : game.away;
                std::swap(game.home, game.away);
                node = previous;
            }
            if (forward) {
                home[from] -= 1;
                home[current] += 1;
            } else {
                home[from] += 1;
                home[current] -= 1;
            }
            return true;
        }
        for (size_t i = 0; i < games.size(); ++i) {
            const size_t tail = forward ? games[i].home : games[i].away;
            const size_t head = forward ? games[i].away : games[i].home;
            if (tail != current || seen[head]) {
                continue;
            }
            seen[head] = true;
            via[head] = static_cast<int>(i);
            queue.push_back(head);
        }
    }
    return false;
}

void BalanceHomeGames(std::vector<Game>& games, std::vector<int>& home, int num_matches) {
    const int lower = num_matches / 2;
    const int upper = (num_matches + 1) / 2;
    const size_t max_steps = games.size() * home.size() + 1;
    for (size_t step = 0; step < max_steps; ++step) {
        bool moved = false;
        for (size_t team = 0; team < home.size() && !moved; ++team) {
            if (home[team] > upper) {
                moved = FlipPath(team, true, games, home, [&](size_t other) {
                    return home[other] + 1 <= upper;
                });
            } else if (home[team] < lower) {
                moved = FlipPath(team, false, games, home, [&](size_t other) {
                    return home[other] - 1 >= lower;
                });
            }
        }
        if (!moved) {
            return;
        }
    }
}

}  // namespace

std::vector<Pairing> FixtureGenerator::BuildRoundRobin(const std::vector<int>& team_ids) {
    std::vector<Pairing> pairings;
    if (team_ids.size() < 2) {
        return pairings;
    }
    const size_t per_round = team_ids.size() / 2;
    const auto order = CircleOrder(team_ids.size());
    pairings.reserve(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        Pairing pairing;
        pairing.round_index = static_cast<int>(i / per_round);
        pairing.first_team_id = team_ids[order[i].first];
        pairing.second_team_id = team_ids[order[i].second];
        pairings.push_back(pairing);
    }
    return pairings;
}

int FixtureGenerator::BaseMatchId(const model::League& league) {
    std::ostringstream key;
    key << league.id << '-' << league.year << '-' << league.name << '-' << league.section << '-'
        << league.division;
    return 100000 + static_cast<int>(Fnv1a64(key.str()) % 900000ULL);
}

bool FixtureGenerator::Generate(const model::League& league,
                                const std::vector<model::Team>& teams,
                                const std::vector<model::Match>& existing,
                                std::vector<model::Match>& created,
                                model::Error* error) {
    using model::ErrorKind;

    if (league.num_matches < 1 || league.num_lines_per_match < 1) {
        return model::Fail(error, ErrorKind::InvalidRequest,
                           "League " + std::to_string(league.id) +
                               " needs num_matches and num_lines_per_match >= 1");
    }
    if (teams.size() < 2) {
        return model::Fail(error, ErrorKind::InsufficientTeams,
                           "League " + std::to_string(league.id) + " has " + std::to_string(teams.size()) +
                               " team(s); at least 2 are required");
    }

    std::vector<model::Team> ordered = teams;
    std::sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    std::map<int, size_t> index_of;
    for (size_t i = 0; i < ordered.size(); ++i) {
        if (ordered[i].league_id != league.id) {
            return model::Fail(error, ErrorKind::InvalidRequest,
                               "Team " + ordered[i].name + " is not in league " + league.name);
        }
        if (!index_of.emplace(ordered[i].id, i).second) {
            return model::Fail(error, ErrorKind::InvalidRequest,
                               "Duplicate team id " + std::to_string(ordered[i].id));
        }
    }

    const size_t team_count = ordered.size();
    std::vector<int> played(team_count, 0);
    std::vector<int> home(team_count, 0);
    std::unordered_map<long long, int> meetings;
    std::unordered_map<long long, size_t> last_home;
    int max_meetings = 0;
    int next_id = BaseMatchId(league);

    std::vector<const model::Match*> league_matches;
    for (const auto& match : existing) {
        next_id = std::max(next_id, match.id);
        if (match.league_id == league.id) {
            league_matches.push_back(&match);
        }
    }
    std::sort(league_matches.begin(), league_matches.end(),
              [](const auto* a, const auto* b) { return a->id < b->id; });
    for (const auto* match : league_matches) {
        const auto home_it = index_of.find(match->home_team_id);
        const auto away_it = index_of.find(match->visitor_team_id);
        if (home_it == index_of.end() || away_it == index_of.end()) {
            continue;
        }
        played[home_it->second] += 1;
        played[away_it->second] += 1;
        home[home_it->second] += 1;
        const long long key = PairKey(home_it->second, away_it->second);
        max_meetings = std::max(max_meetings, ++meetings[key]);
        last_home[key] = home_it->second;
    }

    std::vector<int> deficit(team_count, 0);
    int remaining = 0;
    for (size_t i = 0; i < team_count; ++i) {
        deficit[i] = std::max(0, league.num_matches - played[i]);
        remaining += deficit[i];
    }
    if (remaining == 0) {
        return true;
    }
    if (remaining % 2 == 1) {
        std::ostringstream message;
        message << team_count << " teams cannot each reach " << league.num_matches
                << " matches: " << remaining << " open team slots cannot be paired";
        return model::Fail(error, ErrorKind::UnfairSchedule, message.str());
    }

    // Walk the circle order cycle after cycle; in cycle c a pair may meet
    // for at most the (c + 1)-th time, so repeats only start once every
    // pair has had its turn.
    const auto order = CircleOrder(team_count);
    std::vector<std::pair<size_t, size_t>> selected;
    const int max_cycles = max_meetings + league.num_matches + 1;
    for (int cycle = 0; remaining > 0 && cycle <= max_cycles; ++cycle) {
        for (const auto& [a, b] : order) {
            if (deficit[a] == 0 || deficit[b] == 0) {
                continue;
            }
            auto& count = meetings[PairKey(a, b)];
            if (count > cycle) {
                continue;
            }
            count += 1;
            deficit[a] -= 1;
            deficit[b] -= 1;
            remaining -= 2;
            selected.emplace_back(a, b);
            if (remaining == 0) {
                break;
            }
        }
    }

    while (remaining > 0) {
        const auto team_it = std::find_if(deficit.begin(), deficit.end(), [](int d) { return d > 0; });
        const size_t team = static_cast<size_t>(team_it - deficit.begin());
        const auto other_it = std::find_if(team_it + 1, deficit.end(), [](int d) { return d > 0; });
        if (other_it != deficit.end()) {
            const size_t other = static_cast<size_t>(other_it - deficit.begin());
            meetings[PairKey(team, other)] += 1;
            selected.emplace_back(team, other);
            deficit[team] -= 1;
            deficit[other] -= 1;
            remaining -= 2;
            continue;
        }
        if (!SplitPairFor(team, selected, meetings)) {
            return model::Fail(error, ErrorKind::UnfairSchedule,
                               "Unable to complete fixtures for team " + ordered[team].name);
        }
        deficit[team] -= 2;
        remaining -= 2;
    }

    // Successive meetings of a pair alternate hosts. A pair without earlier
    // meetings and an odd number of new games may reverse its whole run,
    // which moves exactly one home game between the two teams.
    std::vector<long long> pair_order;
    std::unordered_map<long long, std::vector<size_t>> runs;
    for (size_t i = 0; i < selected.size(); ++i) {
        const long long key = PairKey(selected[i].first, selected[i].second);
        auto& run = runs[key];
        if (run.empty()) {
            pair_order.push_back(key);
        }
        run.push_back(i);
    }

    std::vector<Game> games(selected.size());
    std::vector<Game> reversible;
    std::vector<long long> reversible_keys;
    for (const long long key : pair_order) {
        const auto& run = runs[key];
        const auto [a, b] = selected[run.front()];
        size_t host = home[a] <= home[b] ? a : b;
        const auto last = last_home.find(key);
        if (last != last_home.end()) {
            host = last->second == a ? b : a;
        }
        const size_t first_host = host;
        for (const size_t index : run) {
            const size_t guest = host == a ? b : a;
            games[index] = {host, guest};
            home[host] += 1;
            host = guest;
        }
        if (last == last_home.end() && run.size() % 2 == 1) {
            reversible.push_back({first_host, first_host == a ? b : a});
            reversible_keys.push_back(key);
        }
    }

    BalanceHomeGames(reversible, home, league.num_matches);
    for (size_t i = 0; i < reversible.size(); ++i) {
        const auto& run = runs[reversible_keys[i]];
        if (games[run.front()].home == reversible[i].home) {
            continue;
        }
        for (const size_t index : run) {
            std::swap(games[index].home, games[index].away);
        }
    }
    // Hosts pinned by earlier meetings can leave a team out of bounds; only
    // then are single games flipped.
    BalanceHomeGames(games, home, league.num_matches);

    created.reserve(created.size() + games.size());
    for (const auto& game : games) {
        model::Match match;
        match.id = ++next_id;
        match.league_id = league.id;
        match.home_team_id = ordered[game.home].id;
        match.visitor_team_id = ordered[game.away].id;
        created.push_back(std::move(match));
    }
    return true;
}

}  // namespace leaguesched::core::fixtures
