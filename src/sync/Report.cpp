#include "sync/Report.hpp"
#include "shell/Table.hpp"

#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>

using namespace sw::sync;
using namespace sw::shell;

std::string sw::sync::to_string(const Action action) {
    switch (action) {
        case Action::Copied: return "copied";
        case Action::BackedUpAndCopied: return "backed_up_and_copied";
        case Action::SkippedNotNewer: return "skipped_not_newer";
        case Action::SkippedNoSource: return "skipped_no_source";
        case Action::SkippedNoDestination: return "skipped_no_destination";
        case Action::SkippedSharedPath: return "skipped_shared_path";
        case Action::Failed: return "failed";
    }
    throw std::logic_error("Unknown sync action");
}

bool GameReport::hasSource() const {
    return std::ranges::any_of(outcomes, [](const Outcome& o) { return o.action != Action::SkippedNoSource; });
}

const Outcome* GameReport::find(const save::SaveKind& kind) const {
    const auto it = std::ranges::find(outcomes, kind, &Outcome::kind);
    return it == outcomes.end() ? nullptr : &*it;
}

std::size_t SyncReport::count(const Action action) const {
    std::size_t n = 0;
    for (const auto& g : games) n += std::ranges::count(g.outcomes, action, &Outcome::action);
    return n;
}

std::size_t SyncReport::copied() const {
    return count(Action::Copied) + count(Action::BackedUpAndCopied);
}

std::size_t SyncReport::skipped() const {
    return count(Action::SkippedNotNewer) + count(Action::SkippedNoDestination) + count(Action::SkippedSharedPath);
}

const GameReport* SyncReport::find(const std::string& game) const {
    const auto it = std::ranges::find(games, game, &GameReport::game);
    return it == games.end() ? nullptr : &*it;
}

std::string SyncReport::render(const int termWidth) const {
    Table table({
        {"Game", Align::Left, 4, 48},
        {"Save", Align::Left},
        {"Action", Align::Left},
        {"Detail", Align::Left, 10, 200, true},
    }, termWidth);

    for (const auto& g : games) {
        if (!g.hasSource()) {
            table.add_row({g.game, "-", "no saves found", ""});
            continue;
        }
        for (const auto& o : g.outcomes) {
            if (o.action == Action::SkippedNoSource) continue;
            std::string detail;
            if (o.action == Action::Failed) detail = o.error;
            else if (o.action == Action::BackedUpAndCopied) detail = o.destination.string() + " (backup: " + o.backup.string() + ")";
            else detail = o.destination.string();
            table.add_row({g.game, save::to_string(o.kind), to_string(o.action), std::move(detail)});
        }
    }

    std::string out = table.empty() ? std::string{} : table.render();
    out += fmt::format("\n{} game(s): {} copied ({} with backup), {} skipped, {} failed\n",
                       games.size(), copied(), backedUp(), skipped(), failed());
    return out;
}
