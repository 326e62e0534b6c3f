#pragma once

#include "save/Kind.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sw::sync {

enum class Action : uint8_t {
    Copied,
    BackedUpAndCopied,
    SkippedNotNewer,
    SkippedNoSource,
    SkippedNoDestination, // destination format has no file for this kind, or game folder is missing
    SkippedSharedPath,    // file already handled for an earlier kind of the same game
    Failed,
};

std::string to_string(Action action);

[[nodiscard]] inline bool isCopy(const Action a) { return a == Action::Copied || a == Action::BackedUpAndCopied; }

struct Outcome {
    save::SaveKind kind;
    Action action{Action::SkippedNoSource};
    std::filesystem::path source;
    std::filesystem::path destination;
    std::filesystem::path backup;
    std::string error;
};

struct GameReport {
    std::string game;
    std::vector<Outcome> outcomes;

    [[nodiscard]] bool hasSource() const;
    [[nodiscard]] const Outcome* find(const save::SaveKind& kind) const;
};

struct SyncReport {
    std::vector<GameReport> games;
    std::chrono::system_clock::time_point begin{};
    std::chrono::system_clock::time_point end{};

    [[nodiscard]] std::size_t count(Action action) const;
    [[nodiscard]] std::size_t copied() const;
    [[nodiscard]] std::size_t backedUp() const { return count(Action::BackedUpAndCopied); }
    [[nodiscard]] std::size_t failed() const { return count(Action::Failed); }
    [[nodiscard]] std::size_t skipped() const;

    [[nodiscard]] const GameReport* find(const std::string& game) const;

    // Human-readable per-game summary, one row per save that had a source.
    [[nodiscard]] std::string render(int termWidth = 0) const;
};

}
