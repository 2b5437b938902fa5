#pragma once

namespace rewind {

enum class SkipReason {
    TooLarge,
    Binary,
    Unreadable
};

enum class UndoOutcome {
    NoHistory,
    DivergenceBlocked,
    Restored,
    RestoredWithGaps
};

enum class MutationMode {
    DryRun,
    Plan,
    Apply
};

} // namespace rewind
