#pragma once

#include <filesystem>
#include <string>

#include "common/models.hpp"
#include "history/history_store.hpp"

namespace rewind {

/**
 * UndoEngine reverses one recorded mutation.
 *
 * The divergence check runs before anything is touched: unless force is
 * set, any modified/deleted path whose live hash differs from the AFTER
 * manifest aborts the undo with DivergenceError. Incomplete records raise
 * MissingHistoryError. Backups are staged inside the entry directory first
 * and then renamed into place, so a failure while reading backups leaves
 * the repository unchanged.
 */
class UndoEngine {
public:
    explicit UndoEngine(const HistoryStore &store);

    UndoSummary undo(const std::string &runId, bool force);
    UndoSummary undoLatest(bool force);

private:
    const HistoryStore &m_store;
};

UndoSummary undo(const std::filesystem::path &repo, const std::string &runId, bool force);
UndoSummary undoLatest(const std::filesystem::path &repo, bool force);

} // namespace rewind
