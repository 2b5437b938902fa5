#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <QString>
#include <QStringList>

#include "common/models.hpp"
#include "history/history_store.hpp"

namespace rewind {

struct MutationRequest {
    MutationMode mode = MutationMode::DryRun;
    // Apply mode refuses to run unless the caller confirmed it explicitly.
    bool confirmed = false;
    QString program;
    QStringList arguments;
    std::string description;
    std::chrono::milliseconds timeout{0};
};

// Throws ApplyNotConfirmedError for an unconfirmed apply. Returns true when
// the request may mutate the repository.
bool checkApplyGuard(const MutationRequest &request);

// MutationSession wraps one run of an external mutator in a history entry.
// Plan and dry-run requests never create an entry or start the mutator.
class MutationSession {
public:
    explicit MutationSession(HistoryStore &store);

    MutationReport run(const MutationRequest &request);

private:
    HistoryStore &m_store;
};

} // namespace rewind
