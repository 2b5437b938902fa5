#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace rewind {

class HistoryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The requested run id has no complete, parseable records.
class MissingHistoryError : public HistoryError {
public:
    MissingHistoryError(const std::string &runId, const std::string &message)
        : HistoryError(message)
        , m_runId(runId)
    {
    }

    const std::string &runId() const { return m_runId; }
    UndoOutcome outcome() const { return UndoOutcome::NoHistory; }

private:
    std::string m_runId;
};

// Live files no longer match the recorded post-mutation state.
class DivergenceError : public HistoryError {
public:
    DivergenceError(const std::string &runId, std::vector<std::string> paths);

    const std::string &runId() const { return m_runId; }
    const std::vector<std::string> &divergedPaths() const { return m_paths; }
    UndoOutcome outcome() const { return UndoOutcome::DivergenceBlocked; }

private:
    std::string m_runId;
    std::vector<std::string> m_paths;
};

class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ApplyNotConfirmedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace rewind
