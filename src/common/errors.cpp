#include "common/errors.hpp"

namespace rewind {

namespace {

std::string divergenceMessage(const std::vector<std::string> &paths)
{
    std::string message =
        "Refusing to undo because these files changed since the mutation run:\n";
    for (const auto &path : paths) {
        message += "  - " + path + "\n";
    }
    message += "Re-run with --force to overwrite.";
    return message;
}

} // namespace

DivergenceError::DivergenceError(const std::string &runId, std::vector<std::string> paths)
    : HistoryError(divergenceMessage(paths))
    , m_runId(runId)
    , m_paths(std::move(paths))
{
}

} // namespace rewind
