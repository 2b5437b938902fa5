#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include "common/models.hpp"

namespace rewind {

/**
 * Build a content manifest of every regular file below root.
 *
 * Paths whose first segment (relative to root) is in excludedTopLevel are
 * skipped, as are symlinks. Files that cannot be read are left out of the
 * manifest and listed in ManifestScan::failures instead.
 *
 * Pure function of the tree's current bytes; nothing is written.
 */
ManifestScan buildManifest(const std::filesystem::path &root,
                           const std::set<std::string> &excludedTopLevel);

// Streaming SHA-256 of a file as lowercase hex.
std::optional<std::string> hashFile(const std::filesystem::path &path,
                                    std::string *error = nullptr);

} // namespace rewind
