#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace rewind {

// Writes through QSaveFile so readers never observe a half-written record.
// Throws std::runtime_error on failure.
void writeJsonFile(const std::filesystem::path &path, const nlohmann::json &payload);

// std::nullopt when the file is missing, unreadable or not valid JSON.
std::optional<nlohmann::json> readJsonFile(const std::filesystem::path &path);

// Copies bytes from src to dst, creating dst's parent directories.
bool copyFileBytes(const std::filesystem::path &src,
                   const std::filesystem::path &dst,
                   std::string *error = nullptr);

// Creates parent/<base>-NN for the first free NN in 00..99 and returns the
// claimed name. Creation is exclusive, so concurrent callers never share one.
std::optional<std::string> claimUniqueDirectory(const std::filesystem::path &parent,
                                                const std::string &base,
                                                std::string *error = nullptr);

std::string toPosixRelative(const std::filesystem::path &relative);

} // namespace rewind
