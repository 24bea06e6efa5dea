#pragma once

#include <string>

namespace rollout::util {

// Lowercase hex SHA-256 of a file's contents. Throws on I/O failure.
std::string Sha256File(const std::string& path);

std::string Sha256(const std::string& data);

} // namespace rollout::util
