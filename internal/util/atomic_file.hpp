#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace rollout::util {

/*
  Durable atomic replace.

  Contents go to a temporary file in the same directory, are fsync'd,
  and the file is renamed over `path`; the directory is fsync'd after
  the rename. A reader sees either the old file or the new one.
*/
void WriteFileAtomic(const std::filesystem::path& path, const std::string& contents);

std::optional<std::string> ReadFile(const std::filesystem::path& path);

} // namespace rollout::util
