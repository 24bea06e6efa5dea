#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace rollout::util {

/*
  External command execution.

  Every collaborator (cosign, docker, store export/import, health
  commands) goes through here so that each call carries a hard timeout.
  A child still running when the timeout expires is terminated together
  with its process group.
*/

struct CommandResult {
  int         exit_code = -1;
  bool        timed_out = false;
  std::string out;
  std::string err;

  bool Ok() const {
    return !timed_out && exit_code == 0;
  }
};

// argv[0] is resolved through PATH when it has no slash.
// Throws CommandError when the program cannot be started.
CommandResult RunCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

// Runs `command` through /bin/sh -c.
CommandResult RunShell(const std::string& command, std::chrono::milliseconds timeout);

// Like RunCommand but throws CommandError unless the command succeeded.
CommandResult RunChecked(const std::vector<std::string>& argv, std::chrono::milliseconds timeout, const std::string& what);

std::string ShellQuote(const std::string& value);

// Replaces every `{key}` with the shell-quoted value.
std::string ExpandTemplate(std::string command, const std::string& key, const std::string& value);

// Truncated single-line summary of a command's stderr/stdout for error messages.
std::string Summarize(const CommandResult& result);

} // namespace rollout::util
