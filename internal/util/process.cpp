#include "process.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>

#include <future>
#include <system_error>

#include "internal/util/errors.hpp"

namespace rollout::util {

namespace bp = boost::process;

namespace {

constexpr std::size_t kSummaryLimit = 512;

boost::filesystem::path ResolveProgram(const std::string& program) {
  if (program.find('/') != std::string::npos) {
    return boost::filesystem::path(program);
  }
  return bp::search_path(program);
}

} // namespace

CommandResult RunCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  if (argv.empty()) {
    throw CommandError("empty command line");
  }

  const auto program = ResolveProgram(argv[0]);
  if (program.empty()) {
    throw CommandError("command not found: " + argv[0]);
  }

  const std::vector<std::string> args(argv.begin() + 1, argv.end());

  boost::asio::io_context  ios;
  std::future<std::string> out;
  std::future<std::string> err;
  bp::group                group;
  std::error_code          ec;

  bp::child child(program, bp::args(args), bp::std_in.close(), bp::std_out > out, bp::std_err > err, ios, group, ec);
  if (ec) {
    throw CommandError("failed to start " + argv[0] + ": " + ec.message());
  }

  CommandResult result;

  // Returns early once the child exited and both pipes drained.
  ios.run_for(timeout);
  if (child.running(ec)) {
    result.timed_out = true;
    group.terminate(ec);
  }

  ios.restart();
  ios.run();
  child.wait(ec);

  result.exit_code = result.timed_out ? -1 : child.exit_code();
  result.out       = out.get();
  result.err       = err.get();
  return result;
}

CommandResult RunShell(const std::string& command, std::chrono::milliseconds timeout) {
  return RunCommand({"/bin/sh", "-c", command}, timeout);
}

CommandResult RunChecked(const std::vector<std::string>& argv, std::chrono::milliseconds timeout, const std::string& what) {
  auto result = RunCommand(argv, timeout);
  if (result.timed_out) {
    throw CommandError(what + ": timed out after " + std::to_string(timeout.count()) + "ms", true);
  }
  if (result.exit_code != 0) {
    throw CommandError(what + ": exit code " + std::to_string(result.exit_code) + ": " + Summarize(result));
  }
  return result;
}

std::string ShellQuote(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string ExpandTemplate(std::string command, const std::string& key, const std::string& value) {
  const std::string placeholder = "{" + key + "}";
  const std::string replacement = ShellQuote(value);

  for (auto pos = command.find(placeholder); pos != std::string::npos; pos = command.find(placeholder, pos + replacement.size())) {
    command.replace(pos, placeholder.size(), replacement);
  }
  return command;
}

std::string Summarize(const CommandResult& result) {
  std::string text = result.err.empty() ? result.out : result.err;
  for (auto& c : text) {
    if (c == '\n' || c == '\r') c = ' ';
  }
  while (!text.empty() && text.back() == ' ') {
    text.pop_back();
  }
  if (text.size() > kSummaryLimit) {
    text.resize(kSummaryLimit);
    text += "...";
  }
  return text;
}

} // namespace rollout::util
