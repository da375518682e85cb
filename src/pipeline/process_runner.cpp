#include "pipeline/process_runner.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace guidekit::pipeline {

std::string QuoteShellArg(std::string_view arg) {
  std::string quoted;
  quoted.reserve(arg.size() + 2U);
  quoted.push_back('\'');
  for (const char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string BuildShellCommand(const std::filesystem::path& working_dir,
                              const std::vector<std::string>& argv) {
  std::ostringstream command;
  if (!working_dir.empty()) {
    command << "cd " << QuoteShellArg(working_dir.string()) << " && ";
  }
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i != 0U) {
      command << ' ';
    }
    command << QuoteShellArg(argv[i]);
  }
  return command.str();
}

bool RunProcess(const std::filesystem::path& working_dir, const std::vector<std::string>& argv,
                int& exit_code, std::string& error) {
  error.clear();
  exit_code = -1;
  if (argv.empty()) {
    error = "no command to run";
    return false;
  }

  // Our own buffered output must land before the child's.
  std::cout.flush();
  std::cerr.flush();

  const std::string command = BuildShellCommand(working_dir, argv);
  const int raw_status = std::system(command.c_str());
  if (raw_status == -1) {
    error = "failed to start shell for: " + argv.front();
    return false;
  }

#if defined(_WIN32)
  exit_code = raw_status;
#else
  if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else if (WIFSIGNALED(raw_status)) {
    exit_code = 128 + WTERMSIG(raw_status);
  } else {
    exit_code = raw_status;
  }
#endif
  return true;
}

} // namespace guidekit::pipeline
