#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace swisspair::cli {

// Each command returns the process exit status: 0 on success, 1 on error.
int RunPair(const std::string& config_path, std::ostream& out, std::ostream& err);
int RunTrf(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
// Violations are reported but do not fail the command.
int RunCheck(const std::string& input, std::ostream& out, std::ostream& err);

// args excludes the program name.
int RunCommand(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

}  // namespace swisspair::cli
