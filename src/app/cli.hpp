#pragma once

#include <string>
#include <vector>

namespace keyspan::app {

// Runs one CLI invocation; args exclude the program name.
// Returns 0 on success, 1 when the core rejects the request, 2 on usage errors.
int run_cli(std::vector<std::string> args);

}  // namespace keyspan::app
