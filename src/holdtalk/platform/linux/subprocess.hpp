#pragma once

#include "error.hpp"

#include <string>
#include <vector>

// Runs argv[0] from PATH, optionally feeding `input` on stdin, and waits for
// it. A non-zero exit status is an Output error.
Result<void> run_process(const std::vector<std::string>& argv, const std::string* input = nullptr);
