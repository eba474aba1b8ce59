#pragma once

#include <string>
#include <vector>
#include "protocol/run_execution_contract.hpp"

namespace tryrun::classify {

// Case-insensitive keyword match over stderr + stdout. Categories are tried
// in a fixed order (missing-env, missing-deps, port-conflict, test-fail,
// permission) and the first hit wins; text that mentions an earlier
// category's keywords incidentally is classified as that category.
protocol::RunFailureClass classify_failure(const std::string& stderr_text,
                                           const std::string& stdout_text);

// One or two remediation hints per class.
std::vector<std::string> probable_fixes_for_failure(protocol::RunFailureClass failure);

}  // namespace tryrun::classify
