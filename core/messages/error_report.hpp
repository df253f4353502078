#pragma once

#include <exception>
#include <string>

namespace minder {
namespace messages {

// Format a failure description for a WorkerError report.
//
//   ---- worker failure (in <where>) ----
//   <exception type>: <what>
//   --------------------------------------
std::string format_error_report(const std::string &where, const std::exception &e);

// Same banner for failures that did not come from an exception
std::string format_error_report(const std::string &where, const std::string &description);

}  // namespace messages
}  // namespace minder
