// Textual module format used by the driver and tests:
//
//   module demo                 ; optional header
//   func fib params=1 locals=2
//     local.get 0
//     i64.const 2
//     i64.lt_s
//     br_if 1
//     ...
//     call fib                  ; call target by name or index
//     return
//   end
//
// One instruction per line, `;` starts a comment. Labels are numeric ids.
#pragma once
#include <string>
#include <string_view>

#include "stagec/module.hpp"

namespace stagec::text {

struct ReadResult {
    bool success = false;
    Module module;
    std::string error_message;
    int line = 0;
    int column = 0;
};

ReadResult read_module(std::string_view src, std::string_view filename = "<input>");

// Reads a whole file; a missing file is reported as a failed ReadResult.
ReadResult read_module_file(const std::string& path);

} // namespace stagec::text
