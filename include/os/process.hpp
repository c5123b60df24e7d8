#pragma once
#include <string>
#include <vector>

namespace Proc {

struct Result {
    bool launched = false;   // false if fork/exec could not start the program
    int  exit_code = -1;     // valid when launched; -1 if killed by a signal
    std::string out;         // captured stdout
    std::string err;         // captured stderr
};

// Run argv[0] (looked up in PATH) with the given arguments and wait for it.
// stdout and stderr are captured separately. Returns true only if the
// program was launched and exited with status 0.
bool Run(const std::vector<std::string>& argv, Result& out);

// True if 'program' resolves to an executable through PATH (or as a path).
bool Exists(const std::string& program);

} // namespace Proc
