#pragma once
#include <cstdint>
#include <string>

#include "apps/venh/PipelineDriver.hpp"

namespace venh {

// Everything the venh executable takes from its command line.
struct CliArgs {
    std::string input;
    std::string output;

    std::string enhance_cmd;
    std::string critique_cmd;
    std::string surgical_cmd;
    std::string work_dir;
    std::string ffmpeg  = "ffmpeg";
    std::string ffprobe = "ffprobe";

    PipelineConfig cfg{};
    bool keep_temp = false;
};

// Parses '--key value' flags into 'out'. Prints the offending flag and
// returns false on an unknown flag, a missing value, or a value that does
// not parse completely or lies outside the flag's range.
bool ParseCommandLine(int argc, const char* const* argv, CliArgs& out);

void PrintUsage(const char* exe);

// Whole-string numeric parsing. Throw std::invalid_argument on trailing
// text or no digits, std::out_of_range outside [lo, hi].
long long ParseInteger(const std::string& s, long long lo, long long hi);
double    ParseReal(const std::string& s, double lo, double hi);

} // namespace venh
