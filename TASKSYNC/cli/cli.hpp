#pragma once

#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tasksync::cli {

enum class Command { Convert, Fmt, Apply };
enum class Format { Markdown, Json };

struct Options {
    Command command{Command::Convert};
    std::string from;
    std::string to;
    std::string output;
    std::string config;
    std::string date;
    std::string input;        // empty or "-" reads the input stream
    std::string target_json;
    bool in_place = false;
    bool dry_run = false;
    bool help = false;
    int verbosity = 0;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws UsageError on unknown options, missing values or options that do
// not belong to the chosen command.
Options parse_args(const std::vector<std::string>& args);

std::optional<Format> parse_format(const std::string& name);

std::string usage();

// Exit status: 0 success, 1 processing failure, 2 usage error.
int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

}
