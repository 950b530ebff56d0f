#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace sock_scan {

class ArgumentParser {
public:
    ArgumentParser();

    // False means "stop": --help/--version (exit_code 0) or a usage error (exit_code 2).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }

    bool proc_root_given() const { return proc_root_given_; }
    bool log_level_given() const { return log_level_given_; }

    void print_help() const;

private:
    enum class ArgKind { None, String, Int };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* help;
        std::function<void(Config&, const std::string&)> apply;
    };

    const FlagSpec* find_spec(const std::string& flag) const;
    bool parse_int(const std::string& v, const char* flag, int& out);

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
    bool bad_value_ = false;
    bool proc_root_given_ = false;
    bool log_level_given_ = false;
};

}
