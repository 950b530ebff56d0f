#pragma once
#include "Config.h"
#include <string>

namespace sock_scan {

class ConfigValidator {
public:
    // Normalizes cfg in place; false (with a message on stderr) on an unusable combination.
    bool validate(Config& cfg);
    // SOCK_SCAN_PROC_ROOT / SOCK_SCAN_LOG_LEVEL, used when the flag was not given.
    void apply_env_overrides(Config& cfg, bool proc_root_from_cli, bool log_level_from_cli);

private:
    bool validate_positive(int value, const std::string& flag_name);
    bool validate_non_negative(int value, const std::string& flag_name);
};

}
