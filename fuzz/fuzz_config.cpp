#include "core/Config.h"
#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "net/KernelVersion.h"
#include <cstdint>
#include <iostream>
#include <vector>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    // The whole input doubles as a kernel release string.
    sock_scan::KernelVersion kv;
    sock_scan::parse_kernel_release(input, kv);

    std::vector<std::string> args{"sock-scan"};
    size_t pos = 0;
    while (pos < input.size()) {
        size_t next = input.find(' ', pos);
        if (next == std::string::npos) {
            args.push_back(input.substr(pos));
            break;
        }
        args.push_back(input.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }

    // --help/--version print to stdout; keep the fuzzer output readable.
    std::cout.setstate(std::ios::failbit);
    sock_scan::ArgumentParser parser;
    sock_scan::Config cfg;
    if (parser.parse(static_cast<int>(argv.size()), argv.data(), cfg)) {
        sock_scan::ConfigValidator validator;
        validator.validate(cfg);
    }
    std::cout.clear();

    return 0;
}
