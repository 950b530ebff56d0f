#pragma once
#include <string>
#include <chrono>

namespace sock_scan {
namespace jsonutil {

std::string escape(const std::string& s);
// UTC, second precision: 2024-01-31T12:00:00Z
std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
}
