#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sock_scan {

// A live process as handed to the engine by an enumerator.
struct ProcessHandle {
    int pid = 0;
    std::string name;
};

// Owner attributed to a socket inode. Shared by every socket of one process.
struct SocketOwner {
    int pid = 0;
    std::string name;
};

using SocketOwnerPtr = std::shared_ptr<const SocketOwner>;
using SocketOwnerMap = std::unordered_map<uint64_t, SocketOwnerPtr>;

}
