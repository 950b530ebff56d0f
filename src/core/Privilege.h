// Linux privilege & sandbox helpers (best-effort; compile-time gated)
#pragma once
namespace sock_scan {
// Keeps CAP_DAC_READ_SEARCH and CAP_SYS_PTRACE: listing and stat'ing
// /proc/<pid>/fd of other users' processes needs ptrace read access.
bool drop_capabilities();
bool apply_seccomp_profile();
bool is_privilege_available();
bool is_seccomp_available();
int get_seccomp_allowed_syscalls_count();
}
