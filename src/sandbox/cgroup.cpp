/**
 * @file cgroup.cpp
 * @brief CgroupLeaf: cgroup v2 control files read and written directly.
 * @author Dimitris Kafetzis
 */

#include "sandbox/cgroup.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace exec_engine {

namespace {

std::string read_file_line(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

/// Value of `key` in a flat-keyed file such as cpu.stat or memory.events.
uint64_t read_keyed(const std::filesystem::path& path, std::string_view key) {
    std::ifstream ifs(path);
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.starts_with(key) && line.size() > key.size() && line[key.size()] == ' ') {
            std::istringstream iss(line.substr(key.size() + 1));
            uint64_t value = 0;
            iss >> value;
            return value;
        }
    }
    return 0;
}

uint64_t read_u64(const std::filesystem::path& path) {
    auto line = read_file_line(path);
    if (line.empty() || line == "max") return 0;
    try {
        return std::stoull(line);
    } catch (const std::exception&) {
        return 0;
    }
}

/// Control files report errors on write(2), so bypass stream buffering.
Result<void> write_control(const std::filesystem::path& path, const std::string& value) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return Error{"open " + path.string() + ": " + std::strerror(errno)};
    }
    ssize_t written = ::write(fd, value.data(), value.size());
    int saved = errno;
    ::close(fd);
    if (written != static_cast<ssize_t>(value.size())) {
        return Error{"write " + path.string() + ": " + std::strerror(saved)};
    }
    return {};
}

}  // anonymous namespace

bool CgroupLeaf::available(const std::filesystem::path& root) {
    if (root.empty()) return false;
    auto controllers = read_file_line(root / "cgroup.controllers");
    if (controllers.find("memory") == std::string::npos
        || controllers.find("pids") == std::string::npos) {
        return false;
    }
    return ::access(root.c_str(), W_OK) == 0;
}

Result<std::unique_ptr<CgroupLeaf>> CgroupLeaf::create(const std::filesystem::path& root,
                                                       const std::string& name,
                                                       const ResourceLimits& limits) {
    // Children only get controllers the parent delegates; already-enabled is fine.
    auto enabled = read_file_line(root / "cgroup.subtree_control");
    if (enabled.find("memory") == std::string::npos || enabled.find("pids") == std::string::npos) {
        if (auto r = write_control(root / "cgroup.subtree_control", "+memory +pids +cpu"); !r) {
            if (auto retry = write_control(root / "cgroup.subtree_control", "+memory +pids");
                !retry) {
                return retry.error();
            }
        }
    }

    auto path = root / name;
    if (::mkdir(path.c_str(), 0755) != 0) {
        return Error{"mkdir " + path.string() + ": " + std::strerror(errno)};
    }
    std::unique_ptr<CgroupLeaf> leaf(new CgroupLeaf(path));

    if (auto r = write_control(path / "memory.max", std::to_string(limits.memory_bytes)); !r) {
        return r.error();
    }
    // Swap would let a program exceed its memory cap silently.
    if (std::filesystem::exists(path / "memory.swap.max")) {
        if (auto r = write_control(path / "memory.swap.max", "0"); !r) return r.error();
    }
    if (auto r = write_control(path / "pids.max", std::to_string(limits.max_processes)); !r) {
        return r.error();
    }
    return leaf;
}

CgroupLeaf::CgroupLeaf(std::filesystem::path path) : path_(std::move(path)) {}

CgroupLeaf::~CgroupLeaf() {
    if (!removed_) {
        auto r = destroy(std::chrono::milliseconds{200});
        (void)r;  // best effort; the owning sandbox already reported teardown
    }
}

Result<void> CgroupLeaf::add_process(pid_t pid) {
    return write_control(path_ / "cgroup.procs", std::to_string(pid));
}

CgroupStats CgroupLeaf::stats() const {
    CgroupStats stats;
    stats.cpu_usage_us = read_keyed(path_ / "cpu.stat", "usage_usec");
    stats.memory_current = read_u64(path_ / "memory.current");
    stats.memory_peak = read_u64(path_ / "memory.peak");
    stats.oom_kills = read_keyed(path_ / "memory.events", "oom_kill");
    return stats;
}

void CgroupLeaf::kill_all() noexcept {
    std::error_code ec;
    if (std::filesystem::exists(path_ / "cgroup.kill", ec)) {
        if (write_control(path_ / "cgroup.kill", "1")) return;
    }
    std::ifstream procs(path_ / "cgroup.procs");
    pid_t pid = 0;
    while (procs >> pid) {
        ::kill(pid, SIGKILL);
    }
}

bool CgroupLeaf::populated() const {
    return read_keyed(path_ / "cgroup.events", "populated") != 0;
}

Result<void> CgroupLeaf::destroy(std::chrono::milliseconds grace) {
    if (removed_) return {};

    auto deadline = std::chrono::steady_clock::now() + grace;
    kill_all();
    while (populated() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
        kill_all();
    }

    if (::rmdir(path_.c_str()) != 0 && errno != ENOENT) {
        return Error{"rmdir " + path_.string() + ": " + std::strerror(errno)};
    }
    removed_ = true;
    return {};
}

}  // namespace exec_engine
