#include "Logger.hpp"
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <iostream>
#include <mutex>
#include <unistd.h>

#define LOG_PATH "logs/tustat.log"

namespace {
    std::mutex  g_log_mu;
    std::string g_log_path = LOG_PATH;
}

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mu);
    g_log_path = path.empty() ? std::string(LOG_PATH) : path;
}

std::string log_file() {
    std::lock_guard<std::mutex> lk(g_log_mu);
    return g_log_path;
}

// Desc: append one timestamped line to the log file
// In: const char* level, const std::string& msg
// Out: void (errors ignored)
static void file_log(const char* level, const std::string& msg) {
    std::string path;
    {
        std::lock_guard<std::mutex> lk(g_log_mu);
        path = g_log_path;
    }
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) return;
    time_t now = ::time(nullptr);
    char buf[64];
    ctime_r(&now, buf);
    buf[std::strlen(buf) - 1] = '\0';
    std::string line = "[" + std::string(buf) + "] [" + level + "] " + msg + "\n";
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
    ::close(fd);
}

void log_info(const std::string& msg) {
    file_log("INFO", msg);
    #ifdef DEBUG
    std::cerr << msg << "\n";
    #endif
}

void log_warn(const std::string& msg) {
    file_log("WARN", msg);
    std::cerr << msg << "\n";
}

void log_error(const std::string& msg) {
    file_log("ERROR", msg);
    std::cerr << msg << "\n";
}
