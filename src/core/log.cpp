#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>

#ifdef _WIN32
#  include <process.h>
#else
#  include <unistd.h>
#endif

std::string launcher_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
    return path;
}

void launcher_log(const std::string& msg) {
    std::ofstream out(launcher_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
    int pid = _getpid();
#else
    localtime_r(&t, &tm_buf);
    int pid = static_cast<int>(getpid());
#endif

    // Several launchers share this file, so tag each line with the pid
    char ts[48];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d %d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()), pid);
    out << "[" << ts << "] " << msg << "\n";
}
