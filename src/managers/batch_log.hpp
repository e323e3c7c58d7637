#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string sshbatch_log_path() {
    static std::string path = (platform::temp_dir() / "sshbatch_debug.log").string();
    return path;
}

inline void sshbatch_log(const std::string& msg) {
    std::ofstream out(sshbatch_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void sshbatch_log_success(const SuccessRecord& r) {
    sshbatch_log(fmt::format("ok {} exit={} stdout({}) stderr({})", r.target, r.exit_code,
                             r.stdout_text.size(), r.stderr_text.size()));
}

inline void sshbatch_log_failure(const FailureRecord& r) {
    std::string code = r.exit_code ? std::to_string(*r.exit_code) : "-";
    sshbatch_log(fmt::format("fail {} kind={} exit={}", r.target, failure_kind_name(r.kind), code));
    if (!r.detail.empty())
        sshbatch_log(fmt::format("fail {} detail={}", r.target, r.detail));
    if (!r.stderr_text.empty())
        sshbatch_log(fmt::format("fail {} stderr={}", r.target, r.stderr_text.substr(0, 500)));
}
