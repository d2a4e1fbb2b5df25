//
// Created by liuliwu on 2026-10-19.
//

#include "log.h"

using namespace geoLocate;

void Log::free() {
    google::ShutdownGoogleLogging();
}

void Log::init(const char *programName) {
    google::InitGoogleLogging(programName);
    if (FLAGS_log_dir.empty()) {
        // 没有配置日志目录 只输出到stderr
        FLAGS_logtostderr = true;
    }
    else {
        FLAGS_alsologtostderr = true;
    }
    FLAGS_log_prefix = true;
    FLAGS_colorlogtostderr = true;
    FLAGS_stop_logging_if_full_disk = true;
    FLAGS_max_log_size = 100; // 100M
}
