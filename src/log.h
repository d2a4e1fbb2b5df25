//
// Created by liuliwu on 2026-10-19.
//

#ifndef GEOLOCATE_LOG_H
#define GEOLOCATE_LOG_H

#include <glog/logging.h>

#define info(x) (LOG(INFO) << x)
#define warning(x) (LOG(WARNING) << x)
#define error(x) (LOG(ERROR) << x)
#define fatal(x) (LOG(FATAL) << x)

namespace geoLocate {
    class Log {

    private:
    public:
        Log() = default;
        ~Log() = delete;
        static void init(const char *programName);
        static void free();
    };
}

#endif //GEOLOCATE_LOG_H
