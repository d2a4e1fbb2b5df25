//
// Created by liuliwu on 2026-10-19.
//

#include "common.h"

#include <sys/time.h>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <string>

/* Return the UNIX time in microseconds */
long long ustime() {
    struct timeval tv;
    long long ust;

    gettimeofday(&tv, nullptr);
    ust = ((long long)tv.tv_sec)*1000000;
    ust += tv.tv_usec;
    return ust;
}

std::string trimString(const std::string &str, const std::string &chars) {
    size_t end = str.find_last_not_of(chars);
    if (end == std::string::npos) {
        return "";
    }
    size_t start = str.find_first_not_of(chars);
    return str.substr(start, end - start + 1);
}

std::vector<std::string> splitString(const std::string &str, char delimiter) {
    std::vector<std::string> v;
    std::istringstream is(str);
    std::string item;
    while (std::getline(is, item, delimiter)) {
        v.push_back(item);
    }
    return v;
}

// 整个文件读入内存 失败时err为errno
std::string readFile(const std::string &file, int *err) {
    *err = 0;
    std::ifstream ifs(file, std::ios::in | std::ios::binary);
    if (!ifs) {
        *err = errno != 0 ? errno : ENOENT;
        return "";
    }
    std::ostringstream os;
    os << ifs.rdbuf();
    return os.str();
}

const char *geoLocate::errorMessage(int errorNo) {
    switch (errorNo) {
        case ERRNO_OK: return "";
        case ERRNO_EMPTY_PAYLOAD: return ERROR_EMPTY_PAYLOAD;
        case ERRNO_DECOMPRESSION_FAILURE: return ERROR_DECOMPRESSION_FAILURE;
        case ERRNO_DECODE_FAILURE: return ERROR_DECODE_FAILURE;
        case ERRNO_MALFORMED_GEOMETRY_TOO_FEW_POINTS: return ERROR_MALFORMED_GEOMETRY_TOO_FEW_POINTS;
        case ERRNO_MALFORMED_GEOMETRY_UNCLOSED_RING: return ERROR_MALFORMED_GEOMETRY_UNCLOSED_RING;
        case ERRNO_MALFORMED_GEOMETRY_UNSUPPORTED_KIND: return ERROR_MALFORMED_GEOMETRY_UNSUPPORTED_KIND;
        case ERRNO_LOCATION_NOT_FOUND: return ERROR_LOCATION_NOT_FOUND;
        case ERRNO_MISSING_DATASET_PARAMETER: return ERROR_MISSING_DATASET_PARAMETER;
        case ERRNO_DATASET_NOT_FOUND: return ERROR_DATASET_NOT_FOUND;
        case ERRNO_GEOMETRY_NOT_FOUND_FOR_DATASET: return ERROR_GEOMETRY_NOT_FOUND_FOR_DATASET;
        case ERRNO_CONFIG_ERR: return ERROR_CONFIG_ERR;
        default: return "unknown error";
    }
}
