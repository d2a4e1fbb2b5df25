//
// Created by liuliwu on 2026-10-19.
//

#ifndef GEOLOCATE_COMMON_H
#define GEOLOCATE_COMMON_H

#define C_OK 0
#define C_ERR 1

#include <string>
#include <vector>


long long ustime();

std::string trimString(const std::string &str, const std::string &chars);
std::vector<std::string> splitString(const std::string &str, char delimiter);
std::string readFile(const std::string &file, int *err);

namespace geoLocate {

    // 错误码
    typedef enum {
        ERRNO_OK = 0,

        // 构建阶段
        ERRNO_EMPTY_PAYLOAD = 1,
        ERRNO_DECOMPRESSION_FAILURE = 2,
        ERRNO_DECODE_FAILURE = 3,
        ERRNO_MALFORMED_GEOMETRY_TOO_FEW_POINTS = 4,
        ERRNO_MALFORMED_GEOMETRY_UNCLOSED_RING = 5,
        ERRNO_MALFORMED_GEOMETRY_UNSUPPORTED_KIND = 6,

        // 查询阶段
        ERRNO_LOCATION_NOT_FOUND = 7,
        ERRNO_MISSING_DATASET_PARAMETER = 8,
        ERRNO_DATASET_NOT_FOUND = 9,
        ERRNO_GEOMETRY_NOT_FOUND_FOR_DATASET = 10,

        // 命令行
        ERRNO_CONFIG_ERR = 11,
    } ErrorNo;

#define ERROR_EMPTY_PAYLOAD "empty payload"
#define ERROR_DECOMPRESSION_FAILURE "decompression failure"
#define ERROR_DECODE_FAILURE "decode failure"
#define ERROR_MALFORMED_GEOMETRY_TOO_FEW_POINTS "malformed geometry: too few points"
#define ERROR_MALFORMED_GEOMETRY_UNCLOSED_RING "malformed geometry: unclosed ring"
#define ERROR_MALFORMED_GEOMETRY_UNSUPPORTED_KIND "malformed geometry: unsupported geometry kind"
#define ERROR_LOCATION_NOT_FOUND "location not found"
#define ERROR_MISSING_DATASET_PARAMETER "missing dataset parameter"
#define ERROR_DATASET_NOT_FOUND "dataset not found"
#define ERROR_GEOMETRY_NOT_FOUND_FOR_DATASET "geometry not found for dataset"
#define ERROR_CONFIG_ERR "config error"

    const char *errorMessage(int errorNo);
}

#endif //GEOLOCATE_COMMON_H
