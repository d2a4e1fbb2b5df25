//
// Created by liuliwu on 2026-10-19.
//

#ifndef GEOLOCATE_CLI_H
#define GEOLOCATE_CLI_H

#include <string>
#include <vector>
#include "error.h"
#include "geocoder.h"
#include "json.h"

namespace geoLocate {

    struct CliOptions {
        std::string datasets; // name=path;name=path
        double lat;
        double lon;
        std::string dataset;
        bool list;

        CliOptions() : lat(0), lon(0), list(false) {}
    };

    /*
     * geolocate命令行的处理逻辑
     *
     * 所有结果都是 {"errno": N, "data": ...}
     * 成功时errno为0, data是位置信息或者数据集列表; 失败时data是错误信息.
     */
    class Cli {
    public:
        // 每个数据集从文件读取 name和path都不能为空
        static int parseDatasets(const std::string &datasets, std::vector<DatasetLoader> *loaders, Error *err);

        // 加载数据集并执行查询 总是返回一个结果
        static Json *execute(const CliOptions &options);

        static Json *createListReply(const Geocoder &geocoder);
        static Json *createLocateReply(const Geocoder &geocoder, double lon, double lat,
                                       const std::string &dataset, Error *err);
        static Json *createErrorReply(const Error &err);

        static std::string render(Json *reply, bool pretty);
        // 进程退出码
        static int exitCode(Json *reply);
    };
}

#endif //GEOLOCATE_CLI_H
