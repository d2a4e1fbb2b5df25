//
// Created by 刘立悟 on 2020/5/18.
//
#include <cstdio>
#include <memory>
#include <string>

#include "cli.h"
#include "config.h"
#include "error.h"
#include "json.h"
#include "log.h"

using namespace geoLocate;

int main(int argc, char *argv[]) {
    Config::init(&argc, &argv); // 根据命令行参数初始化配置
    atexit(Config::free);
    Log::init(argv[0]); // 初始化日志
    atexit(Log::free);

    std::unique_ptr<Json> reply;
    if (!Config::getInstance()->isLoaded()) {
        Error err;
        err.set(ERRNO_CONFIG_ERR, "cannot read " + FLAGS_config_file);
        reply.reset(Cli::createErrorReply(err));
    }
    else {
        CliOptions options;
        options.datasets = FLAGS_datasets;
        options.lat = FLAGS_lat;
        options.lon = FLAGS_lon;
        options.dataset = FLAGS_dataset;
        options.list = FLAGS_list;
        reply.reset(Cli::execute(options));
    }
    printf("%s\n", Cli::render(reply.get(), FLAGS_pretty).c_str());
    return Cli::exitCode(reply.get());
}
