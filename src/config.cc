//
// Created by liuliwu on 2026-10-19.
//

#include <gflags/gflags.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include "config.h"
#include "common.h"
#include "log.h"

using namespace geoLocate;

DEFINE_string(config_file, "", "配置文件的路径");
DEFINE_string(datasets, "", "数据集列表 name=path 以;分隔 按顺序加载");
DEFINE_double(lat, 0, "查询点的纬度");
DEFINE_double(lon, 0, "查询点的经度");
DEFINE_string(dataset, "", "需要返回多边形的数据集");
DEFINE_bool(list, false, "只列出已加载的数据集");
DEFINE_bool(pretty, false, "格式化输出json");

Config *Config::instance = nullptr;

Config::Config() {
    this->loaded = true;
    if (FLAGS_config_file.size() > 0) {
        this->loaded = this->load(FLAGS_config_file) == C_OK;
    }
}

int Config::load(const std::string &configFile) {
    std::ifstream ifs(configFile);
    if (!ifs) {
        error("无法打开配置文件" + configFile)
                << ": " << strerror(errno) << "(" << errno << ")";
        return C_ERR;
    }
    std::string line;
    while (std::getline(ifs, line)) {
        line = trimString(line, " \r\n\t");
        if (line.size() == 0) {
            continue;
        }
        if (line[0] == '#') {
            continue; // 注释
        }
        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            warning("无法解析的配置: ") << line;
            continue;
        }
        std::string key = trimString(line.substr(0, pos), " \t");
        std::string val = trimString(line.substr(pos + 1), " \t");
        // 解析支持的配置
        if (key == "datasets") {
            FLAGS_datasets = val;
        }
        else if (key == "dataset") {
            FLAGS_dataset = val;
        }
        else if (key == "lat") {
            std::istringstream is(val);
            is >> FLAGS_lat;
        }
        else if (key == "lon") {
            std::istringstream is(val);
            is >> FLAGS_lon;
        }
        else if (key == "pretty") {
            FLAGS_pretty = val == "yes";
        }
        else if (key == "list") {
            FLAGS_list = val == "yes";
        }
        else {
            warning("未知的配置项: ") << key;
        }
    }
    return C_OK;
}

bool Config::isLoaded() {
    return this->loaded;
}

void Config::free() {
    delete instance;
    instance = nullptr;
}

Config::~Config() {

}

Config *Config::getInstance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}


void Config::init(int *argc, char ***argv) {
    google::ParseCommandLineFlags(argc, argv, true);
    getInstance();
}
