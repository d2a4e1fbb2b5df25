//
// Created by liuliwu on 2026-10-19.
//

#ifndef GEOLOCATE_CONFIG_H
#define GEOLOCATE_CONFIG_H

#include <gflags/gflags.h>
#include <string>

// config file
DECLARE_string(config_file); // 配置文件的路径

// datasets
DECLARE_string(datasets); // 数据集 eg. countries=../data/countries.geojson;provinces=../data/provinces.geojson.gz

// query
DECLARE_double(lat); // 纬度
DECLARE_double(lon); // 经度
DECLARE_string(dataset); // 需要返回多边形的数据集
DECLARE_bool(list); // 只列出数据集
DECLARE_bool(pretty); // 格式化输出

namespace geoLocate {
    class Config {
    private:
        static Config *instance;
        bool loaded;
        Config();

    public:
        static void init(int *argc, char*** argv);
        static void free();
        static Config *getInstance();
        bool isLoaded();
        int load(const std::string &configFile);
        ~Config();
    };

}


#endif //GEOLOCATE_CONFIG_H
