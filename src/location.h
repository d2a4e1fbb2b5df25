//
// Created by liuliwu on 2026-10-19.
//

#ifndef GEOLOCATE_LOCATION_H
#define GEOLOCATE_LOCATION_H

#include <initializer_list>
#include <string>
#include <rapidjson/document.h>
#include "payload.h"

#define LOCATION_PREFIX "<Location>"
#define LOCATION_COUNTY_TYPE "County"

namespace geoLocate {

    // 反向地理编码的结果 空字符串表示没有
    struct Location {
        std::string country; // 常用的国家名
        std::string countryLong; // 正式的国家名
        std::string countryCode2; // ISO 3166-1 alpha-2
        std::string countryCode3; // ISO 3166-1 alpha-3
        std::string continent;
        std::string region;
        std::string subregion;
        std::string province;
        std::string provinceCode; // ISO 3166-2
        std::string county;
        std::string city;

        bool empty() const;
        std::string toString() const;
        void toJson(rapidjson::Value *obj, rapidjson::Document::AllocatorType &allocator) const;

        // 已有的字段不会被覆盖
        void merge(const Location &other);

        static Location fromProperties(const Properties &properties);
    };

    // 第一个是字符串的属性值
    std::string getPropertyString(const Properties &properties, std::initializer_list<const char *> keys);
}

#endif //GEOLOCATE_LOCATION_H
