//
// Created by liuliwu on 2026-10-19.
//

#ifndef GEOLOCATE_PAYLOAD_H
#define GEOLOCATE_PAYLOAD_H

#include <map>
#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "error.h"
#include "geometry.h"

#define PAYLOAD_INFLATE_CHUNK 16384

namespace geoLocate {

    typedef enum {
        PROPERTY_TYPE_NULL = 0,
        PROPERTY_TYPE_STRING = 1,
        PROPERTY_TYPE_NUMBER = 2,
        PROPERTY_TYPE_BOOL = 3,
    } PropertyType;

    // feature属性里的标量值
    struct Property {
        PropertyType type;
        std::string str;
        double number;
        bool boolean;

        Property() : type(PROPERTY_TYPE_NULL), number(0), boolean(false) {}
    };

    typedef std::map<std::string, Property> Properties;

    struct Feature {
        Geometry geometry;
        Properties properties;
    };

    // 数据集的字节流: geojson FeatureCollection 或者gzip压缩后的
    class Payload {
    public:
        static bool isGzip(const std::string &data);
        static int inflate(const std::string &data, std::string *out, Error *err);

        // 空/解压/解析的错误都会返回C_ERR
        static int decode(const std::string &data, std::vector<Feature> *features, Error *err);
        static int decodeFeatureCollection(const std::string &json, std::vector<Feature> *features, Error *err);

        // 编码成geojson的geometry对象
        static void encodeGeometry(const Geometry &geometry, rapidjson::Value *obj,
                                   rapidjson::Document::AllocatorType &allocator);
    };
}

#endif //GEOLOCATE_PAYLOAD_H
