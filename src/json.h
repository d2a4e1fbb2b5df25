//
// Created by liuliwu on 2020-06-03.
//

#ifndef GEOLOCATE_JSON_H
#define GEOLOCATE_JSON_H

#include <rapidjson/document.h>
#include <string>

namespace geoLocate {
    class Json {
    private:
        rapidjson::Document doc;
        std::string raw;
        std::string pretty;
    public:
        explicit Json(const std::string &tpl);
        ~Json();
        rapidjson::Value &get(const char *key);
        std::string toString();
        std::string toPretty();
        rapidjson::Document::AllocatorType& getAllocator();

        static Json *createSuccessArrayJsonObj();
        static Json *createSuccessObjectJsonObj();

        static Json *createErrorJsonObj();
        static Json *createErrorJsonObj(int errorNo, const std::string &errorMsg);

        // 复制字符串 不依赖原来的内存
        rapidjson::Value createString(const std::string &str);
    };
}

#endif //GEOLOCATE_JSON_H
