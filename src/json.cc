//
// Created by liuliwu on 2020-06-03.
//

#include "json.h"

#include <rapidjson/writer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace geoLocate;

Json::Json(const std::string &tpl) {
    this->doc.Parse(tpl.c_str());
    this->raw = "";
    this->pretty = "";
}

Json::~Json() {
}

rapidjson::Value& Json::get(const char *key) {
    return this->doc[key];
}

std::string Json::toString() {
    if (this->raw.size() == 0) {
        rapidjson::StringBuffer buf;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buf);
        this->doc.Accept(writer);
        this->raw = std::string(buf.GetString());
    }
    return this->raw;
}

std::string Json::toPretty() {
    if (this->pretty.size() == 0) {
        rapidjson::StringBuffer buf;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buf);
        this->doc.Accept(writer);
        this->pretty = std::string(buf.GetString());
    }
    return this->pretty;
}

Json* Json::createSuccessArrayJsonObj() {
    return new Json(R"({"errno": 0, "data": []})");
}

Json* Json::createSuccessObjectJsonObj() {
    return new Json(R"({"errno": 0, "data": {}})");
}

Json* Json::createErrorJsonObj() {
    return new Json(R"({"errno": 0, "data": ""})");
}

Json* Json::createErrorJsonObj(int errorNo, const std::string &errorMsg) {
    Json *json = createErrorJsonObj();
    json->get("errno").SetInt(errorNo);
    json->get("data") = json->createString(errorMsg);
    return json;
}

rapidjson::Value Json::createString(const std::string &str) {
    return rapidjson::Value(str.c_str(), (rapidjson::SizeType)str.size(), this->doc.GetAllocator());
}


rapidjson::Document::AllocatorType& Json::getAllocator() {
    return this->doc.GetAllocator();
}
