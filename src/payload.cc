//
// Created by liuliwu on 2026-10-19.
//

#include <zlib.h>
#include <cstring>
#include <rapidjson/error/en.h>

#include "payload.h"
#include "common.h"

using namespace geoLocate;

static int decodePosition(const rapidjson::Value &value, Point *point) {
    // [lon, lat] 可能带高度 只取前两个
    if (!value.IsArray() || value.Size() < 2 || !value[0].IsNumber() || !value[1].IsNumber()) {
        return C_ERR;
    }
    point->lon = value[0].GetDouble();
    point->lat = value[1].GetDouble();
    return C_OK;
}

static int decodePolygon(const rapidjson::Value &value, Polygon *polygon) {
    if (!value.IsArray()) {
        return C_ERR;
    }
    for (auto ringIter = value.Begin(); ringIter != value.End(); ringIter++) {
        if (!ringIter->IsArray()) {
            return C_ERR;
        }
        Ring ring;
        for (auto posIter = ringIter->Begin(); posIter != ringIter->End(); posIter++) {
            Point point;
            if (decodePosition(*posIter, &point) != C_OK) {
                return C_ERR;
            }
            ring.push_back(point);
        }
        polygon->push_back(ring);
    }
    return C_OK;
}

static int decodeGeometry(const rapidjson::Value &value, Geometry *geometry, std::string *detail) {
    if (value.IsNull()) {
        // 交给normalizer报不支持的类型
        geometry->type = GEOMETRY_TYPE_UNKNOWN;
        return C_OK;
    }
    if (!value.IsObject() || !value.HasMember("type") || !value["type"].IsString()) {
        *detail = "geometry without type";
        return C_ERR;
    }
    std::string type = value["type"].GetString();
    if (type == "Polygon") {
        geometry->type = GEOMETRY_TYPE_POLYGON;
    }
    else if (type == "MultiPolygon") {
        geometry->type = GEOMETRY_TYPE_MULTI_POLYGON;
    }
    else {
        geometry->type = GEOMETRY_TYPE_UNKNOWN;
        return C_OK;
    }

    if (!value.HasMember("coordinates") || !value["coordinates"].IsArray()) {
        *detail = type + " without coordinates";
        return C_ERR;
    }
    const rapidjson::Value &coordinates = value["coordinates"];
    if (geometry->type == GEOMETRY_TYPE_POLYGON) {
        Polygon polygon;
        if (decodePolygon(coordinates, &polygon) != C_OK) {
            *detail = "invalid Polygon coordinates";
            return C_ERR;
        }
        geometry->polygons.push_back(polygon);
        return C_OK;
    }
    for (auto iter = coordinates.Begin(); iter != coordinates.End(); iter++) {
        Polygon polygon;
        if (decodePolygon(*iter, &polygon) != C_OK) {
            *detail = "invalid MultiPolygon coordinates";
            return C_ERR;
        }
        geometry->polygons.push_back(polygon);
    }
    return C_OK;
}

static void decodeProperties(const rapidjson::Value &value, Properties *properties) {
    if (!value.IsObject()) {
        return;
    }
    for (auto iter = value.MemberBegin(); iter != value.MemberEnd(); iter++) {
        Property property;
        const rapidjson::Value &v = iter->value;
        if (v.IsString()) {
            property.type = PROPERTY_TYPE_STRING;
            property.str = std::string(v.GetString(), v.GetStringLength());
        }
        else if (v.IsNumber()) {
            property.type = PROPERTY_TYPE_NUMBER;
            property.number = v.GetDouble();
        }
        else if (v.IsBool()) {
            property.type = PROPERTY_TYPE_BOOL;
            property.boolean = v.GetBool();
        }
        else if (!v.IsNull()) {
            // 只保留标量
            continue;
        }
        (*properties)[std::string(iter->name.GetString(), iter->name.GetStringLength())] = property;
    }
}

bool Payload::isGzip(const std::string &data) {
    return data.size() >= 2 &&
           (unsigned char)data[0] == 0x1f && (unsigned char)data[1] == 0x8b;
}

int Payload::inflate(const std::string &data, std::string *out, Error *err) {
    z_stream strm;
    memset(&strm, 0, sizeof(strm));
    // 16 + MAX_WBITS: 只接受gzip头
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        return err->set(ERRNO_DECOMPRESSION_FAILURE, strm.msg != nullptr ? strm.msg : "inflateInit2");
    }
    strm.next_in = (Bytef *)data.data();
    strm.avail_in = (uInt)data.size();

    char buf[PAYLOAD_INFLATE_CHUNK];
    int ret;
    do {
        strm.next_out = (Bytef *)buf;
        strm.avail_out = sizeof(buf);
        ret = ::inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string msg = strm.msg != nullptr ? strm.msg : "inflate returned " + std::to_string(ret);
            inflateEnd(&strm);
            return err->set(ERRNO_DECOMPRESSION_FAILURE, msg);
        }
        out->append(buf, sizeof(buf) - strm.avail_out);
        if (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
            // 输入已经读完但流没有结束
            inflateEnd(&strm);
            return err->set(ERRNO_DECOMPRESSION_FAILURE, "truncated gzip stream");
        }
    } while (ret != Z_STREAM_END);
    inflateEnd(&strm);
    return C_OK;
}

int Payload::decode(const std::string &data, std::vector<Feature> *features, Error *err) {
    if (data.empty()) {
        return err->set(ERRNO_EMPTY_PAYLOAD);
    }
    if (!isGzip(data)) {
        return decodeFeatureCollection(data, features, err);
    }
    std::string json;
    if (inflate(data, &json, err) != C_OK) {
        return C_ERR;
    }
    if (json.empty()) {
        return err->set(ERRNO_EMPTY_PAYLOAD, "empty after decompression");
    }
    return decodeFeatureCollection(json, features, err);
}

int Payload::decodeFeatureCollection(const std::string &json, std::vector<Feature> *features, Error *err) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return err->set(ERRNO_DECODE_FAILURE,
                        std::string(rapidjson::GetParseError_En(doc.GetParseError())) +
                        " at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject() || !doc.HasMember("type") || !doc["type"].IsString() ||
        std::string(doc["type"].GetString()) != "FeatureCollection") {
        return err->set(ERRNO_DECODE_FAILURE, "not a FeatureCollection");
    }
    if (!doc.HasMember("features") || !doc["features"].IsArray()) {
        return err->set(ERRNO_DECODE_FAILURE, "FeatureCollection without features");
    }

    const rapidjson::Value &arr = doc["features"];
    for (rapidjson::SizeType i = 0; i < arr.Size(); i++) {
        const rapidjson::Value &item = arr[i];
        if (!item.IsObject()) {
            return err->set(ERRNO_DECODE_FAILURE, "feature#" + std::to_string(i) + " is not an object");
        }
        Feature feature;
        std::string detail;
        // 没有geometry和null一样 交给normalizer报不支持的类型
        static const rapidjson::Value nullGeometry;
        const rapidjson::Value &geometry = item.HasMember("geometry") ? item["geometry"] : nullGeometry;
        if (decodeGeometry(geometry, &feature.geometry, &detail) != C_OK) {
            return err->set(ERRNO_DECODE_FAILURE, "feature#" + std::to_string(i) + ": " + detail);
        }
        if (item.HasMember("properties")) {
            decodeProperties(item["properties"], &feature.properties);
        }
        features->push_back(std::move(feature));
    }
    return C_OK;
}

static void encodePolygon(const Polygon &polygon, rapidjson::Value *arr,
                          rapidjson::Document::AllocatorType &allocator) {
    arr->SetArray();
    for (const Ring &ring : polygon) {
        rapidjson::Value ringArr(rapidjson::kArrayType);
        for (const Point &point : ring) {
            rapidjson::Value pos(rapidjson::kArrayType);
            pos.PushBack(point.lon, allocator);
            pos.PushBack(point.lat, allocator);
            ringArr.PushBack(pos, allocator);
        }
        arr->PushBack(ringArr, allocator);
    }
}

void Payload::encodeGeometry(const Geometry &geometry, rapidjson::Value *obj,
                             rapidjson::Document::AllocatorType &allocator) {
    obj->SetObject();
    rapidjson::Value coordinates(rapidjson::kArrayType);
    switch (geometry.type) {
        case GEOMETRY_TYPE_POLYGON:
            obj->AddMember("type", "Polygon", allocator);
            if (!geometry.polygons.empty()) {
                encodePolygon(geometry.polygons[0], &coordinates, allocator);
            }
            break;
        case GEOMETRY_TYPE_MULTI_POLYGON:
            obj->AddMember("type", "MultiPolygon", allocator);
            for (const Polygon &polygon : geometry.polygons) {
                rapidjson::Value polygonArr;
                encodePolygon(polygon, &polygonArr, allocator);
                coordinates.PushBack(polygonArr, allocator);
            }
            break;
        default:
            obj->SetNull();
            return;
    }
    obj->AddMember("coordinates", coordinates, allocator);
}
