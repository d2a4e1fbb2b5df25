//
// Created by liuliwu on 2026-10-19.
//

#ifndef GEOLOCATE_TEST_UTIL_H
#define GEOLOCATE_TEST_UTIL_H

#include <zlib.h>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

#include "geometry.h"

namespace geoLocate::test {

    // 轴对齐的矩形环 默认逆时针
    inline Ring rectRing(double minLon, double minLat, double maxLon, double maxLat, bool clockwise = false) {
        Ring ring;
        ring.push_back(Point(minLon, minLat));
        if (clockwise) {
            ring.push_back(Point(minLon, maxLat));
            ring.push_back(Point(maxLon, maxLat));
            ring.push_back(Point(maxLon, minLat));
        }
        else {
            ring.push_back(Point(maxLon, minLat));
            ring.push_back(Point(maxLon, maxLat));
            ring.push_back(Point(minLon, maxLat));
        }
        ring.push_back(Point(minLon, minLat));
        return ring;
    }

    inline Geometry polygonGeometry(const std::vector<Ring> &rings) {
        Geometry geometry;
        geometry.type = GEOMETRY_TYPE_POLYGON;
        geometry.polygons.push_back(rings);
        return geometry;
    }

    inline std::string ringJson(const Ring &ring) {
        std::ostringstream os;
        os << "[";
        for (size_t i = 0; i < ring.size(); i++) {
            if (i > 0) {
                os << ",";
            }
            os << "[" << ring[i].lon << "," << ring[i].lat << "]";
        }
        os << "]";
        return os.str();
    }

    // 一个Polygon feature
    inline std::string polygonFeatureJson(const std::vector<Ring> &rings, const std::string &properties) {
        std::ostringstream os;
        os << R"({"type":"Feature","properties":)" << properties
           << R"(,"geometry":{"type":"Polygon","coordinates":[)";
        for (size_t i = 0; i < rings.size(); i++) {
            if (i > 0) {
                os << ",";
            }
            os << ringJson(rings[i]);
        }
        os << "]}}";
        return os.str();
    }

    inline std::string featureCollectionJson(const std::vector<std::string> &features) {
        std::ostringstream os;
        os << R"({"type":"FeatureCollection","features":[)";
        for (size_t i = 0; i < features.size(); i++) {
            if (i > 0) {
                os << ",";
            }
            os << features[i];
        }
        os << "]}";
        return os.str();
    }

    // gzip压缩 用来构造压缩过的数据集
    inline std::string gzipString(const std::string &data) {
        z_stream strm;
        memset(&strm, 0, sizeof(strm));
        if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            return "";
        }
        strm.next_in = (Bytef *)data.data();
        strm.avail_in = (uInt)data.size();
        std::string out;
        char buf[4096];
        int ret;
        do {
            strm.next_out = (Bytef *)buf;
            strm.avail_out = sizeof(buf);
            ret = deflate(&strm, Z_FINISH);
            out.append(buf, sizeof(buf) - strm.avail_out);
        } while (ret == Z_OK);
        deflateEnd(&strm);
        return out;
    }
}

#endif //GEOLOCATE_TEST_UTIL_H
