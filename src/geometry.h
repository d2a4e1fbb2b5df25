//
// Created by liuliwu on 2026-10-19.
//

#ifndef GEOLOCATE_GEOMETRY_H
#define GEOLOCATE_GEOMETRY_H

#include <vector>

namespace geoLocate {

    typedef enum {
        GEOMETRY_TYPE_UNKNOWN = 0,
        GEOMETRY_TYPE_POLYGON = 1, // 多边形
        GEOMETRY_TYPE_MULTI_POLYGON = 2, // 多多边形
    } GeometryType;

    // 经纬度 单位: 度
    struct Point {
        double lon;
        double lat;

        Point() : lon(0), lat(0) {}
        Point(double lon, double lat) : lon(lon), lat(lat) {}

        bool operator==(const Point &other) const {
            return lon == other.lon && lat == other.lat;
        }
        bool operator!=(const Point &other) const {
            return !(*this == other);
        }
    };

    // 闭合的环 首尾两点相同
    typedef std::vector<Point> Ring;

    // 外环 + 内洞
    typedef std::vector<Ring> Polygon;

    // 数据集里原始的几何
    struct Geometry {
        GeometryType type;
        std::vector<Polygon> polygons; // POLYGON时只有一个

        Geometry() : type(GEOMETRY_TYPE_UNKNOWN) {}
    };
}

#endif //GEOLOCATE_GEOMETRY_H
