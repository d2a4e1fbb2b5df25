//
// Created by liuliwu on 2026-10-19.
//

#ifndef GEOLOCATE_NORMALIZER_H
#define GEOLOCATE_NORMALIZER_H

#include <memory>
#include <vector>
#include <s2/s2loop.h>
#include <s2/s2point.h>
#include <s2/s2polygon.h>
#include "error.h"
#include "geometry.h"

#define RING_MIN_POINTS 4
#define LOOP_MAX_CAP_DEGREES 90

namespace geoLocate {

    // 原始的环/多边形 -> 方向正确的s2 loop
    class Normalizer {
    public:
        // geojson里的坐标是[lon, lat]
        static S2Point pointFromCoord(const Point &point);

        // 平面的鞋带公式 不处理极点和180度经线 只作为快速的近似判断
        static bool isClockwise(const Ring &ring);

        // 去掉重复的闭合点 reverse时倒序
        static std::unique_ptr<S2Loop> loopFromRing(const Ring &ring, bool reverse);

        static int loopsFromPolygon(const Polygon &polygon, std::vector<std::unique_ptr<S2Loop>> *loops, Error *err);
        static int polygonFromGeometry(const Geometry &geometry, std::unique_ptr<S2Polygon> *polygon, Error *err);
    };
}

#endif //GEOLOCATE_NORMALIZER_H
