//
// Created by liuliwu on 2026-10-19.
//

#include <s2/s1angle.h>
#include <s2/s2cap.h>
#include <s2/s2error.h>
#include <s2/s2latlng.h>
#include <absl/memory/memory.h>

#include "normalizer.h"
#include "common.h"
#include "log.h"

using namespace geoLocate;

S2Point Normalizer::pointFromCoord(const Point &point) {
    S2LatLng latlng = S2LatLng::FromDegrees(point.lat, point.lon);
    return latlng.ToPoint();
}

bool Normalizer::isClockwise(const Ring &ring) {
    double a = 0;
    size_t n = ring.size();
    for (size_t i = 0; i < n; i++) {
        const Point &p1 = ring[i];
        const Point &p2 = ring[(i + 1) % n];
        a += (p2.lon - p1.lon) * (p1.lat + p2.lat);
    }
    return a > 0;
}

std::unique_ptr<S2Loop> Normalizer::loopFromRing(const Ring &ring, bool reverse) {
    // s2的loop是隐式闭合的 不允许重复的点 跳过最后一个点
    size_t n = ring.size();
    std::vector<S2Point> points(n - 1);
    for (size_t i = 0; i < n - 1; i++) {
        if (reverse) {
            points[i] = pointFromCoord(ring[n - 1 - i]);
        }
        else {
            points[i] = pointFromCoord(ring[i]);
        }
    }
    return absl::make_unique<S2Loop>(points, S2Debug::DISABLE);
}

int Normalizer::loopsFromPolygon(const Polygon &polygon, std::vector<std::unique_ptr<S2Loop>> *loops, Error *err) {
    for (size_t i = 0; i < polygon.size(); i++) {
        const Ring &ring = polygon[i];
        size_t n = ring.size();
        if (n < RING_MIN_POINTS) {
            return err->set(ERRNO_MALFORMED_GEOMETRY_TOO_FEW_POINTS,
                            "ring#" + std::to_string(i) + " has " + std::to_string(n) + " points");
        }
        if (ring[0] != ring[n - 1]) {
            return err->set(ERRNO_MALFORMED_GEOMETRY_UNCLOSED_RING,
                            "ring#" + std::to_string(i) + " first point differs from last point");
        }

        // s2要求loop是逆时针的 geojson没有这个约束
        // 假设多边形都小于半球 顺时针的倒过来
        std::unique_ptr<S2Loop> loop = loopFromRing(ring, isClockwise(ring));

        // 上面的判断是近似的 外接圆大于半球说明选反了
        // 直接翻转 重新构建loop数值上更不稳定
        if (loop->GetCapBound().GetRadius().degrees() > LOOP_MAX_CAP_DEGREES) {
            loop->Invert();
        }

        S2Error s2err;
        if (loop->FindValidationError(&s2err)) {
            warning("ring#") << i << " 不是合法的s2 loop, 仍然使用: " << s2err.text();
        }
        loops->push_back(std::move(loop));
    }
    return C_OK;
}

int Normalizer::polygonFromGeometry(const Geometry &geometry, std::unique_ptr<S2Polygon> *polygon, Error *err) {
    std::vector<std::unique_ptr<S2Loop>> loops;
    switch (geometry.type) {
        case GEOMETRY_TYPE_POLYGON:
        case GEOMETRY_TYPE_MULTI_POLYGON:
            for (const Polygon &p : geometry.polygons) {
                if (loopsFromPolygon(p, &loops, err) != C_OK) {
                    return C_ERR;
                }
            }
            break;
        default:
            return err->set(ERRNO_MALFORMED_GEOMETRY_UNSUPPORTED_KIND,
                            "needs Polygon or MultiPolygon");
    }

    // 所有的环放进同一个多边形 内外关系由嵌套决定
    auto ret = absl::make_unique<S2Polygon>();
    ret->set_s2debug_override(S2Debug::DISABLE);
    ret->InitNested(std::move(loops));
    *polygon = std::move(ret);
    return C_OK;
}
