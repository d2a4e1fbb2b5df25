//
// Created by liuliwu on 2020-06-02.
//

#ifndef GEOLOCATE_T_S2GEOMETRY_H
#define GEOLOCATE_T_S2GEOMETRY_H

#include <cstdint>
#include <memory>
#include <vector>
#include <s2/mutable_s2shape_index.h>
#include <s2/s2polygon.h>

namespace geoLocate {

    class S2Geometry {

    public:

        class PolygonIndex {
        private:
            MutableS2ShapeIndex *index;
        public:
            PolygonIndex();
            ~PolygonIndex();
            PolygonIndex(const PolygonIndex &) = delete;
            PolygonIndex &operator=(const PolygonIndex &) = delete;

            // 返回shape id 作为句柄 不会复用
            int addPolygon(std::unique_ptr<S2Polygon> polygon);
            // gps定位 结果按shape id升序
            int locatePolygon(double lat, double lon, std::vector<int> *ret) const;
            void flush();

            uint64_t getSize() const;
        };
    };
}


#endif //GEOLOCATE_T_S2GEOMETRY_H
