//
// Created by 刘立悟 on 2020/6/4.
//

#ifndef GEOLOCATE_TABLE_H
#define GEOLOCATE_TABLE_H

#include <cstdint>
#include <map>
#include <string>
#include "geometry.h"

namespace geoLocate {

    // 一个数据集: shape id -> 原始几何
    class Table {
    private:
        std::map<int, Geometry> shapeId2Geometry;
        std::string info;

    public:
        explicit Table(const std::string &name);
        ~Table();
        std::string getInfo() const;

        void put(int shapeId, const Geometry &geometry);
        const Geometry *findGeometryByShapeId(int shapeId) const;

        uint64_t getSize() const;

        static Table *createTable(const std::string &name);
    };
}

#endif //GEOLOCATE_TABLE_H
