//
// Created by liuliwu on 2026-10-19.
//

#ifndef GEOLOCATE_GEOCODER_H
#define GEOLOCATE_GEOCODER_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "error.h"
#include "geometry.h"
#include "location.h"
#include "t_s2geometry.h"

namespace geoLocate {

    class Db;

    // 数据集的名字由调用方给出 load返回数据集的字节流
    struct DatasetLoader {
        std::string name;
        std::function<std::string()> load;
    };

    struct LocationWithGeometry {
        Location location;
        Geometry geometry;
    };

    /*
     * 反向地理编码: 坐标 -> 包含它的区域
     *
     * create成功之后不再修改 查询可以多线程并发 不需要加锁.
     * 多个数据集命中时按索引返回的顺序(也就是加载顺序)合并,
     * 每个字段取第一个非空的值. 想让更细的数据优先, 就先加载更细的数据集.
     */
    class Geocoder {
    private:
        S2Geometry::PolygonIndex *index;
        Db *db;

        Geocoder();
        int loadDataset(int i, const DatasetLoader &loader, Error *err);
        void combineLocations(const std::vector<int> &shapeIds, Location *ret) const;

    public:
        ~Geocoder();
        Geocoder(const Geocoder &) = delete;
        Geocoder &operator=(const Geocoder &) = delete;

        // 任何一个数据集失败都返回nullptr 错误里带着数据集的下标
        static Geocoder *create(const std::vector<DatasetLoader> &loaders, Error *err);

        // 不校验经纬度的范围
        int reverseGeocode(double lon, double lat, Location *ret, Error *err) const;
        int reverseGeocodeWithGeometry(double lon, double lat, const std::string &dataset,
                                       LocationWithGeometry *ret, Error *err) const;

        std::vector<std::string> getDatasetNames() const;
        uint64_t getSize() const;
    };
}

#endif //GEOLOCATE_GEOCODER_H
