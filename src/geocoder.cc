//
// Created by liuliwu on 2026-10-19.
//

#include <cstdio>
#include <memory>
#include <s2/s2polygon.h>

#include "geocoder.h"
#include "common.h"
#include "db.h"
#include "normalizer.h"
#include "payload.h"
#include "log.h"

using namespace geoLocate;

Geocoder::Geocoder() {
    this->index = new S2Geometry::PolygonIndex();
    this->db = new Db();
}

Geocoder::~Geocoder() {
    delete this->db;
    delete this->index;
}

Geocoder *Geocoder::create(const std::vector<DatasetLoader> &loaders, Error *err) {
    err->reset();
    auto geocoder = std::unique_ptr<Geocoder>(new Geocoder());
    for (size_t i = 0; i < loaders.size(); i++) {
        if (geocoder->loadDataset((int)i, loaders[i], err) != C_OK) {
            err->setIndex((int)i);
            err->setDataset(loaders[i].name);
            error("加载数据集#") << i << "(" << loaders[i].name << ")失败: " << err->toString();
            return nullptr;
        }
    }
    // 查询时不再触发索引的构建
    geocoder->index->flush();
    info("数据集加载完成, shapes: ") << geocoder->getSize();
    return geocoder.release();
}

int Geocoder::loadDataset(int i, const DatasetLoader &loader, Error *err) {
    long long start = ustime();
    if (!loader.load) {
        return err->set(ERRNO_EMPTY_PAYLOAD, "no loader");
    }
    std::string data = loader.load();
    std::vector<Feature> features;
    if (Payload::decode(data, &features, err) != C_OK) {
        return C_ERR;
    }

    this->db->registerTable(loader.name);
    for (size_t j = 0; j < features.size(); j++) {
        const Feature &feature = features[j];
        std::unique_ptr<S2Polygon> polygon;
        if (Normalizer::polygonFromGeometry(feature.geometry, &polygon, err) != C_OK) {
            return err->set(err->getErrorNo(), "feature#" + std::to_string(j) + " " + err->getDetail());
        }
        int shapeId = this->index->addPolygon(std::move(polygon));
        this->db->put(shapeId, loader.name, Location::fromProperties(feature.properties), feature.geometry);
    }

    long long duration = ustime() - start;
    char cost[128];
    snprintf(cost, sizeof(cost), "执行时间: %0.5f 毫秒", (double)duration / (double)1000);
    info("数据集#") << i << "(" << loader.name << ") 加载 " << features.size() << " 个feature, " << cost;
    return C_OK;
}

void Geocoder::combineLocations(const std::vector<int> &shapeIds, Location *ret) const {
    for (int shapeId : shapeIds) {
        ret->merge(this->db->lookupLocation(shapeId));
    }
}

int Geocoder::reverseGeocode(double lon, double lat, Location *ret, Error *err) const {
    // 同一个Error可能被反复使用 上一次的上下文不能留下
    err->reset();
    std::vector<int> shapeIds;
    this->index->locatePolygon(lat, lon, &shapeIds);
    if (shapeIds.empty()) {
        err->setCoordinate(lon, lat);
        return err->set(ERRNO_LOCATION_NOT_FOUND);
    }
    *ret = Location();
    this->combineLocations(shapeIds, ret);
    return C_OK;
}

int Geocoder::reverseGeocodeWithGeometry(double lon, double lat, const std::string &dataset,
                                         LocationWithGeometry *ret, Error *err) const {
    err->reset();
    if (dataset.empty()) {
        return err->set(ERRNO_MISSING_DATASET_PARAMETER);
    }
    if (!this->db->tableExists(dataset)) {
        err->setDataset(dataset);
        return err->set(ERRNO_DATASET_NOT_FOUND);
    }

    std::vector<int> shapeIds;
    this->index->locatePolygon(lat, lon, &shapeIds);
    if (shapeIds.empty()) {
        err->setCoordinate(lon, lat);
        return err->set(ERRNO_LOCATION_NOT_FOUND);
    }

    // 第一个属于这个数据集的shape
    const Geometry *geometry = nullptr;
    for (int shapeId : shapeIds) {
        if (this->db->lookupGeometry(shapeId, dataset, &geometry) == C_OK) {
            break;
        }
    }
    if (geometry == nullptr) {
        err->setCoordinate(lon, lat);
        err->setDataset(dataset);
        return err->set(ERRNO_GEOMETRY_NOT_FOUND_FOR_DATASET);
    }

    ret->location = Location();
    this->combineLocations(shapeIds, &ret->location);
    ret->geometry = *geometry;
    return C_OK;
}

std::vector<std::string> Geocoder::getDatasetNames() const {
    return this->db->getTableNames();
}

uint64_t Geocoder::getSize() const {
    return this->index->getSize();
}
