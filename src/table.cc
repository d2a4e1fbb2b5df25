//
// Created by 刘立悟 on 2020/6/4.
//

#include "table.h"
#include "log.h"

using namespace geoLocate;

Table::Table(const std::string &name) {
    this->info = " {dataset(" + name + ")} ";
}

Table::~Table() {
    VLOG(1) << "销毁" << this->getInfo();
}

std::string Table::getInfo() const {
    return this->info;
}

void Table::put(int shapeId, const Geometry &geometry) {
    this->shapeId2Geometry[shapeId] = geometry;
}

const Geometry *Table::findGeometryByShapeId(int shapeId) const {
    auto mapIter = this->shapeId2Geometry.find(shapeId);
    if (mapIter != this->shapeId2Geometry.end()) {
        return &mapIter->second;
    }
    return nullptr;
}

uint64_t Table::getSize() const {
    return this->shapeId2Geometry.size();
}

Table *Table::createTable(const std::string &name) {
    return new Table(name);
}
