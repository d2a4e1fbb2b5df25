//
// Created by 刘立悟 on 2020/5/18.
//

#include "db.h"
#include "common.h"
#include "table.h"
#include "log.h"

using namespace geoLocate;

Db::Db() {
}

Db::~Db() {
    for (auto mapIter = this->tables.begin(); mapIter != this->tables.end(); mapIter++) {
        delete mapIter->second;
    }
    this->tables.clear();
}

Table *Db::registerTable(const std::string &name) {
    Table *tableObj = this->lookupTable(name);
    if (tableObj == nullptr) {
        tableObj = Table::createTable(name);
        this->tables[name] = tableObj;
    }
    return tableObj;
}

Table *Db::lookupTable(const std::string &name) const {
    auto mapIter = this->tables.find(name);
    if (mapIter != this->tables.end()) {
        return mapIter->second;
    }
    return nullptr;
}

bool Db::tableExists(const std::string &name) const {
    return this->tables.find(name) != this->tables.end();
}

void Db::put(int shapeId, const std::string &table, const Location &location, const Geometry &geometry) {
    Table *tableObj = this->registerTable(table);
    tableObj->put(shapeId, geometry);
    this->shapeId2Location[shapeId] = location;
}

const Location &Db::lookupLocation(int shapeId) const {
    auto mapIter = this->shapeId2Location.find(shapeId);
    if (mapIter == this->shapeId2Location.end()) {
        fatal("shape#") << shapeId << " 没有对应的Location";
    }
    return mapIter->second;
}

int Db::lookupGeometry(int shapeId, const std::string &table, const Geometry **geometry) const {
    Table *tableObj = this->lookupTable(table);
    if (tableObj == nullptr) {
        return C_ERR;
    }
    const Geometry *ret = tableObj->findGeometryByShapeId(shapeId);
    if (ret == nullptr) {
        return C_ERR;
    }
    *geometry = ret;
    return C_OK;
}

std::vector<std::string> Db::getTableNames() const {
    std::vector<std::string> names;
    for (auto mapIter = this->tables.begin(); mapIter != this->tables.end(); mapIter++) {
        names.push_back(mapIter->first);
    }
    return names;
}

uint64_t Db::getSize() const {
    return this->shapeId2Location.size();
}
