//
// Created by 刘立悟 on 2020/5/18.
//

#ifndef GEOLOCATE_DB_H
#define GEOLOCATE_DB_H

#include <map>
#include <string>
#include <vector>
#include "geometry.h"
#include "location.h"

namespace geoLocate {

    class Table;

    // shape id -> Location, 按名字分组的数据集
    class Db {
    private:
        std::map<std::string, Table *> tables;
        std::map<int, Location> shapeId2Location;
    public:
        Db();
        ~Db();
        Db(const Db &) = delete;
        Db &operator=(const Db &) = delete;

        // 同名的数据集会合并 不报错
        Table *registerTable(const std::string &name);
        Table *lookupTable(const std::string &name) const;
        bool tableExists(const std::string &name) const;

        void put(int shapeId, const std::string &table, const Location &location, const Geometry &geometry);

        // 索引返回的shape id一定存在 找不到是bug
        const Location &lookupLocation(int shapeId) const;
        int lookupGeometry(int shapeId, const std::string &table, const Geometry **geometry) const;

        // 按字典序
        std::vector<std::string> getTableNames() const;
        uint64_t getSize() const;
    };
}

#endif //GEOLOCATE_DB_H
