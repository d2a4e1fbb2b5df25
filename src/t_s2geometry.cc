//
// Created by liuliwu on 2020-06-02.
//

#include <s2/s2contains_point_query.h>
#include <s2/s2latlng.h>
#include <absl/memory/memory.h>

#include "t_s2geometry.h"
#include "common.h"
#include "log.h"

using namespace geoLocate;


// polygon index
S2Geometry::PolygonIndex::PolygonIndex() {
    this->index = new MutableS2ShapeIndex();
}

S2Geometry::PolygonIndex::~PolygonIndex() {
    this->index->Clear();
    delete this->index;
}

int S2Geometry::PolygonIndex::addPolygon(std::unique_ptr<S2Polygon> polygon) {
    return this->index->Add(absl::make_unique<S2Polygon::OwningShape>(std::move(polygon)));
}

int S2Geometry::PolygonIndex::locatePolygon(double lat, double lon, std::vector<int> *ret) const {
    S2LatLng latlng = S2LatLng::FromDegrees(lat, lon);
    // 顶点不算在多边形内
    // 边上的点按S2的半开规则只归边的一侧 相邻区域的公共边界恰好命中一个
    S2ContainsPointQuery<MutableS2ShapeIndex> query = MakeS2ContainsPointQuery(
            this->index, S2ContainsPointQueryOptions(S2VertexModel::OPEN));
    for (S2Shape *shape : query.GetContainingShapes(latlng.ToPoint())) {
        VLOG(2) << "locate shape#" << shape->id();
        ret->push_back(shape->id());
    }
    return C_OK;
}

void S2Geometry::PolygonIndex::flush() {
    this->index->ForceBuild();
}

uint64_t S2Geometry::PolygonIndex::getSize() const {
    return this->index->num_shape_ids();
}
