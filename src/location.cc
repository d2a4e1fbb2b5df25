//
// Created by liuliwu on 2026-10-19.
//

#include "location.h"

using namespace geoLocate;

static void mergeField(std::string *field, const std::string &value) {
    if (field->empty()) {
        *field = value;
    }
}

static void addJsonField(rapidjson::Value *obj, rapidjson::Document::AllocatorType &allocator,
                         const char *key, const std::string &value) {
    if (value.empty()) {
        return;
    }
    rapidjson::Value v(value.c_str(), (rapidjson::SizeType)value.size(), allocator);
    obj->AddMember(rapidjson::StringRef(key), v, allocator);
}

std::string geoLocate::getPropertyString(const Properties &properties, std::initializer_list<const char *> keys) {
    for (const char *key : keys) {
        auto mapIter = properties.find(key);
        if (mapIter != properties.end() && mapIter->second.type == PROPERTY_TYPE_STRING) {
            return mapIter->second.str;
        }
    }
    return "";
}

Location Location::fromProperties(const Properties &properties) {
    Location loc;
    loc.country = getPropertyString(properties, {"ADMIN", "admin"});
    loc.countryLong = getPropertyString(properties, {"FORMAL_EN"});
    loc.countryCode2 = getPropertyString(properties, {"ISO_A2"});
    loc.countryCode3 = getPropertyString(properties, {"ISO_A3"});
    loc.continent = getPropertyString(properties, {"CONTINENT"});
    loc.region = getPropertyString(properties, {"REGION_UN"});
    loc.subregion = getPropertyString(properties, {"SUBREGION"});
    loc.province = getPropertyString(properties, {"name"});
    loc.provinceCode = getPropertyString(properties, {"iso_3166_2"});

    // 数据集里为了区分重名的城市 名字后面加了2
    loc.city = getPropertyString(properties, {"name_conve"});
    if (!loc.city.empty() && loc.city[loc.city.size() - 1] == '2') {
        loc.city.erase(loc.city.size() - 1);
    }

    if (getPropertyString(properties, {"TYPE", "type"}) == LOCATION_COUNTY_TYPE) {
        loc.county = getPropertyString(properties, {"NAME"});
    }
    return loc;
}

bool Location::empty() const {
    return country.empty() && countryLong.empty() &&
           countryCode2.empty() && countryCode3.empty() &&
           continent.empty() && region.empty() && subregion.empty() &&
           province.empty() && provinceCode.empty() &&
           county.empty() && city.empty();
}

void Location::merge(const Location &other) {
    mergeField(&country, other.country);
    mergeField(&countryLong, other.countryLong);
    mergeField(&countryCode2, other.countryCode2);
    mergeField(&countryCode3, other.countryCode3);
    mergeField(&continent, other.continent);
    mergeField(&region, other.region);
    mergeField(&subregion, other.subregion);
    mergeField(&province, other.province);
    mergeField(&provinceCode, other.provinceCode);
    mergeField(&county, other.county);
    mergeField(&city, other.city);
}

std::string Location::toString() const {
    std::string ret = LOCATION_PREFIX;
    if (this->empty()) {
        return ret + " Empty Location";
    }

    if (!city.empty()) {
        ret += " " + city + ",";
    }
    if (!province.empty()) {
        ret += " " + province + ",";
    }

    // 国家名
    if (!country.empty()) {
        ret += " " + country;
    }
    else if (!countryLong.empty()) {
        ret += " " + countryLong;
    }

    // 括号里的国家代码
    if (!countryCode3.empty()) {
        ret += " (" + countryCode3 + ")";
    }
    else if (!countryCode2.empty()) {
        ret += " (" + countryCode2 + ")";
    }

    // 大洲/区域
    std::string area;
    if (!continent.empty()) {
        area = continent;
    }
    else if (!region.empty()) {
        area = region;
    }
    else if (!subregion.empty()) {
        area = subregion;
    }
    if (!area.empty()) {
        if (ret.size() > sizeof(LOCATION_PREFIX) - 1 && ret[ret.size() - 1] != ',') {
            ret += ",";
        }
        ret += " " + area;
    }

    return ret;
}

void Location::toJson(rapidjson::Value *obj, rapidjson::Document::AllocatorType &allocator) const {
    obj->SetObject();
    addJsonField(obj, allocator, "country", country);
    addJsonField(obj, allocator, "country_long", countryLong);
    addJsonField(obj, allocator, "country_code_2", countryCode2);
    addJsonField(obj, allocator, "country_code_3", countryCode3);
    addJsonField(obj, allocator, "continent", continent);
    addJsonField(obj, allocator, "region", region);
    addJsonField(obj, allocator, "subregion", subregion);
    addJsonField(obj, allocator, "province", province);
    addJsonField(obj, allocator, "province_code", provinceCode);
    addJsonField(obj, allocator, "county", county);
    addJsonField(obj, allocator, "city", city);
}
