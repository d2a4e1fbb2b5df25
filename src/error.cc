//
// Created by liuliwu on 2026-10-19.
//

#include "error.h"

#include <sstream>

using namespace geoLocate;

Error::Error() {
    this->reset();
}

void Error::reset() {
    this->errorNo = ERRNO_OK;
    this->detail = "";
    this->index = ERROR_NO_INDEX;
    this->hasCoordinate = false;
    this->lon = 0;
    this->lat = 0;
    this->dataset = "";
}

// 返回C_ERR 方便 return err->set(...)
int Error::set(int errorNo) {
    this->errorNo = errorNo;
    return errorNo == ERRNO_OK ? C_OK : C_ERR;
}

int Error::set(int errorNo, const std::string &detail) {
    this->detail = detail;
    return this->set(errorNo);
}

void Error::setIndex(int index) {
    this->index = index;
}

void Error::setCoordinate(double lon, double lat) {
    this->hasCoordinate = true;
    this->lon = lon;
    this->lat = lat;
}

void Error::setDataset(const std::string &dataset) {
    this->dataset = dataset;
}

int Error::getErrorNo() const {
    return this->errorNo;
}

std::string Error::getMessage() const {
    return errorMessage(this->errorNo);
}

std::string Error::getDetail() const {
    return this->detail;
}

int Error::getIndex() const {
    return this->index;
}

bool Error::getHasCoordinate() const {
    return this->hasCoordinate;
}

double Error::getLon() const {
    return this->lon;
}

double Error::getLat() const {
    return this->lat;
}

std::string Error::getDataset() const {
    return this->dataset;
}

std::string Error::toString() const {
    std::ostringstream os;
    os << this->getMessage();
    if (!this->detail.empty()) {
        os << ": " << this->detail;
    }
    if (this->index != ERROR_NO_INDEX) {
        os << " [dataset#" << this->index << "]";
    }
    if (!this->dataset.empty()) {
        os << " [dataset=" << this->dataset << "]";
    }
    if (this->hasCoordinate) {
        os << " [lon=" << this->lon << ", lat=" << this->lat << "]";
    }
    return os.str();
}
