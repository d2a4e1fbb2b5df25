//
// Created by liuliwu on 2026-10-19.
//

#ifndef GEOLOCATE_ERROR_H
#define GEOLOCATE_ERROR_H

#include <string>
#include "common.h"

#define ERROR_NO_INDEX (-1)

namespace geoLocate {

    // 错误码 + 出错时的上下文
    class Error {
    private:
        int errorNo;
        std::string detail;
        int index; // 数据集加载器的下标
        bool hasCoordinate;
        double lon;
        double lat;
        std::string dataset;

    public:
        Error();
        ~Error() = default;

        void reset();
        int set(int errorNo);
        int set(int errorNo, const std::string &detail);
        void setIndex(int index);
        void setCoordinate(double lon, double lat);
        void setDataset(const std::string &dataset);

        int getErrorNo() const;
        std::string getMessage() const;
        std::string getDetail() const;
        int getIndex() const;
        bool getHasCoordinate() const;
        double getLon() const;
        double getLat() const;
        std::string getDataset() const;

        std::string toString() const;
    };
}

#endif //GEOLOCATE_ERROR_H
