//
// Created by liuliwu on 2026-10-19.
//

#include <cstring>
#include <memory>

#include "cli.h"
#include "common.h"
#include "payload.h"
#include "log.h"

using namespace geoLocate;

int Cli::parseDatasets(const std::string &datasets, std::vector<DatasetLoader> *loaders, Error *err) {
    for (const std::string &item : splitString(datasets, ';')) {
        std::string dataset = trimString(item, " \t");
        if (dataset.empty()) {
            continue;
        }
        size_t pos = dataset.find('=');
        if (pos == std::string::npos || pos == 0 || pos == dataset.size() - 1) {
            return err->set(ERRNO_CONFIG_ERR, "invalid dataset `" + dataset + "`, needs name=path");
        }
        DatasetLoader loader;
        loader.name = dataset.substr(0, pos);
        std::string path = dataset.substr(pos + 1);
        loader.load = [path]() {
            int errNo;
            std::string data = readFile(path, &errNo);
            if (errNo != 0) {
                error("无法打开数据文件" + path) << ": " << strerror(errNo) << "(" << errNo << ")";
            }
            return data;
        };
        loaders->push_back(loader);
    }
    if (loaders->empty()) {
        return err->set(ERRNO_CONFIG_ERR, "no datasets, use --datasets=name=path[;name=path]");
    }
    return C_OK;
}

Json *Cli::execute(const CliOptions &options) {
    Error err;
    std::vector<DatasetLoader> loaders;
    if (parseDatasets(options.datasets, &loaders, &err) != C_OK) {
        return createErrorReply(err);
    }

    std::unique_ptr<Geocoder> geocoder(Geocoder::create(loaders, &err));
    if (geocoder == nullptr) {
        return createErrorReply(err);
    }

    if (options.list) {
        return createListReply(*geocoder);
    }
    Json *reply = createLocateReply(*geocoder, options.lon, options.lat, options.dataset, &err);
    if (reply == nullptr) {
        return createErrorReply(err);
    }
    return reply;
}

Json *Cli::createListReply(const Geocoder &geocoder) {
    Json *reply = Json::createSuccessArrayJsonObj();
    for (const std::string &name : geocoder.getDatasetNames()) {
        reply->get("data").PushBack(reply->createString(name), reply->getAllocator());
    }
    return reply;
}

Json *Cli::createLocateReply(const Geocoder &geocoder, double lon, double lat,
                             const std::string &dataset, Error *err) {
    LocationWithGeometry ret;
    bool withGeometry = !dataset.empty();
    if (withGeometry) {
        if (geocoder.reverseGeocodeWithGeometry(lon, lat, dataset, &ret, err) != C_OK) {
            return nullptr;
        }
    }
    else if (geocoder.reverseGeocode(lon, lat, &ret.location, err) != C_OK) {
        return nullptr;
    }

    Json *reply = Json::createSuccessObjectJsonObj();
    rapidjson::Value &data = reply->get("data");
    rapidjson::Value location;
    ret.location.toJson(&location, reply->getAllocator());
    rapidjson::Value text = reply->createString(ret.location.toString());
    data.AddMember("location", location, reply->getAllocator());
    data.AddMember("text", text, reply->getAllocator());
    if (withGeometry) {
        rapidjson::Value geometry;
        Payload::encodeGeometry(ret.geometry, &geometry, reply->getAllocator());
        data.AddMember("geometry", geometry, reply->getAllocator());
    }
    return reply;
}

Json *Cli::createErrorReply(const Error &err) {
    return Json::createErrorJsonObj(err.getErrorNo(), err.toString());
}

std::string Cli::render(Json *reply, bool pretty) {
    return pretty ? reply->toPretty() : reply->toString();
}

int Cli::exitCode(Json *reply) {
    return reply->get("errno").GetInt() == ERRNO_OK ? 0 : 1;
}
