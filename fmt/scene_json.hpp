#pragma once

#include "../core/scene.hpp"
#include "../core/serde.hpp"

#include <fstream>
#include <memory>
#include <sstream>
#include <string>

namespace splinerig::core::fmt {

template <typename T>
struct IDeserializable {
    static std::shared_ptr<T> deserialize(const serde::Fghj& data, serde::SerdeException* error) {
        auto obj = std::make_shared<T>();
        if (auto err = obj->deserializeFromFghj(data)) {
            if (error) *error = err;
            return nullptr;
        }
        return obj;
    }
};

// Returns nullptr and fills `error` when the document cannot be loaded.
template <typename T>
inline std::shared_ptr<T> loadJsonFromMemory(const std::string& data, serde::SerdeException* error = nullptr) {
    serde::Fghj pt;
    if (auto err = serde::parseJson(data, pt)) {
        if (error) *error = err;
        return nullptr;
    }
    return IDeserializable<T>::deserialize(pt, error);
}

template <typename T>
inline std::shared_ptr<T> loadJsonFile(const std::string& file, serde::SerdeException* error = nullptr) {
    std::ifstream ifs(file);
    if (!ifs) {
        if (error) *error = "cannot open " + file;
        return nullptr;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadJsonFromMemory<T>(buffer.str(), error);
}

serde::Fghj serializeResult(const SceneResult& result);
std::string toJson(const SceneResult& result, bool pretty = false);

} // namespace splinerig::core::fmt
