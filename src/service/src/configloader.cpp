/**
 * @file configloader.cpp
 * @brief Реализация загрузчика конфигураций из JSON-файлов
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "configloader.hpp"

#include <fstream>
#include <sstream>

namespace procguard {

nlohmann::json ConfigLoader::loadFromFile(const std::string &filename) {
    if (filename.empty()) {
        throw std::invalid_argument("ConfigLoader: empty configuration file name");
    }
    nlohmann::json config = readFileContents(filename);
    lastLoadedFile = filename;
    return config;
}

nlohmann::json ConfigLoader::reload() const {
    if (lastLoadedFile.empty()) {
        throw std::runtime_error("ConfigLoader: no file specified for reload");
    }
    return readFileContents(lastLoadedFile);
}

std::string ConfigLoader::getLastLoadedFile() const { return lastLoadedFile; }

bool ConfigLoader::hasLoadedFile() const { return !lastLoadedFile.empty(); }

nlohmann::json ConfigLoader::readFileContents(
    const std::string &filename) const {
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("ConfigLoader: Failed to open file " + filename);
    }

    try {
        nlohmann::json config;
        file >> config;
        return config;
    } catch (const nlohmann::json::parse_error &e) {
        std::stringstream ss;
        ss << "ConfigLoader: JSON parse error in " << filename << ": " << e.what()
           << " at byte " << e.byte;
        throw std::runtime_error(ss.str());
    }
}

}  // namespace procguard
