/**
 * @file configloader.cpp
 * @date October 2026
 * @brief Реализация загрузчика настроек из JSON
 */

#include "../include/configloader.hpp"

#include <fstream>
#include <sstream>

nlohmann::json ConfigLoader::loadFromFile(const std::string &filename) const {
  if (filename.empty()) {
    throw std::invalid_argument("ConfigLoader: empty file name");
  }

  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("ConfigLoader: Failed to open file " + filename);
  }
  return parseStream(file, filename);
}

nlohmann::json ConfigLoader::loadFromString(const std::string &text) const {
  std::istringstream in(text);
  return parseStream(in, "<string>");
}

nlohmann::json ConfigLoader::parseStream(std::istream &in,
                                         const std::string &origin) const {
  nlohmann::json config;
  try {
    in >> config;
  } catch (const nlohmann::json::parse_error &e) {
    std::stringstream ss;
    ss << "ConfigLoader: JSON parse error in " << origin << ": " << e.what()
       << " at byte " << e.byte;
    throw std::runtime_error(ss.str());
  }

  if (!config.is_object()) {
    throw std::runtime_error("ConfigLoader: root of " + origin +
                             " must be a JSON object");
  }
  return config;
}
