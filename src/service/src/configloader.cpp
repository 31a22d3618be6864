/**
 * @file configloader.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "../include/configloader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

nlohmann::json parseStream(std::istream &input) {
  try {
    nlohmann::json config;
    input >> config;
    return config;
  } catch (const nlohmann::json::parse_error &e) {
    std::stringstream ss;
    ss << "ConfigLoader: JSON parse error: " << e.what() << " at byte "
       << e.byte;
    throw std::runtime_error(ss.str());
  }
}

}  // namespace

nlohmann::json ConfigLoader::loadFromFile(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("ConfigLoader: Failed to open file " + filename);
  }

  return parseStream(file);
}

nlohmann::json ConfigLoader::loadFromString(const std::string &content) {
  std::istringstream stream(content);
  return parseStream(stream);
}
