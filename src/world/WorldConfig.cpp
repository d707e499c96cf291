/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/WorldConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

namespace Formicary {

namespace {

bool readInt(const JsonValue& section, const char* key, int& out) {
    if (!section.hasKey(key)) {
        return true;
    }
    auto value = section[key].tryAsInt();
    if (!value) {
        CONFIG_ERROR(std::string("Key '") + key + "' must be an integer");
        return false;
    }
    out = *value;
    return true;
}

} // namespace

bool WorldConfig::isValid() const {
    return width > 0 && height > 0 && quadtreeCapacity > 0 && quadtreeMaxDepth >= 0;
}

std::optional<WorldConfig> WorldConfig::fromJson(const JsonValue& root) {
    const JsonValue& section = root["world"];
    if (!section.isObject()) {
        CONFIG_ERROR("Missing 'world' object in configuration");
        return std::nullopt;
    }

    WorldConfig config;
    if (!readInt(section, "width", config.width) ||
        !readInt(section, "height", config.height) ||
        !readInt(section, "quadtreeCapacity", config.quadtreeCapacity) ||
        !readInt(section, "quadtreeMaxDepth", config.quadtreeMaxDepth)) {
        return std::nullopt;
    }

    if (section.hasKey("gridFile")) {
        auto gridFile = section["gridFile"].tryAsString();
        if (!gridFile) {
            CONFIG_ERROR("Key 'gridFile' must be a string");
            return std::nullopt;
        }
        config.gridFile = *gridFile;
    }

    if (!config.isValid()) {
        CONFIG_ERROR("Invalid world configuration: " + std::to_string(config.width) + "x" +
                     std::to_string(config.height) + ", capacity " +
                     std::to_string(config.quadtreeCapacity) + ", max depth " +
                     std::to_string(config.quadtreeMaxDepth));
        return std::nullopt;
    }
    return config;
}

std::optional<WorldConfig> WorldConfig::fromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CONFIG_ERROR("Failed to parse configuration: " + reader.getLastError());
        return std::nullopt;
    }
    return fromJson(reader.getRoot());
}

std::optional<WorldConfig> WorldConfig::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        CONFIG_ERROR("Failed to load configuration '" + path + "': " + reader.getLastError());
        return std::nullopt;
    }
    auto config = fromJson(reader.getRoot());
    if (config) {
        CONFIG_INFO("Loaded world configuration from " + path);
    }
    return config;
}

} // namespace Formicary
