/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_CONFIG_HPP
#define WORLD_CONFIG_HPP

#include "spatial/Quadtree.hpp"
#include <optional>
#include <string>

namespace Formicary {

class JsonValue;

/**
 * @brief Construction parameters for a World.
 *
 * Loaded from the "world" object of a JSON file:
 *   { "world": { "width": 128, "height": 96, "quadtreeCapacity": 4,
 *                "quadtreeMaxDepth": 16, "gridFile": "colony.grid" } }
 * Missing keys keep their defaults.
 */
struct WorldConfig {
    int width{256};
    int height{256};
    int quadtreeCapacity{static_cast<int>(Quadtree::DEFAULT_CAPACITY)};
    int quadtreeMaxDepth{Quadtree::DEFAULT_MAX_DEPTH};
    std::string gridFile; // empty = start from a zeroed grid

    bool isValid() const;

    static std::optional<WorldConfig> fromJson(const JsonValue& root);
    static std::optional<WorldConfig> fromString(const std::string& json);
    static std::optional<WorldConfig> loadFromFile(const std::string& path);
};

} // namespace Formicary

#endif // WORLD_CONFIG_HPP
