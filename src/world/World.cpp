/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/World.hpp"
#include "core/Logger.hpp"
#include "spatial/Quadtree.hpp"
#include "world/GridSerializer.hpp"
#include <algorithm>
#include <utility>

namespace Formicary {

World::World(int width, int height)
    : World(BitPackedGrid(width, height)) {}

World::World(int width, int height, const std::vector<uint8_t>& worldData)
    : World(BitPackedGrid(width, height, worldData)) {}

World::World(BitPackedGrid grid, int quadtreeCapacity, int quadtreeMaxDepth)
    : m_grid(std::move(grid)),
      m_quadtreeCapacity(static_cast<size_t>(std::max(quadtreeCapacity, 1))),
      m_quadtreeMaxDepth(quadtreeMaxDepth) {
    WORLD_DEBUG("Created " + std::to_string(m_grid.getWidth()) + "x" +
                std::to_string(m_grid.getHeight()) + " world");
}

std::unique_ptr<World> World::create(const WorldConfig& config) {
    if (!config.isValid()) {
        WORLD_ERROR("Refusing to create world from invalid configuration");
        return nullptr;
    }

    if (config.gridFile.empty()) {
        return std::make_unique<World>(BitPackedGrid(config.width, config.height),
                                       config.quadtreeCapacity, config.quadtreeMaxDepth);
    }

    auto grid = GridSerializer::load(config.gridFile);
    if (!grid) {
        WORLD_ERROR("Failed to load world grid from " + config.gridFile);
        return nullptr;
    }
    if (grid->getWidth() != config.width || grid->getHeight() != config.height) {
        WORLD_ERROR("Grid file " + config.gridFile + " is " + std::to_string(grid->getWidth()) +
                    "x" + std::to_string(grid->getHeight()) + ", configuration expects " +
                    std::to_string(config.width) + "x" + std::to_string(config.height));
        return nullptr;
    }
    return std::make_unique<World>(std::move(*grid), config.quadtreeCapacity,
                                   config.quadtreeMaxDepth);
}

Rectangle World::worldBounds() const {
    const float halfWidth = static_cast<float>(m_grid.getWidth()) / 2.0f;
    const float halfHeight = static_cast<float>(m_grid.getHeight()) / 2.0f;
    return Rectangle(halfWidth, halfHeight, halfWidth, halfHeight);
}

Layer& World::layerFor(const std::string& layerId) {
    auto it = m_layers.find(layerId);
    if (it != m_layers.end()) {
        return it->second;
    }

    Layer layer;
    layer.index = std::make_unique<Quadtree>(worldBounds(), m_quadtreeCapacity, m_quadtreeMaxDepth);
    WORLD_DEBUG("Created layer '" + layerId + "'");
    return m_layers.emplace(layerId, std::move(layer)).first->second;
}

void World::insert(Entity* entity, const std::string& layerId) {
    if (!entity) {
        WORLD_WARN("Ignoring insert of null entity into layer '" + layerId + "'");
        return;
    }

    Layer& layer = layerFor(layerId);
    layer.entities.insert(entity);
    if (!layer.index->insert(entity)) {
        WORLD_DEBUG("Entity " + std::to_string(entity->getID()) +
                    " is outside the world bounds; not indexed in '" + layerId + "'");
    }
    m_entities.push_back(entity);
}

Entity* World::remove(Entity* entity, const std::string& layerId) {
    auto globalIt = std::find(m_entities.begin(), m_entities.end(), entity);
    if (globalIt != m_entities.end()) {
        m_entities.erase(globalIt);
    }

    auto it = m_layers.find(layerId);
    if (it == m_layers.end()) {
        return nullptr;
    }

    Layer& layer = it->second;
    if (!layer.index->remove(entity)) {
        // Stale position since the last update; membership removal still applies
        WORLD_DEBUG("Entity not found in index of layer '" + layerId + "'");
    }
    layer.entities.erase(entity);
    return entity;
}

void World::update() {
    for (auto& [layerId, layer] : m_layers) {
        layer.rebuild();
    }
}

std::vector<Entity*> World::query(const Rectangle& range, const std::string& layerId) const {
    std::vector<Entity*> found;

    if (layerId == ALL_LAYERS) {
        for (const auto& [id, layer] : m_layers) {
            layer.index->query(range, found);
        }
        return found;
    }

    auto it = m_layers.find(layerId);
    if (it != m_layers.end()) {
        it->second.index->query(range, found);
    }
    return found;
}

std::vector<Entity*> World::nearby(const Entity& entity, float radius,
                                   const std::string& layerId) const {
    const Vector2D& position = entity.getPosition();
    return query(Rectangle(position.getX(), position.getY(), radius, radius), layerId);
}

bool World::hasLayer(const std::string& layerId) const {
    return m_layers.find(layerId) != m_layers.end();
}

std::vector<std::string> World::getLayerIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_layers.size());
    for (const auto& entry : m_layers) {
        ids.push_back(entry.first);
    }
    return ids;
}

const Layer* World::getLayer(const std::string& layerId) const {
    auto it = m_layers.find(layerId);
    return it != m_layers.end() ? &it->second : nullptr;
}

} // namespace Formicary
