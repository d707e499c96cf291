/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_HPP
#define WORLD_HPP

#include "entities/Entity.hpp"
#include "spatial/Rectangle.hpp"
#include "world/BitPackedGrid.hpp"
#include "world/Layer.hpp"
#include "world/WorldConfig.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Formicary {

/**
 * @brief Authoritative state of one simulation world.
 *
 * Owns the tile grid, an ordered list of every inserted entity handle, and
 * the named entity layers. Entities themselves belong to the caller and must
 * outlive their membership.
 *
 * Per tick the caller moves entities, then calls update() before issuing
 * query()/nearby(). Between updates, queries reflect positions as of the
 * last update plus any insert()/remove() since.
 *
 * Not thread-safe; serialize all access to one World.
 */
class World {
public:
    static constexpr const char* DEFAULT_LAYER_ID = "DEFAULT";
    // Pseudo layer id that queries every layer at once
    static constexpr const char* ALL_LAYERS = "ALL";

    World(int width, int height);

    /**
     * @brief Create a world over an existing grid buffer
     * @throws SizeMismatchError unless worldData.size() == width * height * 4
     */
    World(int width, int height, const std::vector<uint8_t>& worldData);

    explicit World(BitPackedGrid grid, int quadtreeCapacity = static_cast<int>(Quadtree::DEFAULT_CAPACITY),
                   int quadtreeMaxDepth = Quadtree::DEFAULT_MAX_DEPTH);

    /**
     * @brief Build a world from configuration, loading config.gridFile if set
     * @return nullptr (logged) if the config is invalid or the grid fails to load
     */
    static std::unique_ptr<World> create(const WorldConfig& config);

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // Entity layers

    /**
     * @brief Add an entity to a layer, creating the layer on first use
     *
     * New layers index the whole grid with a quadtree centered at
     * (width/2, height/2). The entity is also appended to the global list.
     */
    void insert(Entity* entity, const std::string& layerId = DEFAULT_LAYER_ID);

    /**
     * @brief Remove an entity from the global list and from one layer
     *
     * Other layers the entity belongs to are untouched.
     * @return The entity, or nullptr if the layer does not exist
     */
    Entity* remove(Entity* entity, const std::string& layerId = DEFAULT_LAYER_ID);

    /**
     * @brief Rebuild every layer's index from its members' current positions
     */
    void update();

    /**
     * @brief Entities whose indexed position lies inside range
     *
     * With ALL_LAYERS, results of every layer are concatenated; an entity
     * in several layers appears once per layer. Unknown layers yield nothing.
     */
    std::vector<Entity*> query(const Rectangle& range,
                               const std::string& layerId = DEFAULT_LAYER_ID) const;

    // Query a square of half extent radius centered on entity
    std::vector<Entity*> nearby(const Entity& entity, float radius,
                                const std::string& layerId = DEFAULT_LAYER_ID) const;

    const std::vector<Entity*>& getEntities() const { return m_entities; }
    bool hasLayer(const std::string& layerId) const;
    size_t getLayerCount() const { return m_layers.size(); }
    std::vector<std::string> getLayerIds() const;
    const Layer* getLayer(const std::string& layerId) const;

    // Tile grid

    int getWidth() const { return m_grid.getWidth(); }
    int getHeight() const { return m_grid.getHeight(); }
    BitPackedGrid& getGrid() { return m_grid; }
    const BitPackedGrid& getGrid() const { return m_grid; }

    Tile getTileRaw(int x, int y) const { return m_grid.getTileRaw(x, y); }
    void setTileRaw(int x, int y, Tile value) { m_grid.setTileRaw(x, y, value); }
    uint32_t getTileProp(int x, int y, TileProp prop) const { return m_grid.getTileProp(x, y, prop); }
    void setTileProp(int x, int y, TileProp prop, uint32_t value) { m_grid.setTileProp(x, y, prop, value); }
    TileFields getTile(int x, int y) const { return m_grid.getTile(x, y); }

private:
    Layer& layerFor(const std::string& layerId);
    Rectangle worldBounds() const;

    BitPackedGrid m_grid;
    size_t m_quadtreeCapacity;
    int m_quadtreeMaxDepth;

    std::vector<Entity*> m_entities;
    boost::container::flat_map<std::string, Layer> m_layers;
};

} // namespace Formicary

#endif // WORLD_HPP
