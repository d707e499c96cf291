/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef LAYER_HPP
#define LAYER_HPP

#include "entities/Entity.hpp"
#include "spatial/EntityStorage.hpp"
#include <memory>
#include <unordered_set>

namespace Formicary {

/**
 * @brief One named spatial partition of the world.
 *
 * `entities` is the membership set (by identity), `index` the spatial index
 * over the same entities. The two drift apart whenever members move; the
 * world resynchronizes them by rebuilding the index on every update().
 */
struct Layer {
    std::unordered_set<Entity*> entities;
    std::unique_ptr<EntityStorage> index;

    void rebuild() {
        index->clear();
        for (Entity* entity : entities) {
            index->insert(entity);
        }
    }
};

} // namespace Formicary

#endif // LAYER_HPP
