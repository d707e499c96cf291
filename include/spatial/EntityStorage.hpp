/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_STORAGE_HPP
#define ENTITY_STORAGE_HPP

#include "entities/Entity.hpp"
#include "spatial/Rectangle.hpp"
#include <vector>

namespace Formicary {

/**
 * @brief Spatial index over non-owning entity handles.
 *
 * Any implementation can back a world layer. Entities are matched by
 * address; an index never takes ownership.
 */
class EntityStorage {
public:
    virtual ~EntityStorage() = default;

    /**
     * @brief Index an entity at its current position
     * @return false if the position lies outside the indexed region
     */
    virtual bool insert(Entity* entity) = 0;

    /**
     * @brief Remove an entity, looked up at its current position
     * @return The removed entity, or nullptr if it was not found
     */
    virtual Entity* remove(Entity* entity) = 0;

    /**
     * @brief Drop every indexed entity
     */
    virtual void clear() = 0;

    /**
     * @brief Append every indexed entity whose position lies inside range
     */
    virtual void query(const Rectangle& range, std::vector<Entity*>& found) const = 0;

    std::vector<Entity*> query(const Rectangle& range) const {
        std::vector<Entity*> found;
        query(range, found);
        return found;
    }
};

} // namespace Formicary

#endif // ENTITY_STORAGE_HPP
