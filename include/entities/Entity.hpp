/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "utils/UniqueID.hpp"
#include "utils/Vector2D.hpp"

namespace Formicary {

using EntityID = UniqueID::IDType;

/**
 * @brief A mobile simulation object tracked by the world.
 *
 * Entities are owned by the simulation that creates them. The world, its
 * layers and their spatial indices only store non-owning Entity* handles,
 * and compare them by address, never by position. Copying is disabled so a
 * handle always denotes exactly one object.
 *
 * Moving an entity (setPosition) does not touch any spatial index; the
 * owner must call World::update() before relying on query results.
 */
class Entity {
public:
    Entity() : m_id(UniqueID::generate()) {}
    Entity(float x, float y) : m_id(UniqueID::generate()), m_position(x, y) {}
    explicit Entity(const Vector2D& position)
        : m_id(UniqueID::generate()), m_position(position) {}

    virtual ~Entity() = default;

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    EntityID getID() const { return m_id; }
    const Vector2D& getPosition() const { return m_position; }

    void setPosition(const Vector2D& position) { m_position = position; }
    void setPosition(float x, float y) { m_position = Vector2D(x, y); }

private:
    EntityID m_id;
    Vector2D m_position{0.0f, 0.0f};
};

} // namespace Formicary

#endif // ENTITY_HPP
