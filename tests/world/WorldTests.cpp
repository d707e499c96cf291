/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WorldTests
#include <boost/test/unit_test.hpp>

#include "entities/Entity.hpp"
#include "spatial/Rectangle.hpp"
#include "world/World.hpp"
#include <algorithm>
#include <memory>
#include <vector>

using namespace Formicary;

namespace {

bool containsEntity(const std::vector<Entity*>& found, const Entity* entity) {
    return std::find(found.begin(), found.end(), entity) != found.end();
}

} // namespace

struct WorldFixture {
    WorldFixture() : world(100, 100) {}

    Entity* spawn(float x, float y) {
        entities.push_back(std::make_unique<Entity>(x, y));
        return entities.back().get();
    }

    // Entities must outlive the world's handles to them
    std::vector<std::unique_ptr<Entity>> entities;
    World world;
};

BOOST_AUTO_TEST_SUITE(WorldConstructionTests)

BOOST_AUTO_TEST_CASE(TestWorldBufferSize)
{
    World world(64, 64);
    BOOST_CHECK_EQUAL(world.getGrid().getByteLength(), 16384u);
    BOOST_CHECK_EQUAL(world.getWidth(), 64);
    BOOST_CHECK_EQUAL(world.getHeight(), 64);
    BOOST_CHECK_EQUAL(world.getLayerCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestWorldAcceptsPregeneratedBuffer)
{
    World world(5, 5, std::vector<uint8_t>(100));
    BOOST_CHECK_EQUAL(world.getGrid().getByteLength(), 100u);
}

BOOST_AUTO_TEST_CASE(TestWorldRejectsWrongSizedBuffer)
{
    BOOST_CHECK_THROW(World(5, 5, std::vector<uint8_t>(99)), SizeMismatchError);
}

BOOST_AUTO_TEST_CASE(TestTilePassthrough)
{
    World world(5, 5);
    world.setTileRaw(3, 3, 0xe009);
    world.setTileProp(3, 3, TileProp::ENTITY_TYPE, 5);
    BOOST_CHECK_EQUAL(world.getTileRaw(3, 3), 0xe005u);
    BOOST_CHECK_EQUAL(world.getTileProp(3, 3, TileProp::ENTITY_ID), 0xe00u);
    BOOST_CHECK_EQUAL(world.getTile(3, 3).entityType, 5u);
    BOOST_CHECK_THROW(world.getTileRaw(5, 5), TileIndexError);
}

BOOST_AUTO_TEST_CASE(TestCreateFromConfig)
{
    WorldConfig config;
    config.width = 32;
    config.height = 16;
    auto world = World::create(config);
    BOOST_REQUIRE(world != nullptr);
    BOOST_CHECK_EQUAL(world->getWidth(), 32);
    BOOST_CHECK_EQUAL(world->getHeight(), 16);

    config.width = 0;
    BOOST_CHECK(World::create(config) == nullptr);

    config.width = 32;
    config.gridFile = "/nonexistent/formicary/grid.bin";
    BOOST_CHECK(World::create(config) == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(WorldLayerTests, WorldFixture)

BOOST_AUTO_TEST_CASE(TestInsertCreatesDefaultLayer)
{
    Entity* ant = spawn(10.0f, 10.0f);
    world.insert(ant);

    BOOST_CHECK(world.hasLayer(World::DEFAULT_LAYER_ID));
    BOOST_CHECK_EQUAL(world.getLayerCount(), 1u);
    BOOST_REQUIRE_EQUAL(world.getEntities().size(), 1u);
    BOOST_CHECK_EQUAL(world.getEntities()[0], ant);

    const Layer* layer = world.getLayer(World::DEFAULT_LAYER_ID);
    BOOST_REQUIRE(layer != nullptr);
    BOOST_CHECK_EQUAL(layer->entities.count(ant), 1u);

    auto found = world.query(Rectangle(50.0f, 50.0f, 50.0f, 50.0f));
    BOOST_REQUIRE_EQUAL(found.size(), 1u);
    BOOST_CHECK_EQUAL(found[0], ant);
}

BOOST_AUTO_TEST_CASE(TestLayersAreCreatedLazily)
{
    world.insert(spawn(1.0f, 1.0f), "ants");
    world.insert(spawn(2.0f, 2.0f), "obstacles");
    world.insert(spawn(3.0f, 3.0f), "ants");

    BOOST_CHECK_EQUAL(world.getLayerCount(), 2u);
    BOOST_CHECK(world.hasLayer("ants"));
    BOOST_CHECK(world.hasLayer("obstacles"));
    BOOST_CHECK(!world.hasLayer(World::DEFAULT_LAYER_ID));

    auto ids = world.getLayerIds();
    BOOST_CHECK(std::find(ids.begin(), ids.end(), "ants") != ids.end());
    BOOST_CHECK(std::find(ids.begin(), ids.end(), "obstacles") != ids.end());
}

BOOST_AUTO_TEST_CASE(TestLayerIsolationAndAllQuery)
{
    Entity* a = spawn(20.0f, 20.0f);
    Entity* b = spawn(22.0f, 22.0f);
    world.insert(a, "A");
    world.insert(b, "B");

    Rectangle range(21.0f, 21.0f, 5.0f, 5.0f);
    auto inA = world.query(range, "A");
    auto inB = world.query(range, "B");
    auto inAll = world.query(range, World::ALL_LAYERS);

    BOOST_CHECK(containsEntity(inA, a));
    BOOST_CHECK(!containsEntity(inA, b));
    BOOST_CHECK(!containsEntity(inB, a));
    BOOST_CHECK(containsEntity(inB, b));
    BOOST_CHECK(containsEntity(inAll, a));
    BOOST_CHECK(containsEntity(inAll, b));
    BOOST_CHECK_EQUAL(inAll.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestAllQueryKeepsDuplicatesAcrossLayers)
{
    Entity* shared = spawn(40.0f, 40.0f);
    world.insert(shared, "A");
    world.insert(shared, "B");

    auto found = world.query(Rectangle(40.0f, 40.0f, 1.0f, 1.0f), World::ALL_LAYERS);
    BOOST_CHECK_EQUAL(std::count(found.begin(), found.end(), shared), 2);
    BOOST_CHECK_EQUAL(world.getEntities().size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestQueryUnknownLayerIsEmpty)
{
    world.insert(spawn(10.0f, 10.0f));
    BOOST_CHECK(world.query(Rectangle(50.0f, 50.0f, 50.0f, 50.0f), "missing").empty());
    BOOST_CHECK(world.nearby(*entities[0], 10.0f, "missing").empty());
}

BOOST_AUTO_TEST_CASE(TestEntityOutsideWorldJoinsLayerButIsNotIndexed)
{
    Entity* stray = spawn(150.0f, 10.0f);
    world.insert(stray, "ants");

    BOOST_CHECK_EQUAL(world.getLayer("ants")->entities.count(stray), 1u);
    BOOST_CHECK_EQUAL(world.getEntities().size(), 1u);
    BOOST_CHECK(world.query(Rectangle(150.0f, 10.0f, 5.0f, 5.0f), "ants").empty());

    // Once it walks back inside, a rebuild picks it up
    stray->setPosition(90.0f, 10.0f);
    world.update();
    BOOST_CHECK(containsEntity(world.query(Rectangle(90.0f, 10.0f, 1.0f, 1.0f), "ants"), stray));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(WorldRemoveTests, WorldFixture)

BOOST_AUTO_TEST_CASE(TestRemoveFromLayer)
{
    Entity* a = spawn(30.0f, 30.0f);
    Entity* b = spawn(31.0f, 31.0f);
    world.insert(a);
    world.insert(b);

    BOOST_CHECK_EQUAL(world.remove(a), a);

    auto found = world.query(Rectangle(30.0f, 30.0f, 5.0f, 5.0f));
    BOOST_CHECK(!containsEntity(found, a));
    BOOST_CHECK(containsEntity(found, b));
    BOOST_REQUIRE_EQUAL(world.getEntities().size(), 1u);
    BOOST_CHECK_EQUAL(world.getEntities()[0], b);
    BOOST_CHECK_EQUAL(world.getLayer(World::DEFAULT_LAYER_ID)->entities.count(a), 0u);
}

BOOST_AUTO_TEST_CASE(TestRemoveFromUnknownLayerReturnsNull)
{
    Entity* a = spawn(30.0f, 30.0f);
    world.insert(a, "ants");

    BOOST_CHECK(world.remove(a, "missing") == nullptr);
    // The global list entry is still dropped
    BOOST_CHECK(world.getEntities().empty());
    BOOST_CHECK(containsEntity(world.query(Rectangle(30.0f, 30.0f, 1.0f, 1.0f), "ants"), a));
}

BOOST_AUTO_TEST_CASE(TestRemoveLeavesOtherLayersAlone)
{
    Entity* a = spawn(60.0f, 60.0f);
    world.insert(a, "A");
    world.insert(a, "B");

    BOOST_CHECK_EQUAL(world.remove(a, "A"), a);
    Rectangle range(60.0f, 60.0f, 1.0f, 1.0f);
    BOOST_CHECK(world.query(range, "A").empty());
    BOOST_CHECK(containsEntity(world.query(range, "B"), a));
    BOOST_CHECK_EQUAL(world.getEntities().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestRemoveWithStalePositionStillDropsMembership)
{
    for (int i = 0; i < 12; ++i) {
        world.insert(spawn(5.0f + 7.0f * i, 5.0f + 7.0f * i));
    }
    Entity* mover = entities[0].get();
    mover->setPosition(95.0f, 5.0f);

    // Index lookup misses at the new position, membership removal proceeds
    BOOST_CHECK_EQUAL(world.remove(mover), mover);
    BOOST_CHECK_EQUAL(world.getLayer(World::DEFAULT_LAYER_ID)->entities.count(mover), 0u);

    world.update();
    auto found = world.query(Rectangle(50.0f, 50.0f, 50.0f, 50.0f));
    BOOST_CHECK(!containsEntity(found, mover));
    BOOST_CHECK_EQUAL(found.size(), 11u);
}

BOOST_AUTO_TEST_CASE(TestDoubleInsertIntoOneLayerOutlivesSingleRemove)
{
    Entity* ant = spawn(25.0f, 25.0f);
    world.insert(ant, "ants");
    world.insert(ant, "ants");

    const Rectangle around(25.0f, 25.0f, 1.0f, 1.0f);
    BOOST_CHECK_EQUAL(world.getLayer("ants")->entities.size(), 1u);
    BOOST_CHECK_EQUAL(world.query(around, "ants").size(), 2u);
    BOOST_CHECK_EQUAL(world.getEntities().size(), 2u);

    // One remove drops membership but leaves the second index copy behind
    BOOST_CHECK_EQUAL(world.remove(ant, "ants"), ant);
    BOOST_CHECK(world.getLayer("ants")->entities.empty());
    BOOST_CHECK(containsEntity(world.query(around, "ants"), ant));

    world.update();
    BOOST_CHECK(!containsEntity(world.query(around, "ants"), ant));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(WorldUpdateTests, WorldFixture)

BOOST_AUTO_TEST_CASE(TestUpdateFollowsMovedEntities)
{
    Entity* ant = spawn(10.0f, 10.0f);
    world.insert(ant, "ants");
    for (int i = 0; i < 20; ++i) {
        world.insert(spawn(50.0f + i, 50.0f), "ants");
    }

    ant->setPosition(80.0f, 80.0f);
    world.update();

    BOOST_CHECK(containsEntity(world.query(Rectangle(80.0f, 80.0f, 2.0f, 2.0f), "ants"), ant));
    BOOST_CHECK(!containsEntity(world.query(Rectangle(10.0f, 10.0f, 2.0f, 2.0f), "ants"), ant));
    BOOST_CHECK_EQUAL(world.query(Rectangle(50.0f, 50.0f, 50.0f, 50.0f), "ants").size(), 21u);
}

BOOST_AUTO_TEST_CASE(TestQueriesAreStaleUntilUpdate)
{
    Entity* ant = spawn(10.0f, 10.0f);
    world.insert(ant);
    // Force a subdivision so the ant sits in the north-west leaf
    world.insert(spawn(60.0f, 60.0f));
    world.insert(spawn(70.0f, 70.0f));
    world.insert(spawn(60.0f, 80.0f));
    world.insert(spawn(80.0f, 60.0f));

    ant->setPosition(90.0f, 90.0f);
    Rectangle target(90.0f, 90.0f, 2.0f, 2.0f);
    BOOST_CHECK(!containsEntity(world.query(target), ant));

    world.update();
    BOOST_CHECK(containsEntity(world.query(target), ant));
    BOOST_CHECK(!containsEntity(world.query(Rectangle(10.0f, 10.0f, 2.0f, 2.0f)), ant));
}

BOOST_AUTO_TEST_CASE(TestRepeatedUpdatesAreStable)
{
    for (int i = 0; i < 50; ++i) {
        world.insert(spawn(static_cast<float>(i * 2 % 100), static_cast<float>(i * 7 % 100)), "ants");
    }

    for (int tick = 0; tick < 10; ++tick) {
        for (auto& entity : entities) {
            const Vector2D pos = entity->getPosition();
            entity->setPosition(static_cast<float>((static_cast<int>(pos.getX()) + 3) % 100),
                                static_cast<float>((static_cast<int>(pos.getY()) + 5) % 100));
        }
        world.update();
        BOOST_CHECK_EQUAL(world.query(Rectangle(50.0f, 50.0f, 50.0f, 50.0f), "ants").size(), 50u);
    }
}

BOOST_AUTO_TEST_CASE(TestNearby)
{
    Entity* center = spawn(50.0f, 50.0f);
    Entity* close = spawn(53.0f, 47.0f);
    Entity* edge = spawn(55.0f, 55.0f);
    Entity* far = spawn(70.0f, 50.0f);
    world.insert(center);
    world.insert(close);
    world.insert(edge);
    world.insert(far);

    auto found = world.nearby(*center, 5.0f);
    BOOST_CHECK(containsEntity(found, center));
    BOOST_CHECK(containsEntity(found, close));
    BOOST_CHECK(containsEntity(found, edge));
    BOOST_CHECK(!containsEntity(found, far));
}

BOOST_AUTO_TEST_CASE(TestNearbyAcrossAllLayers)
{
    Entity* ant = spawn(20.0f, 20.0f);
    Entity* food = spawn(22.0f, 21.0f);
    world.insert(ant, "ants");
    world.insert(food, "food");

    BOOST_CHECK(!containsEntity(world.nearby(*ant, 3.0f, "ants"), food));
    BOOST_CHECK(containsEntity(world.nearby(*ant, 3.0f, World::ALL_LAYERS), food));
}

BOOST_AUTO_TEST_SUITE_END()
