/**
 * @file test_gate_manager.cpp
 * @brief Unit tests for gate spawning, scrolling and eviction
 * @author Pichuka Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Pichuka. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Pichuka/Game/GateManager.hpp>
#include "TestHarness.hpp"

using namespace Pichuka;
using namespace Pichuka::Game;
using namespace Pichuka::Testing;

class GateManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        geometry = MakeFieldGeometry(400.0f);
        ExpectGateFits(geometry, settings);
    }

    Config::GateSettings settings;
    FieldGeometry geometry;
};

// ============================================================================
// Spawning
// ============================================================================

TEST_F(GateManagerTest, ShouldSpawnHonoursInterval) {
    EXPECT_TRUE(ShouldSpawn(0.0, std::nullopt, 1550.0));
    EXPECT_TRUE(ShouldSpawn(123456.0, std::nullopt, 1550.0));

    EXPECT_FALSE(ShouldSpawn(2549.0, 1000.0, 1550.0));
    EXPECT_TRUE(ShouldSpawn(2550.0, 1000.0, 1550.0));
    EXPECT_TRUE(ShouldSpawn(9000.0, 1000.0, 1550.0));
}

TEST_F(GateManagerTest, FirstSpawnIsImmediate) {
    GateManager gates(settings);
    ScriptedRandom random({0.5f});

    EXPECT_FALSE(gates.GetLastSpawnTime().has_value());
    EXPECT_TRUE(gates.MaybeSpawn(0.0, geometry, random));

    ASSERT_EQ(gates.GetGates().size(), 1u);
    EXPECT_FLOAT_EQ(gates.GetGates().front().x, 400.0f);
    ASSERT_TRUE(gates.GetLastSpawnTime().has_value());
    EXPECT_DOUBLE_EQ(*gates.GetLastSpawnTime(), 0.0);
}

TEST_F(GateManagerTest, SpawnWaitsForInterval) {
    GateManager gates(settings);
    ScriptedRandom random({0.5f});

    EXPECT_TRUE(gates.MaybeSpawn(1000.0, geometry, random));
    EXPECT_FALSE(gates.MaybeSpawn(1016.0, geometry, random));
    EXPECT_FALSE(gates.MaybeSpawn(2549.0, geometry, random));
    EXPECT_EQ(gates.GetGates().size(), 1u);
    EXPECT_DOUBLE_EQ(*gates.GetLastSpawnTime(), 1000.0);

    EXPECT_TRUE(gates.MaybeSpawn(2550.0, geometry, random));
    EXPECT_EQ(gates.GetGates().size(), 2u);
    EXPECT_DOUBLE_EQ(*gates.GetLastSpawnTime(), 2550.0);
}

TEST_F(GateManagerTest, TopHeightSpansAllowedRange) {
    GateManager gates(settings);
    ScriptedRandom random({0.0f, 0.5f, 1.0f});

    // Playable height 450: top height ranges over [70, 450 - 170 - 70] = [70, 210]
    gates.MaybeSpawn(0.0, geometry, random);
    gates.MaybeSpawn(2000.0, geometry, random);
    gates.MaybeSpawn(4000.0, geometry, random);
    ASSERT_EQ(gates.GetGates().size(), 3u);

    const Gate& lowest = gates.GetGates()[0];
    EXPECT_FLOAT_EQ(lowest.topHeight, 70.0f);
    EXPECT_FLOAT_EQ(lowest.bottomHeight, 210.0f);

    const Gate& middle = gates.GetGates()[1];
    EXPECT_FLOAT_EQ(middle.topHeight, 140.0f);
    EXPECT_FLOAT_EQ(middle.GapEnd(), 310.0f);
    EXPECT_FLOAT_EQ(middle.bottomHeight, 140.0f);

    const Gate& highest = gates.GetGates()[2];
    EXPECT_FLOAT_EQ(highest.topHeight, 210.0f);
    EXPECT_FLOAT_EQ(highest.bottomHeight, 70.0f);

    for (const auto& gate : gates.GetGates()) {
        EXPECT_FLOAT_EQ(gate.gapSize, 170.0f);
        EXPECT_GE(gate.topHeight, settings.minSegmentHeight);
        EXPECT_GE(gate.bottomHeight, settings.minSegmentHeight);
        EXPECT_FLOAT_EQ(gate.topHeight + gate.gapSize + gate.bottomHeight, geometry.PlayableHeight());
        EXPECT_FALSE(gate.scored);
    }
}

TEST_F(GateManagerTest, FieldMustHoldGapAndBothSegments) {
    EXPECT_TRUE(FieldFitsGate(geometry, settings));

    // 50 ground + 170 gap + 2 * 70 segments
    FieldGeometry tight = geometry;
    tight.fieldHeight = 360.0f;
    EXPECT_TRUE(FieldFitsGate(tight, settings));
    tight.fieldHeight = 359.0f;
    EXPECT_FALSE(FieldFitsGate(tight, settings));
}

TEST_F(GateManagerTest, CollapsedWindowDoesNotFit) {
    // A minimized window reports a 0x0 client area
    FieldGeometry minimized = geometry;
    minimized.fieldWidth = 0.0f;
    minimized.fieldHeight = 0.0f;
    EXPECT_FALSE(FieldFitsGate(minimized, settings));

    FieldGeometry narrow = geometry;
    narrow.fieldWidth = 0.0f;
    EXPECT_FALSE(FieldFitsGate(narrow, settings));
}

TEST_F(GateManagerTest, SegmentBounds) {
    Gate gate(100.0f, 140.0f, 170.0f, 140.0f);

    AABB top = gate.GetTopBounds(68.0f);
    EXPECT_FLOAT_EQ(top.Left(), 100.0f);
    EXPECT_FLOAT_EQ(top.Right(), 168.0f);
    EXPECT_FLOAT_EQ(top.Top(), 0.0f);
    EXPECT_FLOAT_EQ(top.Bottom(), 140.0f);

    AABB bottom = gate.GetBottomBounds(68.0f);
    EXPECT_FLOAT_EQ(bottom.Top(), 310.0f);
    EXPECT_FLOAT_EQ(bottom.Bottom(), 450.0f);
}

// ============================================================================
// Scrolling
// ============================================================================

TEST_F(GateManagerTest, AdvanceMovesEveryGateLeft) {
    GateManager gates(settings);
    ScriptedRandom random({0.5f});
    gates.MaybeSpawn(0.0, geometry, random);
    gates.GetGates().emplace_back(500.0f, 140.0f, 170.0f, 140.0f);

    // 2.4 * 60 * 0.05 = 7.2
    gates.Advance(0.05f, 60.0f);

    EXPECT_NEAR(gates.GetGates()[0].x, 392.8f, 1e-4);
    EXPECT_NEAR(gates.GetGates()[1].x, 492.8f, 1e-4);
}

// ============================================================================
// Eviction
// ============================================================================

TEST_F(GateManagerTest, GatesStillOnScreenAreKept) {
    GateManager gates(settings);
    gates.GetGates().emplace_back(-5.0f, 140.0f, 170.0f, 140.0f);
    gates.GetGates().emplace_back(50.0f, 140.0f, 170.0f, 140.0f);

    // Trailing edges 63 and 118 are both right of -10
    EXPECT_EQ(gates.Evict(), 0u);
    EXPECT_EQ(gates.GetGates().size(), 2u);
}

TEST_F(GateManagerTest, EvictionBoundaryIsExclusive) {
    GateManager gates(settings);
    gates.GetGates().emplace_back(-79.0f, 140.0f, 170.0f, 140.0f);   // trailing -11
    gates.GetGates().emplace_back(-78.0f, 140.0f, 170.0f, 140.0f);   // trailing -10
    gates.GetGates().emplace_back(-77.0f, 140.0f, 170.0f, 140.0f);   // trailing -9

    EXPECT_EQ(gates.Evict(), 2u);

    ASSERT_EQ(gates.GetGates().size(), 1u);
    EXPECT_FLOAT_EQ(gates.GetGates().front().x, -77.0f);
}

TEST_F(GateManagerTest, EvictionIsFifoAndMonotonic) {
    GateManager gates(settings);
    ScriptedRandom random({0.25f, 0.75f});

    size_t spawned = 0;
    size_t evicted = 0;
    for (double now = 0.0; now <= 20000.0; now += 50.0) {
        if (gates.MaybeSpawn(now, geometry, random)) {
            spawned++;
        }
        gates.Advance(0.05f, 60.0f);
        evicted += gates.Evict();

        const auto& active = gates.GetGates();
        EXPECT_EQ(active.size(), spawned - evicted);
        for (size_t i = 1; i < active.size(); ++i) {
            EXPECT_GE(active[i].x, active[i - 1].x);
        }
        for (const auto& gate : active) {
            EXPECT_GT(gate.TrailingEdge(settings.width), -settings.evictionMargin);
        }
    }

    EXPECT_GT(evicted, 0u);
    EXPECT_GT(spawned, evicted);
}

TEST_F(GateManagerTest, ResetClearsGatesAndSpawnTimer) {
    GateManager gates(settings);
    ScriptedRandom random({0.5f});
    gates.MaybeSpawn(1000.0, geometry, random);

    gates.Reset();

    EXPECT_TRUE(gates.GetGates().empty());
    EXPECT_FALSE(gates.GetLastSpawnTime().has_value());
    EXPECT_TRUE(gates.MaybeSpawn(1001.0, geometry, random));
}
