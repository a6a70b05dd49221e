/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AgentOrchestratorTests
#include <boost/test/unit_test.hpp>

#include "agent/AgentOrchestrator.hpp"
#include "core/Errors.hpp"
#include "mocks/MockCognitiveModules.hpp"
#include "world/WorldGrid.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace Smallville;
using namespace Smallville::Testing;
namespace fs = std::filesystem;

namespace {

WorldGridConfig makeParkConfig() {
    WorldGridConfig config;
    config.width = 3;
    config.height = 3;
    config.tileSize = 1;
    config.worldName = "Town";
    config.collisionLayer.assign(9, "0");
    config.sectorLayer.assign(9, "100");
    config.arenaLayer = {"0", "0", "0", "0", "200", "0", "0", "0", "0"};
    config.gameObjectLayer = {"0", "0", "0", "0", "300", "0", "0", "0", "0"};
    config.spawningLocationLayer.assign(9, "0");
    config.sectorNames = {{"100", "park"}};
    config.arenaNames = {{"200", "bench"}};
    config.gameObjectNames = {{"300", "chessboard"}};
    return config;
}

std::vector<std::string> pipeline() {
    return {"perceive", "retrieve", "plan", "reflect", "execute"};
}

} // anonymous namespace

class OrchestratorTestFixture {
public:
    OrchestratorTestFixture()
        : world(makeParkConfig()),
          agent("Isabella Rodriguez", SpatialMemory{}, AssociativeMemory{},
                ScratchMemory("Isabella Rodriguez"), mocks.modules()),
          snapshotDir(fs::temp_directory_path() / "smallville_orchestrator_test") {
        fs::remove_all(snapshotDir);
    }

    ~OrchestratorTestFixture() {
        std::error_code ec;
        fs::remove_all(snapshotDir, ec);
    }

protected:
    const std::vector<std::string>& calls() const { return mocks.log->calls; }

    MockModuleSet mocks;
    WorldGrid world;
    AgentRoster peers;
    AgentOrchestrator agent;
    fs::path snapshotDir;

    const SimTime morning = makeSimTime(2023, 2, 13, 8, 0, 0);
    const SimTime evening = makeSimTime(2023, 2, 13, 22, 30, 0);
    const SimTime nextMorning = makeSimTime(2023, 2, 14, 7, 0, 0);
};

BOOST_FIXTURE_TEST_SUITE(TickPipelineTests, OrchestratorTestFixture)

BOOST_AUTO_TEST_CASE(TestCallOrder) {
    const AgentAction action = agent.tick(world, peers, {1, 1}, morning);

    const std::vector<std::string> expected = pipeline();
    BOOST_CHECK_EQUAL_COLLECTIONS(calls().begin(), calls().end(), expected.begin(),
                                  expected.end());
    BOOST_REQUIRE(std::holds_alternative<MoveAction>(action));
    BOOST_CHECK_EQUAL(std::get<MoveAction>(action).target, (TileCoord{2, 2}));
    BOOST_CHECK_EQUAL(agent.phase(), TickPhase::Idle);
}

BOOST_AUTO_TEST_CASE(TestEveryModuleCalledOncePerTick) {
    agent.tick(world, peers, {1, 1}, morning);
    agent.tick(world, peers, {1, 2}, evening);

    BOOST_CHECK_EQUAL(mocks.perceiver->callCount, 2);
    BOOST_CHECK_EQUAL(mocks.retriever->callCount, 2);
    BOOST_CHECK_EQUAL(mocks.planner->callCount, 2);
    BOOST_CHECK_EQUAL(mocks.reflector->callCount, 2);
    BOOST_CHECK_EQUAL(mocks.executor->callCount, 2);
    BOOST_CHECK_EQUAL(mocks.conversation->callCount, 0);
    BOOST_CHECK_EQUAL(calls().size(), 10u);
}

BOOST_AUTO_TEST_CASE(TestWorkingStateUpdated) {
    agent.tick(world, peers, {1, 1}, morning);

    const AgentWorkingState& state = agent.workingState();
    BOOST_REQUIRE(state.currentTile.has_value());
    BOOST_CHECK_EQUAL(*state.currentTile, (TileCoord{1, 1}));
    BOOST_REQUIRE(state.currentTime.has_value());
    BOOST_CHECK(*state.currentTime == morning);
}

BOOST_AUTO_TEST_CASE(TestDataFlowsBetweenPhases) {
    agent.tick(world, peers, {1, 1}, morning);

    // vision 4 covers the whole grid; the chessboard carries one idle event
    BOOST_CHECK_EQUAL(mocks.retriever->lastPerceivedCount, 1u);
    BOOST_CHECK_EQUAL(mocks.planner->lastRetrievedCount, 1u);
    BOOST_CHECK_EQUAL(mocks.executor->lastPlan.actAddress, "Town:park:bench");
    BOOST_CHECK(agent.spatialMemory().knows("Town:park:bench:chessboard"));
    BOOST_CHECK_EQUAL(agent.associativeMemory().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestPeersPassedThrough) {
    MockModuleSet otherMocks;
    AgentOrchestrator klaus("Klaus Mueller", SpatialMemory{}, AssociativeMemory{},
                            ScratchMemory("Klaus Mueller"), otherMocks.modules());
    peers.emplace(klaus.name(), &klaus);

    agent.tick(world, peers, {1, 1}, morning);
    BOOST_CHECK_EQUAL(mocks.planner->lastPeerCount, 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DayFlagTests, OrchestratorTestFixture)

BOOST_AUTO_TEST_CASE(TestFirstDaySameDayNewDay) {
    agent.tick(world, peers, {1, 1}, morning);
    BOOST_CHECK_EQUAL(agent.lastDayFlag(), DayFlag::FirstDay);

    agent.tick(world, peers, {1, 1}, evening);
    BOOST_CHECK_EQUAL(agent.lastDayFlag(), DayFlag::NoSignal);

    agent.tick(world, peers, {1, 1}, nextMorning);
    BOOST_CHECK_EQUAL(agent.lastDayFlag(), DayFlag::NewDay);

    const std::vector<DayFlag> expected{DayFlag::FirstDay, DayFlag::NoSignal, DayFlag::NewDay};
    BOOST_CHECK_EQUAL_COLLECTIONS(mocks.planner->dayFlags.begin(), mocks.planner->dayFlags.end(),
                                  expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestDayFlagFor) {
    BOOST_CHECK_EQUAL(AgentOrchestrator::dayFlagFor(std::nullopt, morning), DayFlag::FirstDay);
    BOOST_CHECK_EQUAL(AgentOrchestrator::dayFlagFor(morning, evening), DayFlag::NoSignal);
    BOOST_CHECK_EQUAL(AgentOrchestrator::dayFlagFor(evening, nextMorning), DayFlag::NewDay);

    // Midnight belongs to the new day
    BOOST_CHECK_EQUAL(AgentOrchestrator::dayFlagFor(makeSimTime(2023, 2, 13, 23, 59, 59),
                                                    makeSimTime(2023, 2, 14)),
                      DayFlag::NewDay);

    // Same month and day a year apart is still a different day
    BOOST_CHECK_EQUAL(AgentOrchestrator::dayFlagFor(morning, makeSimTime(2024, 2, 13, 8)),
                      DayFlag::NewDay);

    // Going back in time to another day counts as a new day too
    BOOST_CHECK_EQUAL(AgentOrchestrator::dayFlagFor(nextMorning, morning), DayFlag::NewDay);
}

BOOST_AUTO_TEST_CASE(TestStoredTimeSeedsFlag) {
    agent.workingState().currentTime = evening;
    agent.tick(world, peers, {1, 1}, nextMorning);
    BOOST_CHECK_EQUAL(agent.lastDayFlag(), DayFlag::NewDay);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TickFailureTests, OrchestratorTestFixture)

BOOST_AUTO_TEST_CASE(TestPlanningFailureSkipsReflectAndExecute) {
    mocks.planner->failure = MockFailure::Collaborator;

    try {
        agent.tick(world, peers, {1, 1}, morning);
        BOOST_FAIL("Expected CollaboratorFailure");
    } catch (const CollaboratorFailure& e) {
        BOOST_CHECK_EQUAL(e.phase(), TickPhase::Planning);
    }

    BOOST_CHECK_EQUAL(mocks.reflector->callCount, 0);
    BOOST_CHECK_EQUAL(mocks.executor->callCount, 0);
    const std::vector<std::string> expected{"perceive", "retrieve", "plan"};
    BOOST_CHECK_EQUAL_COLLECTIONS(calls().begin(), calls().end(), expected.begin(),
                                  expected.end());
    BOOST_CHECK_EQUAL(agent.phase(), TickPhase::Idle);
}

BOOST_AUTO_TEST_CASE(TestForeignExceptionIsWrapped) {
    mocks.retriever->failure = MockFailure::Runtime;

    try {
        agent.tick(world, peers, {1, 1}, morning);
        BOOST_FAIL("Expected CollaboratorFailure");
    } catch (const CollaboratorFailure& e) {
        BOOST_CHECK_EQUAL(e.phase(), TickPhase::Retrieving);
        BOOST_CHECK(std::string(e.what()).find("retrieve timed out") != std::string::npos);
    }

    BOOST_CHECK_EQUAL(mocks.planner->callCount, 0);
    BOOST_CHECK_EQUAL(agent.phase(), TickPhase::Idle);
}

BOOST_AUTO_TEST_CASE(TestEachPhaseIsReported) {
    struct Case {
        MockModuleBase* module;
        TickPhase phase;
    };
    const Case cases[] = {
        {mocks.perceiver.get(), TickPhase::Perceiving},
        {mocks.retriever.get(), TickPhase::Retrieving},
        {mocks.planner.get(), TickPhase::Planning},
        {mocks.reflector.get(), TickPhase::Reflecting},
        {mocks.executor.get(), TickPhase::Executing},
    };

    for (const Case& c : cases) {
        BOOST_TEST_CONTEXT("phase " << c.phase) {
            c.module->failure = MockFailure::Runtime;
            try {
                agent.tick(world, peers, {1, 1}, morning);
                BOOST_FAIL("Expected CollaboratorFailure");
            } catch (const CollaboratorFailure& e) {
                BOOST_CHECK_EQUAL(e.phase(), c.phase);
            }
            c.module->failure = MockFailure::None;
            BOOST_CHECK_EQUAL(agent.phase(), TickPhase::Idle);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestStateNotRolledBack) {
    agent.tick(world, peers, {1, 1}, morning);

    mocks.perceiver->failure = MockFailure::Collaborator;
    BOOST_CHECK_THROW(agent.tick(world, peers, {0, 2}, nextMorning), CollaboratorFailure);

    BOOST_REQUIRE(agent.workingState().currentTile.has_value());
    BOOST_CHECK_EQUAL(*agent.workingState().currentTile, (TileCoord{0, 2}));
    BOOST_CHECK(*agent.workingState().currentTime == nextMorning);
    BOOST_CHECK_EQUAL(agent.lastDayFlag(), DayFlag::NewDay);

    // The next tick sees the failed tick's time as its predecessor
    mocks.perceiver->failure = MockFailure::None;
    agent.tick(world, peers, {0, 2}, nextMorning);
    BOOST_CHECK_EQUAL(agent.lastDayFlag(), DayFlag::NoSignal);
}

BOOST_AUTO_TEST_CASE(TestReentrantTickRejected) {
    bool rejected = false;
    mocks.planner->onCall = [&](AgentContext&) {
        try {
            agent.tick(world, peers, {0, 0}, evening);
        } catch (const std::logic_error&) {
            rejected = true;
        }
    };

    const AgentAction action = agent.tick(world, peers, {1, 1}, morning);

    BOOST_CHECK(rejected);
    BOOST_CHECK(std::holds_alternative<MoveAction>(action));
    // The rejected call left the running tick alone
    BOOST_CHECK_EQUAL(*agent.workingState().currentTile, (TileCoord{1, 1}));
    BOOST_CHECK(*agent.workingState().currentTime == morning);
    BOOST_CHECK_EQUAL(mocks.planner->callCount, 1);
    BOOST_CHECK_EQUAL(mocks.executor->callCount, 1);
}

BOOST_AUTO_TEST_CASE(TestIncompleteModulesRejected) {
    CognitiveModules modules = mocks.modules();
    modules.reflector.reset();

    BOOST_CHECK_THROW(AgentOrchestrator("Nobody", SpatialMemory{}, AssociativeMemory{},
                                        ScratchMemory("Nobody"), modules),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ConversationTests, OrchestratorTestFixture)

BOOST_AUTO_TEST_CASE(TestOpenConversation) {
    agent.openConversation(ConversationMode::Analysis);
    agent.openConversation(ConversationMode::Whisper);

    const std::vector<ConversationMode> expected{ConversationMode::Analysis,
                                                 ConversationMode::Whisper};
    BOOST_CHECK_EQUAL_COLLECTIONS(mocks.conversation->modes.begin(),
                                  mocks.conversation->modes.end(), expected.begin(),
                                  expected.end());
    BOOST_CHECK_EQUAL(agent.associativeMemory().latest(MemoryKind::Thought, 10).size(), 1u);
    BOOST_CHECK_EQUAL(mocks.planner->callCount, 0);
    BOOST_CHECK_EQUAL(agent.phase(), TickPhase::Idle);
}

BOOST_AUTO_TEST_CASE(TestConversationFailure) {
    mocks.conversation->failure = MockFailure::Runtime;

    try {
        agent.openConversation(ConversationMode::Analysis);
        BOOST_FAIL("Expected CollaboratorFailure");
    } catch (const CollaboratorFailure& e) {
        BOOST_CHECK_EQUAL(e.phase(), TickPhase::Conversing);
    }
    BOOST_CHECK_EQUAL(agent.phase(), TickPhase::Idle);
}

BOOST_AUTO_TEST_CASE(TestConversationDuringTickRejected) {
    bool rejected = false;
    mocks.executor->onCall = [&](AgentContext&) {
        try {
            agent.openConversation(ConversationMode::Analysis);
        } catch (const std::logic_error&) {
            rejected = true;
        }
    };

    agent.tick(world, peers, {1, 1}, morning);
    BOOST_CHECK(rejected);
    BOOST_CHECK_EQUAL(mocks.conversation->callCount, 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SnapshotTests, OrchestratorTestFixture)

BOOST_AUTO_TEST_CASE(TestSaveWritesLayout) {
    agent.tick(world, peers, {1, 1}, morning);
    BOOST_REQUIRE(agent.save(snapshotDir.string()));

    BOOST_CHECK(fs::is_regular_file(snapshotDir / AgentOrchestrator::SPATIAL_MEMORY_FILE));
    BOOST_CHECK(fs::is_regular_file(snapshotDir / AgentOrchestrator::ASSOCIATIVE_MEMORY_DIR /
                                    AssociativeMemory::NODES_FILE));
    BOOST_CHECK(fs::is_regular_file(snapshotDir / AgentOrchestrator::SCRATCH_FILE));
}

BOOST_AUTO_TEST_CASE(TestSaveThenLoad) {
    agent.scratch().setVisionRadius(2);
    agent.workingState().plannerState["daily_req"] = JsonValue("open the cafe");
    agent.tick(world, peers, {1, 1}, morning);
    BOOST_REQUIRE(agent.save(snapshotDir.string()));

    MockModuleSet freshMocks;
    AgentOrchestrator restored("Isabella Rodriguez", snapshotDir.string(),
                               freshMocks.modules());

    BOOST_CHECK_EQUAL(restored.name(), "Isabella Rodriguez");
    BOOST_CHECK_EQUAL(restored.scratch().visionRadius(), 2);
    BOOST_CHECK_EQUAL(*restored.workingState().currentTile, (TileCoord{1, 1}));
    BOOST_CHECK(*restored.workingState().currentTime == morning);
    BOOST_CHECK_EQUAL(restored.workingState().plannerState.at("daily_req").asString(),
                      "open the cafe");
    BOOST_CHECK(restored.spatialMemory().knows("Town:park:bench:chessboard"));
    BOOST_CHECK_EQUAL(restored.associativeMemory().size(), agent.associativeMemory().size());

    // The restored agent carries on from the saved time
    restored.tick(world, peers, {1, 1}, evening);
    BOOST_CHECK_EQUAL(restored.lastDayFlag(), DayFlag::NoSignal);
}

BOOST_AUTO_TEST_CASE(TestLoadMissingStore) {
    BOOST_REQUIRE(agent.save(snapshotDir.string()));
    fs::remove(snapshotDir / AgentOrchestrator::SCRATCH_FILE);

    try {
        AgentOrchestrator restored("Isabella Rodriguez", snapshotDir.string(), mocks.modules());
        BOOST_FAIL("Expected CorruptSnapshot");
    } catch (const CorruptSnapshot& e) {
        BOOST_CHECK(e.path().find(AgentOrchestrator::SCRATCH_FILE) != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(TestLoadCorruptStore) {
    BOOST_REQUIRE(agent.save(snapshotDir.string()));
    {
        std::ofstream file(snapshotDir / AgentOrchestrator::SPATIAL_MEMORY_FILE, std::ios::trunc);
        file << "{ \"Town\": ";
    }

    BOOST_CHECK_THROW(
        AgentOrchestrator("Isabella Rodriguez", snapshotDir.string(), mocks.modules()),
        CorruptSnapshot);
}

BOOST_AUTO_TEST_CASE(TestSaveToUnwritableFolder) {
    // A regular file where the folder should be
    fs::create_directories(snapshotDir);
    const fs::path blocker = snapshotDir / "blocker";
    {
        std::ofstream file(blocker);
        file << "x";
    }
    BOOST_CHECK(!agent.save(blocker.string()));
}

BOOST_AUTO_TEST_CASE(TestMemoryFolderFor) {
    const fs::path expected = fs::path("storage") / "base_the_ville" / "personas" /
                              "Isabella Rodriguez" / "bootstrap_memory";
    BOOST_CHECK_EQUAL(AgentOrchestrator::memoryFolderFor("storage/base_the_ville",
                                                         "Isabella Rodriguez"),
                      expected.string());
}

BOOST_AUTO_TEST_SUITE_END()
