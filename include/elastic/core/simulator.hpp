/**
 * @file simulator.hpp
 * @brief Main simulator class that manages an ECS registry and scenario lifecycle.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <vector>
#include <entt/entt.hpp>

#include "elastic/components/sim.hpp"
#include "elastic/core/i_scenario.hpp"
#include "elastic/core/system_config.hpp"
#include "elastic/physics/body.hpp"
#include "elastic/systems/i_system.hpp"

/**
 * @class ECSSimulator
 * @brief Main simulator that manages an ECS registry and scenario lifecycle.
 *
 * Typical use:
 * @code
 * ECSSimulator sim;
 * sim.loadScenario(manager.createScenario(type));
 * sim.reset();
 * sim.run(duration, [](const ECSSimulator& s, std::uint64_t frame) { ...; return true; });
 * @endcode
 */
class ECSSimulator {
public:
    /// Called with the state to show as frame @p frame, before that frame's step.
    /// Returning false ends the run without taking that step.
    using FrameCallback = std::function<bool(const ECSSimulator&, std::uint64_t frame)>;

    ECSSimulator();
    ~ECSSimulator();

    /**
     * @brief Takes ownership of a scenario and applies its configuration
     * @return false if the scenario's configuration is rejected
     */
    bool loadScenario(std::unique_ptr<IScenario> scenario);

    /**
     * @brief Validates @p cfg and pushes it into every system
     * @return false (with the reason on stderr) if @p cfg is invalid; the
     *         previous configuration stays active
     */
    bool applyConfig(const SystemConfig& cfg);

    /**
     * @brief Additional initialization steps after scenario reset
     */
    void init();

    /**
     * @brief Clears the registry and recreates the scenario's entities
     */
    void reset();

    /**
     * @brief Steps the ECS systems for one macroscopic step
     */
    void tick();

    /**
     * @brief Runs frameCount(duration, dt) steps
     * @param onFrame Invoked before every step, so the first call sees the
     *        initial state; returning false stops the run
     * @return number of steps taken
     */
    std::uint64_t run(double duration, const FrameCallback& onFrame = FrameCallback());

    /**
     * @brief Body positions in input order
     */
    std::vector<Position> snapshot() const;

    /**
     * @brief Full body state in input order
     */
    std::vector<Physics::Body> bodies() const;

    /**
     * @brief Run-wide counters; default values before the first reset
     */
    Components::SimulatorState getState() const;

    const SystemConfig& getConfig() const { return currentConfig; }

    /**
     * @brief Prints position, velocity, radius and mass of every body
     */
    void printState(std::ostream& out) const;

    /**
     * @brief Number of frames for a run: ceil(duration / dt)
     *
     * 0 for non-positive inputs and for counts that do not fit in 64 bits.
     */
    static std::uint64_t frameCount(double duration, double dt);

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

    bool hasScenario() const { return scenarioPtr != nullptr; }
    IScenario& getCurrentScenario() const { return *scenarioPtr; }

private:
    void createSystems();

    entt::registry registry;
    std::unique_ptr<IScenario> scenarioPtr;
    SystemConfig currentConfig;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
};
