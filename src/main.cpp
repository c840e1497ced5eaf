/**
 * @fileoverview main.cpp
 * @brief Main entry point for elastic_sim.
 *
 * Runs one of three modes:
 * - headless: steps the scenario and prints every frame as CSV on stdout
 * - record: renders every frame offscreen into numbered PNG files
 * - interactive: opens a window driven by SimManager
 */

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "elastic/core/cli.hpp"
#include "elastic/core/profile.hpp"
#include "elastic/core/scenario_manager.hpp"
#include "elastic/core/sim_manager.hpp"
#include "elastic/core/simulator.hpp"
#include "elastic/core/viewport.hpp"
#include "elastic/rendering/frame_recorder.hpp"

namespace {

bool loadSimulator(ECSSimulator& simulator, const CommandLineOptions& options) {
    ScenarioManager scenarioManager;
    ScenarioConfig const cfg =
        applyOverrides(ScenarioManager::defaultConfig(options.scenario), options);

    std::cerr << "Creating " << SimulatorConstants::getScenarioName(options.scenario)
              << " scenario..." << std::endl;
    if (!simulator.loadScenario(scenarioManager.createScenario(options.scenario, cfg))) {
        return false;
    }

    simulator.reset();
    std::cerr << "Box: " << cfg.BoundaryWidth << " x " << cfg.BoundaryHeight
              << ", bodies: " << simulator.bodies().size() << std::endl;
    return true;
}

void printSummary(const ECSSimulator& simulator, std::uint64_t frames) {
    auto const state = simulator.getState();
    std::cerr << "Simulated " << frames << " frames (" << state.simulatedSeconds << " s)\n"
              << "  pair contacts: " << state.pairContacts << "\n"
              << "  wall contacts: " << state.wallContacts << "\n"
              << "  kinetic energy: " << state.initialKineticEnergy << " -> "
              << state.kineticEnergy << " (max relative drift "
              << state.maxRelativeEnergyDrift << ")" << std::endl;
}

int runHeadless(const CommandLineOptions& options) {
    ECSSimulator simulator;
    if (!loadSimulator(simulator, options)) {
        return 1;
    }

    double const duration = simulator.getCurrentScenario().getConfig().DurationSeconds;
    double const dt = simulator.getConfig().SecondsPerFrame;
    std::cerr << "Number of frames: " << ECSSimulator::frameCount(duration, dt) << std::endl;

    std::cout.precision(10);
    std::cout << "frame,time,index,x,y\n";
    std::uint64_t const frames = simulator.run(duration,
        [dt](const ECSSimulator& sim, std::uint64_t frame) {
            auto const positions = sim.snapshot();
            for (std::size_t i = 0; i < positions.size(); ++i) {
                std::cout << frame << ',' << static_cast<double>(frame) * dt << ','
                          << i << ',' << positions[i].x << ',' << positions[i].y << '\n';
            }
            return true;
        });
    std::cout.flush();

    printSummary(simulator, frames);
    simulator.printState(std::cerr);
    return 0;
}

int runRecording(const CommandLineOptions& options) {
    ECSSimulator simulator;
    if (!loadSimulator(simulator, options)) {
        return 1;
    }

    FrameRecorder recorder(options.recordDir, Simulation::Viewport(simulator.getConfig()));
    if (!recorder.init()) {
        return 1;
    }

    double const duration = simulator.getCurrentScenario().getConfig().DurationSeconds;
    std::cerr << "Recording to " << recorder.getOutputDir() << " ("
              << ECSSimulator::frameCount(duration, simulator.getConfig().SecondsPerFrame)
              << " frames)..." << std::endl;

    bool failed = false;
    std::uint64_t const frames = simulator.run(duration,
        [&recorder, &failed](const ECSSimulator& sim, std::uint64_t frame) {
            if (!recorder.capture(sim.getRegistry(), frame)) {
                failed = true;
            }
            return !failed;
        });

    printSummary(simulator, frames);
    if (failed) {
        std::cerr << "Recording stopped after " << recorder.framesWritten() << " frames" << std::endl;
        return 1;
    }
    std::cerr << "Wrote " << recorder.framesWritten() << " frames" << std::endl;
    return 0;
}

int runInteractive(const CommandLineOptions& options) {
    SimManager manager(options);
    if (!manager.init()) {
        return 1;
    }
    manager.run();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string const program = argc > 0 ? argv[0] : "elastic_sim";
    std::vector<std::string> const args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto options = parseCommandLine(args, std::cerr);
    if (!options) {
        printUsage(std::cerr, program);
        return 1;
    }
    if (options->help) {
        printUsage(std::cout, program);
        return 0;
    }

    int status = 0;
    try {
        if (options->headless) {
            status = runHeadless(*options);
        } else if (!options->recordDir.empty()) {
            status = runRecording(*options);
        } else {
            status = runInteractive(*options);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        status = 1;
    }

    if (options->profile) {
        Profiling::Profiler::printStats(std::cerr);
    }
    return status;
}
