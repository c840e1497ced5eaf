#include "elastic/core/cli.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <ostream>

namespace {

bool parseDouble(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    double const value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

bool parseInteger(const std::string& text, long long minValue, long long maxValue, long long& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long long const value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()
        || value < minValue || value > maxValue) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

std::optional<CommandLineOptions> parseCommandLine(const std::vector<std::string>& args,
                                                   std::ostream& err) {
    CommandLineOptions options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            options.help = true;
            continue;
        }
        if (arg == "--headless") {
            options.headless = true;
            continue;
        }
        if (arg == "--profile") {
            options.profile = true;
            continue;
        }

        // Everything else takes a value
        bool const known = arg == "--scenario" || arg == "--duration" || arg == "--dt"
                        || arg == "--balls" || arg == "--seed" || arg == "--substeps"
                        || arg == "--passes" || arg == "--record";
        if (!known) {
            err << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
        if (i + 1 >= args.size()) {
            err << "Missing value for " << arg << "\n";
            return std::nullopt;
        }
        const std::string& value = args[++i];

        if (arg == "--scenario") {
            auto scenario = SimulatorConstants::scenarioFromName(value);
            if (!scenario) {
                err << "Unknown scenario: " << value << "\n";
                return std::nullopt;
            }
            options.scenario = *scenario;
        } else if (arg == "--record") {
            if (value.empty()) {
                err << "--record needs a directory\n";
                return std::nullopt;
            }
            options.recordDir = value;
        } else if (arg == "--duration" || arg == "--dt") {
            double number = 0.0;
            bool const positiveRequired = arg == "--dt";
            if (!parseDouble(value, number) || number < 0.0 || (positiveRequired && number == 0.0)) {
                err << "Invalid value for " << arg << ": " << value << "\n";
                return std::nullopt;
            }
            if (arg == "--dt") {
                options.dt = number;
            } else {
                options.duration = number;
            }
        } else if (arg == "--seed") {
            long long number = 0;
            if (!parseInteger(value, 0, std::numeric_limits<std::uint32_t>::max(), number)) {
                err << "Invalid value for --seed: " << value << "\n";
                return std::nullopt;
            }
            options.seed = static_cast<std::uint32_t>(number);
        } else {
            // --balls, --substeps, --passes
            long long const minValue = arg == "--substeps" ? 1 : 0;
            long long number = 0;
            if (!parseInteger(value, minValue, std::numeric_limits<int>::max(), number)) {
                err << "Invalid value for " << arg << ": " << value << "\n";
                return std::nullopt;
            }
            if (arg == "--balls") {
                options.balls = static_cast<int>(number);
            } else if (arg == "--substeps") {
                options.substeps = static_cast<int>(number);
            } else {
                options.passes = static_cast<int>(number);
            }
        }
    }

    if (options.headless && !options.recordDir.empty()) {
        err << "--headless and --record cannot be combined\n";
        return std::nullopt;
    }

    return options;
}

ScenarioConfig applyOverrides(ScenarioConfig cfg, const CommandLineOptions& options) {
    if (options.duration) cfg.DurationSeconds = *options.duration;
    if (options.dt) cfg.SecondsPerFrame = *options.dt;
    if (options.balls) cfg.BallCount = *options.balls;
    if (options.seed) cfg.Seed = *options.seed;
    if (options.substeps) cfg.Substeps = *options.substeps;
    if (options.passes) cfg.RelaxationPasses = *options.passes;
    return cfg;
}

void printUsage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --scenario NAME   RANDOM_BALLS (default), HEAD_ON or NEWTONS_CRADLE\n"
        << "  --duration S      simulated seconds to run\n"
        << "  --dt S            seconds per frame\n"
        << "  --balls N         number of balls (RANDOM_BALLS)\n"
        << "  --seed N          random seed (RANDOM_BALLS)\n"
        << "  --substeps N      sub-steps per frame (>= 1)\n"
        << "  --passes N        relaxation passes per sub-step\n"
        << "  --record DIR      write frame_00000.png ... into DIR\n"
        << "  --headless        run without a window and print body states\n"
        << "  --profile         print timing statistics on exit\n"
        << "  --help            show this message\n"
        << "\n"
        << "Without --headless or --record an interactive window opens:\n"
        << "  P pause, Space step while paused, R reset, 1-3 scenario, Esc quit\n";
}
