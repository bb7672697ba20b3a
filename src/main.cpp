/**
 * @file main.cpp
 * @brief Command-line interface for the HDR telemetry enhancement tool
 *
 * Runs the telemetry-adaptive HDR pipeline over a directory of PNG frames.
 *
 * Usage:
 *   hdr_telemetry --config example_config.yaml
 *   hdr_telemetry --input frames/ --output enhanced/ --preset quality --simulate
 */

#include "pipeline.hpp"
#include "config.hpp"
#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <stdexcept>

namespace {

std::atomic<bool> g_interrupted(false);

void signal_handler(int signal)
{
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

// Command-line values, applied on top of the config file
struct CommandLine {
    std::string config_file;
    std::string profile;
    std::string input_dir;
    std::string output_dir;
    std::string preset;
    std::string telemetry_file;
    double knee = 0.0;
    double fps = 0.0;
    uint32_t seed = 0;
    bool has_knee = false;
    bool has_fps = false;
    bool has_seed = false;
    bool simulate = false;
    bool frame_csv = false;
};

void print_usage(const char* program_name)
{
    std::cout << "HDR Telemetry Enhancement Tool - Sensor-driven HDR processing" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program_name << " --config <yaml_file> [--profile <name>]" << std::endl;
    std::cout << "  " << program_name << " --input <dir> --output <dir> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <path>        Load configuration from YAML file" << std::endl;
    std::cout << "  --profile <name>       Use specific profile from config file" << std::endl;
    std::cout << "  --input <dir>          Input directory containing PNG frames" << std::endl;
    std::cout << "  --output <dir>         Output directory for enhanced frames" << std::endl;
    std::cout << "  --preset <name>        Processing preset (performance, balanced, quality)" << std::endl;
    std::cout << "  --knee <K>             Highlight knee in (0, 1)" << std::endl;
    std::cout << "  --telemetry <path>     Telemetry timeline YAML file" << std::endl;
    std::cout << "  --simulate             Use simulated day/night telemetry" << std::endl;
    std::cout << "  --seed <N>             Seed for simulated telemetry" << std::endl;
    std::cout << "  --fps <F>              Stream frame rate for timestamps" << std::endl;
    std::cout << "  --frame-csv            Write per-frame metrics CSV" << std::endl;
    std::cout << "  --help                 Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program_name << " --config example_config.yaml" << std::endl;
    std::cout << "  " << program_name << " --config config.yaml --profile night_drive" << std::endl;
    std::cout << "  " << program_name << " --input frames/ --output enhanced/ --simulate --seed 7" << std::endl;
    std::cout << std::endl;
}

bool require_value(int argc, int i, const std::string& arg)
{
    if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires an argument" << std::endl;
        return false;
    }
    return true;
}

bool parse_command_line(int argc, char** argv, CommandLine& cli)
{
    if (argc < 2) {
        return false;
    }

    bool has_input_output = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                return false;
            }
            else if (arg == "--simulate") {
                cli.simulate = true;
            }
            else if (arg == "--frame-csv") {
                cli.frame_csv = true;
            }
            else if (arg == "--config" || arg == "--profile" || arg == "--input" ||
                     arg == "--output" || arg == "--preset" || arg == "--telemetry" ||
                     arg == "--knee" || arg == "--fps" || arg == "--seed") {
                if (!require_value(argc, i, arg)) {
                    return false;
                }
                const std::string value = argv[++i];

                if (arg == "--config") {
                    cli.config_file = value;
                }
                else if (arg == "--profile") {
                    cli.profile = value;
                }
                else if (arg == "--input") {
                    cli.input_dir = value;
                    has_input_output = true;
                }
                else if (arg == "--output") {
                    cli.output_dir = value;
                    has_input_output = true;
                }
                else if (arg == "--preset") {
                    cli.preset = value;
                }
                else if (arg == "--telemetry") {
                    cli.telemetry_file = value;
                }
                else if (arg == "--knee") {
                    cli.knee = std::stod(value);
                    cli.has_knee = true;
                }
                else if (arg == "--fps") {
                    cli.fps = std::stod(value);
                    cli.has_fps = true;
                }
                else {
                    cli.seed = static_cast<uint32_t>(std::stoul(value));
                    cli.has_seed = true;
                }
            }
            else {
                std::cerr << "Error: Unknown argument: " << arg << std::endl;
                return false;
            }
        }
    }
    catch (const std::logic_error& e) {
        std::cerr << "Error: Malformed numeric argument (" << e.what() << ")" << std::endl;
        return false;
    }

    // Either config file or input/output must be specified
    if (cli.config_file.empty() && !has_input_output) {
        std::cerr << "Error: Must specify either --config or --input/--output" << std::endl;
        return false;
    }

    return true;
}

void apply_command_line(const CommandLine& cli, hdrtel::EngineConfig& config)
{
    if (!cli.input_dir.empty()) {
        config.input_dir = cli.input_dir;
    }
    if (!cli.output_dir.empty()) {
        config.output_dir = cli.output_dir;
    }
    if (!cli.preset.empty()) {
        config.preset = cli.preset;
    }
    if (!cli.telemetry_file.empty()) {
        config.telemetry_file = cli.telemetry_file;
    }
    if (cli.has_knee) {
        config.highlight_knee = cli.knee;
    }
    if (cli.has_fps) {
        config.frame_rate = cli.fps;
    }
    if (cli.has_seed) {
        config.simulation_seed = cli.seed;
    }
    if (cli.simulate) {
        config.simulate_telemetry = true;
    }
    if (cli.frame_csv) {
        config.write_frame_csv = true;
    }
}

} // anonymous namespace

int main(int argc, char** argv)
{
    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Parse command line arguments
    CommandLine cli;
    if (!parse_command_line(argc, argv, cli)) {
        print_usage(argv[0]);
        return 1;
    }

    hdrtel::EngineConfig config;

    // Load configuration
    if (!cli.config_file.empty()) {
        std::cout << "Loading configuration from: " << cli.config_file << std::endl;
        if (!cli.profile.empty()) {
            std::cout << "Using profile: " << cli.profile << std::endl;
        }

        if (!config.load_from_yaml(cli.config_file, cli.profile)) {
            std::cerr << "Failed to load configuration" << std::endl;
            return 1;
        }
    }

    apply_command_line(cli, config);

    // Validate configuration
    if (!config.validate()) {
        std::cerr << "Invalid configuration" << std::endl;
        return 1;
    }

    // Print configuration
    std::cout << std::endl;
    config.print();
    std::cout << std::endl;

    // Create and run pipeline
    hdrtel::EnhancementPipeline pipeline(config);

    try {
        if (!pipeline.run(&g_interrupted)) {
            std::cerr << "Enhancement pipeline failed" << std::endl;
            return 1;
        }
    }
    catch (const hdrtel::InvalidFrameFormat& e) {
        std::cerr << "Invalid frame: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Exception during enhancement: " << e.what() << std::endl;
        return 1;
    }

    if (g_interrupted) {
        std::cout << "Enhancement interrupted by user" << std::endl;
        return 130; // Standard exit code for SIGINT
    }

    std::cout << std::endl;
    std::cout << "Enhancement completed successfully!" << std::endl;

    return 0;
}
