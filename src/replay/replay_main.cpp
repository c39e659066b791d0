// src/replay/replay_main.cpp
#include "replay/replay_app.hpp"
#include "config/steering_config.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <getopt.h>

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nFrame Sources (default: synthetic):\n");
    printf("  --frames CSV          Replay recorded frames (columns: frame,y,x)\n");
    printf("  --lua SCRIPT          Scripted frames from scenario_points(t)\n");
    printf("  --synthetic           Built-in generator\n");
    printf("\nOptions:\n");
    printf("  --config PATH         Steering config YAML (default: config/steering/default.yaml)\n");
    printf("  --scenario PATH       Path passed to the Lua scenario_init()\n");
    printf("  --seed N              Synthetic generator seed, 0 = random (default: 1)\n");
    printf("  --rate HZ             Control rate (default: 30)\n");
    printf("  --duration SEC        Replay duration, 0 = until source ends (default: 10)\n");
    printf("  --iterations N        Benchmark: run the first frame N times\n");
    printf("  --real-time           Pace cycles to the control rate\n");
    printf("  --fast                Run as fast as possible (default)\n");
    printf("  --out PATH            Per-cycle CSV output (default: steer_out.csv)\n");
    printf("  --log-file PATH       Mirror log output to a file\n");
    printf("  --log-level LEVEL     trace|debug|info|warn|error|off (default: from config)\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  # Replay a recording:\n");
    printf("  %s --frames config/frames/sample_frames.csv --duration 0\n\n", prog_name);
    printf("  # Scripted S-curve in real time:\n");
    printf("  %s --lua config/lua/scenario.lua --real-time\n\n", prog_name);
    printf("  # Time 1000 cycles:\n");
    printf("  %s --iterations 1000\n\n", prog_name);
}

int main(int argc, char** argv) {
    replay::ReplayConfig cfg{};

    std::string config_path = "config/steering/default.yaml";
    std::string log_level_override;

    static struct option long_options[] = {
        {"config",     required_argument, 0, 'c'},
        {"frames",     required_argument, 0, 'f'},
        {"lua",        required_argument, 0, 'l'},
        {"scenario",   required_argument, 0, 's'},
        {"synthetic",  no_argument,       0, 'S'},
        {"seed",       required_argument, 0, 'e'},
        {"rate",       required_argument, 0, 'r'},
        {"duration",   required_argument, 0, 'D'},
        {"iterations", required_argument, 0, 'n'},
        {"real-time",  no_argument,       0, 'R'},
        {"fast",       no_argument,       0, 'F'},
        {"out",        required_argument, 0, 'o'},
        {"log-file",   required_argument, 0, 'L'},
        {"log-level",  required_argument, 0, 'v'},
        {"help",       no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'f':
                cfg.source = replay::SourceKind::Csv;
                cfg.frames_csv_path = optarg;
                break;
            case 'l':
                cfg.source = replay::SourceKind::Lua;
                cfg.lua_script_path = optarg;
                break;
            case 's':
                cfg.scenario_path = optarg;
                break;
            case 'S':
                cfg.source = replay::SourceKind::Synthetic;
                break;
            case 'e':
                cfg.synthetic.seed = std::strtoull(optarg, nullptr, 10);
                break;
            case 'r':
                cfg.rate_hz = std::atof(optarg);
                if (!(cfg.rate_hz > 0 && cfg.rate_hz <= replay::ReplayConfig::MAX_RATE_HZ)) {
                    fprintf(stderr, "Error: Invalid rate: %s (must be 0 < rate <= 10000)\n", optarg);
                    return 1;
                }
                break;
            case 'D':
                cfg.duration_s = std::atof(optarg);
                if (!(cfg.duration_s >= 0 && cfg.duration_s <= replay::ReplayConfig::MAX_DURATION_S)) {
                    fprintf(stderr, "Error: Invalid duration: %s (must be 0 <= duration <= 1000000)\n", optarg);
                    return 1;
                }
                break;
            case 'n': {
                const long long n = std::atoll(optarg);
                if (n <= 0) {
                    fprintf(stderr, "Error: Invalid iteration count: %s\n", optarg);
                    return 1;
                }
                cfg.benchmark_iterations = static_cast<size_t>(n);
                break;
            }
            case 'R':
                cfg.real_time_mode = true;
                break;
            case 'F':
                cfg.real_time_mode = false;
                break;
            case 'o':
                cfg.csv_out_path = optarg;
                break;
            case 'L':
                cfg.debug_log_path = optarg;
                cfg.enable_debug_log_file = true;
                break;
            case 'v':
                log_level_override = optarg;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (cfg.source == replay::SourceKind::Csv && cfg.real_time_mode) {
        fprintf(stderr, "Warning: real-time pacing of a recording uses --rate, not recorded timestamps\n");
    }

    // ========================================================================
    // Load steering configuration and apply the log level
    // ========================================================================
    config::SteeringConfig steering;
    try {
        steering = config::SteeringConfig::load(config_path);
        const std::string level = log_level_override.empty() ? steering.log_level : log_level_override;
        utils::set_level(utils::parse_level(level));
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    steering.print_summary();

    LOG_INFO("========================================");
    LOG_INFO("Center-Line PD Steering Replay");
    LOG_INFO("Config: %s", steering.name.c_str());
    LOG_INFO("========================================");

    int rc = 1;
    try {
        replay::ReplayApp app(cfg, steering);
        rc = (cfg.benchmark_iterations > 0) ? app.run_benchmark() : app.run();
    } catch (const std::exception& e) {
        LOG_ERROR("Replay aborted: %s", e.what());
    }

    utils::close_log_file();
    return rc;
}
