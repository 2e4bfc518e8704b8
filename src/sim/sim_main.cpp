// src/sim/sim_main.cpp
#include "sim/sim_app.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>
#include <getopt.h>

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nModes:\n");
    printf("  Default:          Backtest the series, report savings and forecast accuracy\n");
    printf("  --live            Decide step by step against the live battery\n");
    printf("  --sweep N         Simulate N cost/carbon weight sets in parallel\n");
    printf("\nOptions:\n");
    printf("  --config PATH         Site config YAML (default: config/sites/default.yaml)\n");
    printf("  --data PATH           Condition dataset CSV (default: synthetic days)\n");
    printf("  --synthetic-days N    Days to generate when no dataset is given (default: 1)\n");
    printf("  --seed N              Synthetic data seed (default: 42)\n");
    printf("  --hours N             Replay only the first N timesteps\n");
    printf("  --step-seconds SEC    Live mode: wall seconds per timestep (default: 0 = fast)\n");
    printf("  --threads N           Sweep worker threads (default: hardware)\n");
    printf("  --lua [PATH]          Use the Lua forecaster (optionally a different script)\n");
    printf("  --retrain PATH        Retrain the forecaster on PATH during the run\n");
    printf("  --surplus-charging    Charge the battery from surplus solar\n");
    printf("  --decision-log PATH   Live mode: write the decision log CSV\n");
    printf("  --trace PATH          Backtest: write the per-step trace CSV\n");
    printf("  --influx              Export to InfluxDB (token from config or INFLUX_TOKEN)\n");
    printf("  --log-level LEVEL     trace|debug|info|warn|error (default: info)\n");
    printf("  --log-file PATH       Mirror the log to PATH\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  # One synthetic day, default site:\n");
    printf("  %s\n\n", prog_name);
    printf("  # Backtest two days of data and keep the trace:\n");
    printf("  %s --data data/sample_days.csv --trace trace.csv\n\n", prog_name);
    printf("  # Live replay, one hour per second, retrain halfway:\n");
    printf("  %s --live --step-seconds 1 --retrain data/sample_days.csv\n\n", prog_name);
    printf("  # Weight sweep over three synthetic days:\n");
    printf("  %s --sweep 11 --synthetic-days 3\n\n", prog_name);
}

static bool parse_size(const char* s, size_t& out) {
    char* end = nullptr;
    const long long v = std::strtoll(s, &end, 10);
    if (end == s || *end != '\0' || v < 0) return false;
    out = static_cast<size_t>(v);
    return true;
}

int main(int argc, char** argv) {
    sim::SimAppConfig cfg{};
    utils::LogLevel log_level = utils::LogLevel::Info;

    static struct option long_options[] = {
        {"config",           required_argument, 0, 'c'},
        {"data",             required_argument, 0, 'd'},
        {"synthetic-days",   required_argument, 0, 'n'},
        {"seed",             required_argument, 0, 'S'},
        {"hours",            required_argument, 0, 'H'},
        {"live",             no_argument,       0, 'L'},
        {"step-seconds",     required_argument, 0, 's'},
        {"sweep",            required_argument, 0, 'w'},
        {"threads",          required_argument, 0, 'j'},
        {"lua",              optional_argument, 0, 'l'},
        {"retrain",          required_argument, 0, 'r'},
        {"surplus-charging", no_argument,       0, 'C'},
        {"decision-log",     required_argument, 0, 'D'},
        {"trace",            required_argument, 0, 't'},
        {"influx",           no_argument,       0, 'i'},
        {"log-level",        required_argument, 0, 'v'},
        {"log-file",         required_argument, 0, 'f'},
        {"help",             no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    size_t n = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                cfg.site_config_path = optarg;
                break;
            case 'd':
                cfg.data_path = optarg;
                break;
            case 'n':
                if (!parse_size(optarg, n) || n == 0) {
                    fprintf(stderr, "Error: Invalid synthetic day count: %s\n", optarg);
                    return 1;
                }
                cfg.synthetic_days = static_cast<int>(n);
                break;
            case 'S':
                if (!parse_size(optarg, n)) {
                    fprintf(stderr, "Error: Invalid seed: %s\n", optarg);
                    return 1;
                }
                cfg.synthetic_seed = static_cast<uint64_t>(n);
                break;
            case 'H':
                if (!parse_size(optarg, cfg.hours) || cfg.hours == 0) {
                    fprintf(stderr, "Error: Invalid hours: %s\n", optarg);
                    return 1;
                }
                break;
            case 'L':
                cfg.mode = sim::RunMode::Live;
                break;
            case 's':
                cfg.step_wall_s = std::atof(optarg);
                if (cfg.step_wall_s < 0) {
                    fprintf(stderr, "Error: Invalid step seconds: %s\n", optarg);
                    return 1;
                }
                break;
            case 'w':
                if (!parse_size(optarg, cfg.sweep_points) || cfg.sweep_points == 0) {
                    fprintf(stderr, "Error: Invalid sweep size: %s\n", optarg);
                    return 1;
                }
                cfg.mode = sim::RunMode::Sweep;
                break;
            case 'j':
                if (!parse_size(optarg, n)) {
                    fprintf(stderr, "Error: Invalid thread count: %s\n", optarg);
                    return 1;
                }
                cfg.sweep_threads = static_cast<unsigned>(n);
                break;
            case 'l':
                cfg.forecast_provider = std::string("lua");
                if (optarg) cfg.lua_script_path = optarg;
                break;
            case 'r':
                cfg.retrain_dataset_path = optarg;
                break;
            case 'C':
                cfg.charge_from_surplus_solar = true;
                break;
            case 'D':
                cfg.decision_log_path = optarg;
                break;
            case 't':
                cfg.trace_csv_path = optarg;
                break;
            case 'i':
                cfg.enable_influx = true;
                break;
            case 'v':
                if (!utils::parse_level(optarg, log_level)) {
                    fprintf(stderr, "Error: Invalid log level: %s\n", optarg);
                    return 1;
                }
                break;
            case 'f':
                cfg.debug_log_path = optarg;
                cfg.enable_debug_log_file = true;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (optind < argc) {
        fprintf(stderr, "Error: Unexpected argument: %s\n", argv[optind]);
        print_usage(argv[0]);
        return 1;
    }

    utils::set_level(log_level);

    printf("\n");
    printf("╔════════════════════════════════════════════════════════════╗\n");
    printf("║              VESTA DISPATCH SIMULATOR                      ║\n");
    printf("╠════════════════════════════════════════════════════════════╣\n");
    printf("║ Mode:       %-48s║\n", sim::to_string(cfg.mode));
    printf("║ Site:       %-48s║\n", cfg.site_config_path.c_str());
    if (!cfg.data_path.empty()) {
        printf("║ Data:       %-48s║\n", cfg.data_path.c_str());
    } else {
        char synth[64];
        snprintf(synth, sizeof(synth), "synthetic, %d day(s), seed %llu",
                 cfg.synthetic_days, static_cast<unsigned long long>(cfg.synthetic_seed));
        printf("║ Data:       %-48s║\n", synth);
    }
    if (cfg.mode == sim::RunMode::Live) {
        char pace[64];
        if (cfg.step_wall_s > 0) {
            snprintf(pace, sizeof(pace), "%.2f s per step", cfg.step_wall_s);
        } else {
            snprintf(pace, sizeof(pace), "fast-forward");
        }
        printf("║ Pacing:     %-48s║\n", pace);
    }
    if (!cfg.retrain_dataset_path.empty()) {
        printf("║ Retrain:    %-48s║\n", cfg.retrain_dataset_path.c_str());
    }
    printf("║ InfluxDB:   %-48s║\n", cfg.enable_influx ? "enabled" : "disabled");
    printf("╚════════════════════════════════════════════════════════════╝\n");
    printf("\n");

    // Config token wins; the environment fills an empty one
    if (cfg.enable_influx) {
        if (const char* token = std::getenv("INFLUX_TOKEN")) {
            cfg.influx_token = token;
        }
    }

    sim::SimApp app(cfg);
    return app.run();
}
