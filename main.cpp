#include <iostream>
#include <chrono>
#include <cstring>

#include "StageApp.hpp"
#include "StageConfig.hpp"

using namespace KUCHIPAKU;

int main(int argc, char** argv) {
    std::string config_path;
    bool display_mode = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--display") == 0) {
            display_mode = true;
        }
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            std::cout << "Usage: " << argv[0] << " [CONFIG_PATH] [--display]\n"
                      << "  CONFIG_PATH  JSON stage configuration; built-in defaults when omitted.\n"
                      << "  --display    follow mirror messages on stdin instead of playing.\n";
            return 0;
        }
        else if (config_path.empty()) {
            config_path = argv[i];
        }
        else {
            std::cerr << "Unexpected argument: " << argv[i] << "\n";
            return 1;
        }
    }

    StageConfig config = DefaultStageConfig();
    if (!config_path.empty() && !LoadStageConfigFromFile(config_path, &config)) {
        std::cerr << "Continuing with the default configuration.\n";
    }

    std::unique_ptr<StageApp> app =
        std::make_unique<StageApp>(display_mode ? "Kuchipaku - Display" : "Kuchipaku - Stage",
                                   glm::ivec2(1440, 900),
                                   config,
                                   display_mode);

    app->SetupScene();

    using Clock = std::chrono::high_resolution_clock;
    using TimePoint =
        std::chrono::time_point<Clock, std::chrono::duration<double>>;
    TimePoint last_tick_time = Clock::now();
    TimePoint start_tick_time = last_tick_time;

    while (!app->IsFinished()) {
        TimePoint current_tick_time = Clock::now();
        double delta_time = (current_tick_time - last_tick_time).count();
        double total_elapsed_time =
            (current_tick_time - start_tick_time).count();
        app->Tick(delta_time, total_elapsed_time);
        last_tick_time = current_tick_time;
    }

    return 0;
}
