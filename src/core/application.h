#pragma once

#include <string>
#include <vector>

namespace core {

    /**
     * @brief Headless command-line runner.
     *
     * Commands:
     *   run <scenario.json> <ticks> <run_dir> [label] [--overwrite]
     *   inspect <run_dir>
     *   init <scenario.json>
     *   validate <scenario.json>
     */
    class Application {
    public:
        Application(int argc, char* argv[]);

        // Prevent copying
        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;

        /**
         * @brief Dispatches the command. Returns the process exit code.
         *
         * Setup errors propagate as exceptions to main().
         */
        int run();

    private:
        int runSimulation();
        int inspect();
        int init();
        int validate();
        void printUsage() const;

        std::vector<std::string> args_;
    };

} // namespace core
