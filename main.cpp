#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <thread>
#include <chrono>

#include "agentmesh/base/logger.h"
#include "agentmesh/base/config.h"
#include "agentmesh/node/agent_node.h"

using namespace agentmesh;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

class AgentMeshApplication {
public:
    AgentMeshApplication() = default;
    ~AgentMeshApplication() {
        if (node_) {
            node_->stop();
        }
    }

    bool initialize(int argc, char* argv[]) {
        Logger::instance().info("Initializing AgentMesh...");

        if (!Config::instance().load_from_env()) {
            return false;
        }

        // Returns false for --help, --version and parse errors
        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }

        if (!Config::instance().validate()) {
            return false;
        }
        Config::instance().print();

        node_ = std::make_unique<AgentNode>(Config::instance().get());
        Logger::instance().info("AgentMesh initialized successfully");
        return true;
    }

    bool start() {
        if (!node_->start()) {
            Logger::instance().error("Failed to start agent node");
            return false;
        }
        Logger::instance().info("Agent {} listening on port {}",
                                Config::instance().get().node.agent_id,
                                Config::instance().get().node.port);
        return true;
    }

    void run() {
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        Logger::instance().info("Shutdown requested");
        node_->stop();
    }

private:
    std::unique_ptr<AgentNode> node_;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        AgentMeshApplication app;

        if (!app.initialize(argc, argv)) {
            return Config::instance().exit_requested() ? 0 : 1;
        }

        if (!app.start()) {
            std::cerr << "Failed to start application" << std::endl;
            return 1;
        }

        app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
