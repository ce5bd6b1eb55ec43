#include <glog/logging.h>
#include <iostream>
#include <iomanip>
#include <string>
#include "reactdag/graph_config.h"
#include "reactdag/reactive_graph.h"

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <graph_yaml_file>\n";
    std::cout << "Example: " << program_name << " thermostat.yaml\n";
}

int main(int argc, char* argv[]) {
    using namespace reactdag;
    // Initialize Google logging
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    FLAGS_colorlogtostderr = true;

    if (argc != 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string yaml_file = argv[1];
    LOG(INFO) << "Starting reactive graph runner";
    LOG(INFO) << "Graph file: " << yaml_file;

    auto config = load_graph_config_file(yaml_file);
    if (!config) {
        LOG(ERROR) << "Failed to load graph config";
        return 1;
    }

    // Effects report to stdout, logs go to stderr
    ReactiveGraph graph;
    auto observer = [](const std::string& effect, const NamedValues& values) {
        std::cout << effect << ":";
        for (const auto& [name, value] : values) {
            std::cout << " " << name << "=" << std::setprecision(6) << value;
        }
        std::cout << std::endl;
    };

    try {
        if (!graph.build(*config, observer)) {
            LOG(ERROR) << "Failed to build reactive graph";
            return 1;
        }
        if (!graph.apply_all()) {
            LOG(ERROR) << "Failed to apply graph steps";
            return 1;
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << "Evaluation failed: " << e.what();
        return 1;
    }

    const auto& stats = graph.runtime().scheduler().stats();
    LOG(INFO) << "Done: " << stats.drains << " drains, " << stats.runs << " node runs";
    return 0;
}
