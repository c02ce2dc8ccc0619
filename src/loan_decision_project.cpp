#include <iostream>
#include <filesystem>

#include "httplib.h"
#include "config.hpp"
#include "decision_controller.hpp"
#include "decision_engine.hpp"

#define PROJECT_NAME "loan-decision-engine"

int
main(int argc, char **argv) {
    const std::filesystem::path configPath = argc > 1 ? argv[1] : "config.json";

    auto settings = config::load(configPath);

    if (!settings.has_value()) {
        std::cerr << "[CONFIG_ERROR] " PROJECT_NAME " couldn't load " << configPath << std::endl;
        return 1;
    }

    const decision::DecisionEngine engine{settings->decision};

    // HTTP
    httplib::Server svr;

    svr.new_task_queue = [threads = settings->server.threads] {
        return new httplib::ThreadPool(static_cast<size_t>(threads));
    };

    svr.Post("/loan/decision", [&engine](const httplib::Request &req, httplib::Response &res) {
        controller::loanDecision(engine, req, res);
    });

    const auto &limits = engine.constants();

    std::cout << "[LOG] " PROJECT_NAME " listening on "
              << settings->server.host << ":" << settings->server.port
              << " amount " << limits.minLoanAmount << ".." << limits.maxLoanAmount
              << " period " << limits.minLoanPeriod << ".." << limits.maxLoanPeriod
              << std::endl;

    if (!svr.listen(settings->server.host, settings->server.port)) {
        std::cerr << "[LOG] " PROJECT_NAME " couldn't listen on "
                  << settings->server.host << ":" << settings->server.port << std::endl;
        return 1;
    }

    return 0;
}
