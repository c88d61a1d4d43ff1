// FILE: cli/taskreview_cli.cpp
#include <csignal>
#include <getopt.h>
#include <iostream>
#include <string>

#include "backend/task_service.hpp"
#include "backend/taskwarrior_backend.hpp"
#include "cli/default_bindings.hpp"
#include "cli/print_cli_help.hpp"
#include "cli/prompter.hpp"
#include "cli/review_session.hpp"
#include "cli/run_shell.hpp"
#include "cli/terminal_input.hpp"
#include "cli_config.hpp"
#include "key_registry.hpp"

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    // A dying `task import` must surface as a failed pclose, not kill us.
    std::signal(SIGPIPE, SIG_IGN);

    CliConfig config;
    std::string custom_config_path;

    const char* const short_opts = "hf:k:r:";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"filter", required_argument, nullptr, 'f'},
        {"keys", required_argument, nullptr, 'k'}, {"rtag", required_argument, nullptr, 'r'},
        {"config", required_argument, nullptr, 2001},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        if (opt == 2001) { custom_config_path = optarg; }
    }
    optind = 1;

    load_or_create_config(custom_config_path.empty() ? default_config_path() : custom_config_path, config);

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'f': config.initial_filter = optarg; break;
        case 'k': config.keys_path = optarg; break;
        case 'r': config.review_tag = optarg; break;
        case 2001: break;
        default: print_cli_help(); return 1;
        }
    }

    const tr::fs::path keys_path = expand_home(config.keys_path);
    tr::ReviewSession session = tr::make_session(config);
    tr::TaskwarriorBackend backend(config.task_command);
    tr::TaskService svc(backend);
    tr::KeyRegistry keys;

    try {
        keys.load(keys_path);
        tr::seed_bindings(keys, svc.fetch("", session.sort_mode));

        std::cout << "Taskreview version 0.1" << std::endl;
        {
            tr::TerminalInput term;
            if (!term.is_terminal()) {
                std::cerr << "Warning: Standard input is not a terminal; keys are read as raw bytes." << std::endl;
            }
            tr::TerminalPrompter io(term, std::cout);
            tr::run_shell(svc, keys, io, session, config.initial_filter);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    if (!keys.save(keys_path)) return 1;
    return 0;
}
