#include "cmd_exec.h"
#include "cmd_run.h"
#include "cmd_replay.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "agentbox_cli <exec|run|replay> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "exec") return cmd_exec(argc, argv);
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "replay") return cmd_replay(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
