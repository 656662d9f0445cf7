#include "cmd_replay.h"

#include "agentbox/json_util.h"
#include "agentbox/memory.h"

#include <cstring>
#include <iostream>

using namespace agentbox;

int cmd_replay(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: agentbox_cli replay <memory.json> [--summary] [--raw-memory]\n";
        return 2;
    }
    bool summary = false, raw = false;
    for (int i = 3; i < argc; i++) {
        if (std::strcmp(argv[i], "--summary") == 0) summary = true;
        else if (std::strcmp(argv[i], "--raw-memory") == 0) raw = true;
        else {
            std::cerr << "unknown flag: " << argv[i] << "\n";
            return 2;
        }
    }

    MemoryStore memory;
    std::string err = MemoryStore::load(argv[2], &memory);
    if (!err.empty()) {
        std::cerr << "REPLAY FAIL: " << err << "\n";
        return 1;
    }

    json_util::Doc msgs(messages_to_json(memory.to_messages(summary, raw)));
    std::cout << json_util::to_pretty(msgs.root) << "\n";
    return 0;
}
