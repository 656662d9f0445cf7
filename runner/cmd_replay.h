#pragma once

int cmd_replay(int argc, char** argv);
