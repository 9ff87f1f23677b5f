#pragma once

// swimset stats --template <path>
int cmd_stats(int argc, char** argv);
