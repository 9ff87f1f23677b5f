#pragma once

// swimset render --template <path> [--date YYYY-MM-DD] [--time HH:MM] [--out <path>]
int cmd_render(int argc, char** argv);
