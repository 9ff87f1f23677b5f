#pragma once

// swimset parse <file|-> [--out <path>] [--title <s>] [--notes <s>] [--pool <s>] [--tag <s>] [--fallback <label>]
int cmd_parse(int argc, char** argv);
