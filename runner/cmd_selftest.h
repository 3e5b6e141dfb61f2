#pragma once

// labwright_cli selftest <blueprint.json> [--hold]
int cmd_selftest(int argc, char** argv);

// labwright_cli launch <blueprint.json>
int cmd_launch(int argc, char** argv);
