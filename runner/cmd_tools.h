#pragma once

// Offline commands: no containers are started.
int cmd_check_script(int argc, char** argv);
int cmd_mutate(int argc, char** argv);
int cmd_render(int argc, char** argv);

// Tears down leftover lab-* projects from a previous process.
int cmd_recover(int argc, char** argv);
