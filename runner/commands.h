#pragma once

// codemode_cli subcommands. Each returns the process exit code.
int cmd_exec(int argc, char** argv);
int cmd_validate(int argc, char** argv);
int cmd_modes(int argc, char** argv);
