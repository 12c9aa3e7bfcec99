#pragma once

// cmd_inspect: split each identifier into prefix and decoded sequence.
// Usage: nuid_cli inspect <id> [<id>...]
int cmd_inspect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
