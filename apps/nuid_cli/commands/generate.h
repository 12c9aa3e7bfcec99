#pragma once

// cmd_generate: print freshly generated identifiers.
// Usage: nuid_cli generate [--count N] [--threads K] [--mode private|global]
//                          [--reduction rejection|modulo]  (private mode only)
//                          [--json]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
