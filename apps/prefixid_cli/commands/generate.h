#pragma once

// cmd_generate: print one or more identifiers for a kind.
// Usage: prefixid_cli <character|user|story|segment|session> [--count N] [--json] [--seed S]
//        prefixid_cli custom --prefix <p> --length <n> [--count N] [--json] [--seed S]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// print_usage writes the full usage text, including the flag table.
void print_usage(const char* program);
