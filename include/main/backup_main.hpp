#pragma once

#include <iosfwd>

#define PHONEVAULT_VERSION "1.0.0"

// Print the backup command usage information
void printBackupUsage(std::ostream& out);

// Main entry point for the backup command
int backupMain(int argc, char* argv[]);
