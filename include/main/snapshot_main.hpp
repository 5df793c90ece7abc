#pragma once

// Print the snapshot command usage information
void printSnapshotUsage();

// Main entry point for snapshot runs
int snapshotMain(int argc, char* argv[]);
