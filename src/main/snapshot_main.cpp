#include "main/snapshot_main.hpp"
#include "snapshot/snapshot_cli.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

void printSnapshotUsage() {
    std::cout << "Usage: azsnap -l <vm-list> -t <ticket> [options]\n"
              << "\n"
              << "Creates a snapshot of every disk of every listed VM, searching all\n"
              << "subscriptions available to the current credentials.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                   Show this help message\n"
              << "  -v, --version                Show version information\n"
              << "  -l, --vm-list FILE           File with one VM name per line\n"
              << "  -t, --ticket REF             Change/incident reference embedded in snapshot names\n"
              << "  -o, --output-dir DIR         Report directory (default: current directory)\n"
              << "  -c, --config FILE            JSON config file; flags override it\n"
              << "  --format csv|json            Report format (default: csv)\n"
              << "  --policy first-match|exhaustive\n"
              << "                               Subscription search policy (default: first-match)\n"
              << "  --naming vm-disk|disk-only   Snapshot naming policy (default: vm-disk)\n"
              << "  --max-length N               Maximum snapshot name length (default: 82)\n"
              << "  --target-resource-group RG   Create snapshots in RG instead of the VM's group\n"
              << "  --sku NAME                   Snapshot SKU (default: Standard_LRS)\n"
              << "  --incremental                Create incremental snapshots\n"
              << "  --poll-interval SECONDS      Provisioning poll interval (default: 5)\n"
              << "  --timeout SECONDS            Per-snapshot provisioning timeout (default: 1800)\n"
              << "  --log-file FILE              Log file (default: /tmp/azsnap.log)\n"
              << "  --log-level LEVEL            DEBUG, INFO, WARNING, ERROR or FATAL (default: INFO)\n"
              << "  -q, --quiet                  Do not echo log lines to the console\n"
              << "\n"
              << "Credentials are taken from AZURE_ACCESS_TOKEN, or from AZURE_TENANT_ID,\n"
              << "AZURE_CLIENT_ID and AZURE_CLIENT_SECRET.\n"
              << "\n"
              << "Exit codes: 0 completed, 1 usage error, 2 missing VM list,\n"
              << "3 authentication failed, 4 no valid subscriptions, 5 report not written\n";
}

int snapshotMain(int argc, char** argv) {
    SnapshotCLI cli;
    return cli.run(argc, argv);
}
