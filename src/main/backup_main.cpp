#include "main/backup_main.hpp"
#include "backup/backup_cli.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

void printBackupUsage(std::ostream& out) {
    out << "Usage: phonevault [options]\n"
        << "Copies photos and videos from an iPhone or Android phone, verifies\n"
        << "the copies and optionally deletes the originals from the device.\n"
        << "\n"
        << "Options:\n"
        << "  -h, --help             Show this help message\n"
        << "  -v, --version          Show version information\n"
        << "  -d, --dest DIR         Destination directory (prompted when missing)\n"
        << "  --device TYPE          Device type: iphone, pixel or android (prompted when missing)\n"
        << "  -c, --config FILE      JSON configuration file, flags override it\n"
        << "  -r, --report FILE      Write a JSON run report\n"
        << "  --checksum             Verify SHA-256 digests in addition to sizes\n"
        << "  -y, --yes              Answer yes to the commence and space prompts\n"
        << "  --delete               Delete verified files without asking\n"
        << "  --keep                 Never delete files from the device\n"
        << "  --serial SERIAL        Android device serial (default: first device)\n"
        << "  --mount-point DIR      iPhone mount point (default: temporary directory)\n"
        << "  --transfer-timeout S   Seconds allowed per file transfer (default: 300)\n"
        << "  --no-date-dir          Copy into DIR instead of DIR/YYYY-MM-DD\n"
        << "  --log FILE             Log file (default: /tmp/phonevault.log)\n"
        << "  --log-level LEVEL      debug, info, warning or error\n"
        << "  --verbose              Echo info messages to the console\n";
}

int backupMain(int argc, char* argv[]) {
    try {
        BackupCLI cli(std::cin, std::cout);
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        Logger::error("Error in backup main: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
