#include "main/backup_main.hpp"
#include "common/logger.hpp"

int main(int argc, char** argv) {
    int rc = backupMain(argc, argv);
    Logger::shutdown();
    return rc;
}
