#include "backup/space_preflight.hpp"
#include "backup/catalog_builder.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>

SpacePreflight::SpacePreflight()
    : probe_(&SpacePreflight::filesystemFreeSpace) {
}

SpacePreflight::SpacePreflight(FreeSpaceProbe probe)
    : probe_(probe ? probe : FreeSpaceProbe(&SpacePreflight::filesystemFreeSpace)) {
}

std::optional<uint64_t> SpacePreflight::filesystemFreeSpace(const std::string& path) {
    std::error_code ec;
    std::filesystem::space_info info = std::filesystem::space(path, ec);
    if (ec) {
        Logger::warning("Could not check drive space for " + path + ": " + ec.message());
        return std::nullopt;
    }
    return static_cast<uint64_t>(info.available);
}

PreflightResult SpacePreflight::check(const Catalog& catalog, const std::string& destination) const {
    PreflightResult result;
    result.requiredBytes = totalCatalogBytes(catalog);

    std::optional<uint64_t> available;
    try {
        available = probe_(destination);
    } catch (const std::exception& e) {
        Logger::warning("Could not check drive space: " + std::string(e.what()));
    }

    if (!available) {
        // Unknown free space is treated as sufficient
        result.sufficient = true;
        result.measured = false;
        return result;
    }

    result.measured = true;
    result.availableBytes = *available;
    result.sufficient = result.availableBytes >= result.requiredBytes;

    if (!result.sufficient) {
        Logger::warning("Insufficient space at " + destination + ": short by " +
                        std::to_string(result.shortageBytes()) + " bytes");
    } else {
        Logger::info("Space check passed: " + std::to_string(result.requiredBytes) + " bytes required, " +
                     std::to_string(result.availableBytes) + " available");
    }
    return result;
}
