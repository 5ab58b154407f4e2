#include "backup/catalog_builder.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

const std::vector<std::string>& supportedMediaExtensions() {
    static const std::vector<std::string> extensions = {
        ".mov", ".mp4", ".avi", ".jpg", ".jpeg", ".png", ".heic"
    };
    return extensions;
}

bool isSupportedMediaFile(const std::string& fileName) {
    std::string ext = std::filesystem::path(fileName).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& allowed = supportedMediaExtensions();
    return std::find(allowed.begin(), allowed.end(), ext) != allowed.end();
}

Catalog buildCatalog(const std::vector<RawListing>& listing) {
    Catalog catalog;
    catalog.reserve(listing.size());

    for (const auto& item : listing) {
        if (!isSupportedMediaFile(item.fileName)) {
            continue;
        }
        catalog.push_back(MediaCandidate{item.sourceRef, item.fileName, item.sizeBytes});
    }

    // Stable so that duplicate names keep enumeration order
    std::stable_sort(catalog.begin(), catalog.end(),
                     [](const MediaCandidate& a, const MediaCandidate& b) {
                         return a.fileName < b.fileName;
                     });

    // Destination is flat: the later of two same-named candidates wins
    for (size_t i = 1; i < catalog.size(); ++i) {
        if (catalog[i].fileName == catalog[i - 1].fileName) {
            Logger::warning("Duplicate file name " + catalog[i].fileName + ": " + catalog[i].sourceRef +
                            " will overwrite " + catalog[i - 1].sourceRef);
        }
    }
    return catalog;
}

uint64_t totalCatalogBytes(const Catalog& catalog) {
    uint64_t total = 0;
    for (const auto& candidate : catalog) {
        total += candidate.sizeBytes;
    }
    return total;
}
