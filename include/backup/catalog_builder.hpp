#pragma once

#include "common/backup_status.hpp"
#include <string>
#include <vector>

// Case-insensitive extension allow-list: .mov .mp4 .avi .jpg .jpeg .png .heic
const std::vector<std::string>& supportedMediaExtensions();

bool isSupportedMediaFile(const std::string& fileName);

// Filters by extension and sorts by fileName. Duplicate names are kept.
Catalog buildCatalog(const std::vector<RawListing>& listing);

uint64_t totalCatalogBytes(const Catalog& catalog);
