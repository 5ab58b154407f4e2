#pragma once

#include "backup/backup_job.hpp"
#include <nlohmann/json.hpp>
#include <string>

nlohmann::json runReportToJson(const BackupJob& job);

bool writeRunReport(const std::string& path, const BackupJob& job);
