#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Final path component of a requested name
std::string segx_base_name(const std::string& name);

// Writes `data` to <dir>/<base name> through <path>.part and a rename, so a
// failed write never leaves a file under the final name. Creates `dir` if
// missing. On success the written path is stored in `saved_path` when given.
bool segx_save_file(const std::string& dir, const std::string& name, const std::vector<uint8_t>& data,
                    std::string* saved_path = nullptr);
