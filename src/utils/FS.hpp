#pragma once

#include <filesystem>
#include <optional>

namespace mp::utils
{

std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();
std::optional<std::filesystem::path> app_data_root();

} // namespace mp::utils
