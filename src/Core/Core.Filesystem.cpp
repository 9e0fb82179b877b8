module;
#include <filesystem>
#include <string_view>
#include <system_error>

module Core:Filesystem.Impl;

import :Filesystem;
import :Logging;

namespace Core::Filesystem
{
    std::filesystem::path GetShaderDirectory()
    {
        std::error_code ec;

        // 1. Next to the binary (packaged layout)
        if (std::filesystem::is_directory("shaders", ec))
            return std::filesystem::current_path() / "shaders";

        // 2. Running from a bin/ subdirectory
        if (std::filesystem::is_directory("../shaders", ec))
            return std::filesystem::current_path().parent_path() / "shaders";

        // 3. Build tree fallback
#ifdef ARCANA_SHADER_DIR
        return std::filesystem::path(ARCANA_SHADER_DIR);
#else
        Log::Warn("No shader directory found, falling back to the working directory.");
        return std::filesystem::current_path();
#endif
    }

    std::filesystem::path GetShaderPath(std::string_view fileName, const std::filesystem::path& directory)
    {
        const std::filesystem::path root = directory.empty() ? GetShaderDirectory() : directory;
        return root / fileName;
    }
}
