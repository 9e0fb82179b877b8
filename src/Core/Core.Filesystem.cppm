module;
#include <filesystem>
#include <string_view>

export module Core:Filesystem;

export namespace Core::Filesystem
{
    // Resolution order: "./shaders", "../shaders", then the directory the build
    // compiled the shaders into (ARCANA_SHADER_DIR).
    [[nodiscard]] std::filesystem::path GetShaderDirectory();

    // Full path of a compiled SPIR-V blob, e.g. GetShaderPath("rgb2rgba.comp.spv").
    // An explicit directory overrides the lookup above.
    [[nodiscard]] std::filesystem::path GetShaderPath(std::string_view fileName,
                                                      const std::filesystem::path& directory = {});
}
