#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>

namespace DiceTune {

namespace fs = std::filesystem;

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<fs::path> ConfigLoader::getSearchPaths()
{
    std::vector<fs::path> paths;
    if (explicitConfigDir_.has_value()) {
        paths.emplace_back(*explicitConfigDir_);
    }
    paths.push_back(fs::current_path() / "config");
    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "dicetune");
    }
    paths.emplace_back("/etc/dicetune");
    return paths;
}

std::optional<ConfigLoader::Layers> ConfigLoader::findConfig(const std::string& filename)
{
    for (const auto& dir : getSearchPaths()) {
        Layers layers{ .directory = dir, .files = {} };
        for (const fs::path candidate : { dir / filename, dir / (filename + ".local") }) {
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
                layers.files.push_back(candidate);
            }
        }
        if (!layers.files.empty()) {
            return layers;
        }
    }
    return std::nullopt;
}

ConfigLoader::JsonResult ConfigLoader::readJson(const fs::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        const std::string error = "Cannot open config file: " + path.string();
        LOG_WARN(Config, "{}", error);
        return JsonResult::error(error);
    }

    try {
        auto json = nlohmann::json::parse(file);
        if (!json.is_object()) {
            return JsonResult::error(path.string() + " must hold a JSON object");
        }
        return JsonResult::okay(std::move(json));
    }
    catch (const nlohmann::json::parse_error& e) {
        const std::string error = "Parse error in " + path.string() + ": " + e.what();
        LOG_ERROR(Config, "{}", error);
        return JsonResult::error(error);
    }
}

ConfigLoader::JsonResult ConfigLoader::readLayers(const Layers& layers)
{
    nlohmann::json merged = nlohmann::json::object();
    for (const auto& file : layers.files) {
        auto layer = readJson(file);
        if (layer.isError()) {
            return layer;
        }
        merged.merge_patch(layer.value());
        LOG_INFO(Config, "Applied config layer {}", file.string());
    }
    return JsonResult::okay(std::move(merged));
}

ConfigLoader::JsonResult ConfigLoader::loadLayered(const std::string& filename)
{
    const auto layers = findConfig(filename);
    if (!layers.has_value()) {
        const std::string error = "Config file not found: " + filename;
        LOG_DEBUG(Config, "{}", error);
        return JsonResult::error(error);
    }
    return readLayers(*layers);
}

void ConfigLoader::noteDefaults(const std::string& filename)
{
    LOG_INFO(Config, "No {} on the search path, using built-in defaults", filename);
}

} // namespace DiceTune
