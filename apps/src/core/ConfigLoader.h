#pragma once

#include "Result.h"
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace DiceTune {

/**
 * @brief Layered JSON configuration: search path, .local patches, overrides and validation.
 *
 * Search order (first directory holding either layer wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. ./config/
 * 3. ~/.config/dicetune/
 * 4. /etc/dicetune/
 *
 * Within that directory the base file is read first and the .local sibling
 * (e.g. dicetune.json.local) is applied over it as a JSON merge patch, so a .local
 * file only needs the keys it changes. Keys absent from every layer keep the
 * type's in-class defaults.
 *
 * Every entry point takes an optional validator that runs on the decoded value, so
 * a config that loads is also a config that can run.
 */
class ConfigLoader {
public:
    template <typename T>
    using Validator = std::function<Result<std::monostate, std::string>(const T&)>;

    /** Files found for one config name, in the order they are applied. */
    struct Layers {
        std::filesystem::path directory;
        std::vector<std::filesystem::path> files;
    };

    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(
        const std::string& filename, const Validator<T>& validate = {});

    /**
     * @brief Load a specific file, bypassing the search path and .local layering.
     */
    template <typename T>
    static Result<T, std::string> loadFile(
        const std::filesystem::path& path, const Validator<T>& validate = {});

    /**
     * @brief Explicit path if given, else the search path, else the type's defaults.
     */
    template <typename T>
    static Result<T, std::string> resolve(
        const std::string& explicitPath,
        const std::string& filename,
        const Validator<T>& validate = {});

    /**
     * @brief Merge-patch `patch` over an already loaded config and validate the result.
     */
    template <typename T>
    static Result<T, std::string> overlay(
        const T& base, const nlohmann::json& patch, const Validator<T>& validate = {});

    static std::optional<Layers> findConfig(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    using JsonResult = Result<nlohmann::json, std::string>;

    static std::optional<std::string> explicitConfigDir_;

    static JsonResult readJson(const std::filesystem::path& path);
    static JsonResult readLayers(const Layers& layers);
    static JsonResult loadLayered(const std::string& filename);
    static void noteDefaults(const std::string& filename);

    template <typename T>
    static Result<T, std::string> decode(
        const JsonResult& json, const std::string& source, const Validator<T>& validate);
};

template <typename T>
Result<T, std::string> ConfigLoader::decode(
    const JsonResult& json, const std::string& source, const Validator<T>& validate)
{
    if (json.isError()) {
        return Result<T, std::string>::error(json.errorValue());
    }

    T config{};
    try {
        // Unqualified call so ADL finds the type's from_json.
        from_json(json.value(), config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + source + ": " + e.what());
    }

    if (validate) {
        const auto check = validate(config);
        if (check.isError()) {
            return Result<T, std::string>::error(
                "Invalid config in " + source + ": " + check.errorValue());
        }
    }
    return Result<T, std::string>::okay(config);
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename, const Validator<T>& validate)
{
    return decode<T>(loadLayered(filename), filename, validate);
}

template <typename T>
Result<T, std::string> ConfigLoader::loadFile(
    const std::filesystem::path& path, const Validator<T>& validate)
{
    if (!std::filesystem::exists(path)) {
        return Result<T, std::string>::error("Config file not found: " + path.string());
    }
    return decode<T>(readJson(path), path.string(), validate);
}

template <typename T>
Result<T, std::string> ConfigLoader::resolve(
    const std::string& explicitPath, const std::string& filename, const Validator<T>& validate)
{
    if (!explicitPath.empty()) {
        return loadFile<T>(explicitPath, validate);
    }
    if (findConfig(filename).has_value()) {
        return load<T>(filename, validate);
    }

    noteDefaults(filename);
    return decode<T>(JsonResult::okay(nlohmann::json::object()), "built-in defaults", validate);
}

template <typename T>
Result<T, std::string> ConfigLoader::overlay(
    const T& base, const nlohmann::json& patch, const Validator<T>& validate)
{
    if (!patch.is_object()) {
        return Result<T, std::string>::error("Overrides must be a JSON object");
    }

    nlohmann::json merged = base;
    merged.merge_patch(patch);
    return decode<T>(JsonResult::okay(merged), "overrides", validate);
}

} // namespace DiceTune
