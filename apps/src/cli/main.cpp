#include "TuneRunner.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"
#include <args.hxx>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>

using namespace DiceTune;

namespace {

constexpr const char* kConfigFileName = "dicetune.json";

std::string getCommandListHelp()
{
    return "Command:\n"
           "  tune [json]        Run the optimizer against the synthetic oracle\n"
           "  evaluate <json>    Screen one gene vector, e.g. '{\"genes\": [0.3, 0.7]}'\n"
           "  example-config     Print the default configuration as JSON";
}

std::string getExamplesHelp()
{
    return "Examples:\n"
           "  dicetune-cli tune --generations 50 --seed 7\n"
           "  dicetune-cli tune '{\"optimizer\": {\"evolution\": {\"populationSize\": 200}}}'\n"
           "  dicetune-cli --config my.json --save-progress tune\n"
           "  dicetune-cli evaluate '{\"genes\": [0.361, 0.724, 1.0, 0.017, 0.798, 0.0, 0.302, "
           "0.939]}'";
}

std::string defaultProgressLogPath()
{
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
    return std::string("logs/dicetune_") + stamp + ".log";
}

Result<std::monostate, std::string> validateTuneConfig(const Client::TuneConfig& config)
{
    return validateConfig(config.optimizer);
}

} // namespace

int main(int argc, char** argv)
{
    // Console logs go to stderr so stdout carries only the JSON result.
    LoggingChannels::initialize(spdlog::level::info, spdlog::level::debug, "cli", true);

    args::ArgumentParser parser(
        "DiceTune CLI",
        "Tune dice-game heuristic weights with a noise-aware genetic optimizer.\n\n"
            + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> configPath(
        parser, "file", "Config file (default: dicetune.json on the search path)", { "config" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Extra directory searched first for dicetune.json", { "config-dir" });
    args::ValueFlag<int> generations(
        parser, "n", "Override evolution.maxGenerations (0 = until Ctrl+C)", { "generations" });
    args::ValueFlag<int> population(
        parser, "n", "Override evolution.populationSize", { "population" });
    args::ValueFlag<uint64_t> seed(
        parser, "seed", "Override evolution.randomSeed (0 = nondeterministic)", { "seed" });
    args::ValueFlag<int> threads(
        parser, "n", "Override evolution.maxParallelEvaluations", { 'j', "threads" });
    args::ValueFlag<std::string> progressLog(
        parser, "path", "Append the progress stream to this file", { "progress-log" });
    args::Flag saveProgress(
        parser,
        "save-progress",
        "Append the progress stream to logs/dicetune_<timestamp>.log",
        { "save-progress" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "spec",
        "Channel levels, e.g. 'confirm:debug,evaluation:warn' or '*:off,progress:info'",
        { "log-channels" });

    args::Positional<std::string> command(parser, "command", getCommandListHelp());
    args::Positional<std::string> params(
        parser, "params", "Optional JSON object with command parameters");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (verbose) {
        LoggingChannels::configureFromString("*:debug");
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }

    if (!command) {
        std::cerr << "Error: command is required\n\n";
        std::cerr << parser;
        return 1;
    }
    const std::string commandName = args::get(command);

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    auto configResult = ConfigLoader::resolve<Client::TuneConfig>(
        configPath ? args::get(configPath) : "", kConfigFileName, validateTuneConfig);
    if (configResult.isError()) {
        std::cerr << "Error loading config: " << configResult.errorValue() << std::endl;
        return 1;
    }
    Client::TuneConfig config = configResult.value();

    if (commandName == "example-config") {
        nlohmann::json output = config;
        std::cout << output.dump(2) << std::endl;
        return 0;
    }

    if (commandName == "evaluate") {
        if (!params) {
            std::cerr << "Error: evaluate needs a JSON object with a 'genes' array\n";
            return 1;
        }

        Client::EvaluateRequest request;
        try {
            request = nlohmann::json::parse(args::get(params)).get<Client::EvaluateRequest>();
        }
        catch (const std::exception& e) {
            std::cerr << "Error parsing JSON: " << e.what() << std::endl;
            return 1;
        }

        auto report = Client::evaluateGenes(config, request);
        if (report.isError()) {
            std::cerr << "Error: " << report.errorValue() << std::endl;
            return 1;
        }

        nlohmann::json output = report.value();
        std::cout << output.dump(2) << std::endl;
        return 0;
    }

    if (commandName != "tune") {
        std::cerr << "Error: unknown command '" << commandName << "'\n\n";
        std::cerr << getCommandListHelp() << std::endl;
        return 1;
    }

    // Inline JSON is merged over the loaded config, then flags override both.
    nlohmann::json overrides = nlohmann::json::object();
    if (params) {
        try {
            overrides = nlohmann::json::parse(args::get(params));
        }
        catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Error parsing JSON config: " << e.what() << std::endl;
            std::cerr << "\nExample config:\n" << nlohmann::json(Client::TuneConfig{}).dump(2)
                      << std::endl;
            return 1;
        }
        if (!overrides.is_object()) {
            std::cerr << "Error: inline config must be a JSON object" << std::endl;
            return 1;
        }
    }

    try {
        auto& evolutionOverrides = overrides["optimizer"]["evolution"];
        if (generations) {
            evolutionOverrides["maxGenerations"] = args::get(generations);
        }
        if (population) {
            evolutionOverrides["populationSize"] = args::get(population);
        }
        if (seed) {
            evolutionOverrides["randomSeed"] = args::get(seed);
        }
        if (threads) {
            evolutionOverrides["maxParallelEvaluations"] = args::get(threads);
        }
    }
    catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: optimizer.evolution must be a JSON object: " << e.what() << std::endl;
        return 1;
    }

    auto overlaid = ConfigLoader::overlay<Client::TuneConfig>(config, overrides, validateTuneConfig);
    if (overlaid.isError()) {
        std::cerr << overlaid.errorValue() << std::endl;
        return 1;
    }
    config = overlaid.value();

    if (progressLog || saveProgress) {
        const std::string path = progressLog ? args::get(progressLog) : defaultProgressLogPath();
        if (!LoggingChannels::addProgressLogFile(path)) {
            std::cerr << "Error: cannot open progress log " << path << std::endl;
            return 1;
        }
    }

    // Run with signal handling for graceful Ctrl+C shutdown between generations.
    Client::TuneRunner runner;

    // Note: Must use C-style function pointer, not lambda.
    static Client::TuneRunner* g_runner = nullptr;
    static auto sigintHandler = +[](int) -> void {
        if (g_runner) {
            std::cerr << "\n[Ctrl+C detected - stopping after the current generation...]\n"
                      << std::flush;
            g_runner->requestStop();
        }
    };

    g_runner = &runner;
    auto oldHandler = std::signal(SIGINT, sigintHandler);

    auto results = runner.run(config);

    std::signal(SIGINT, oldHandler);
    g_runner = nullptr;

    nlohmann::json output = ReflectSerializer::to_json(results);
    std::cout << output.dump(2) << std::endl;

    if (!results.completed) {
        if (!results.failedPhase.empty()) {
            std::cerr << "Failed during " << results.failedPhase << " of individual "
                      << results.failedIndividual << ": " << results.errorMessage << std::endl;
        }
        return 1;
    }
    return 0;
}
