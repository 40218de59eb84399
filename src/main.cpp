#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "typing_trainer/command_line.hpp"
#include "typing_trainer/config_loader.hpp"
#include "typing_trainer/keyboard_heatmap.hpp"
#include "typing_trainer/terminal_ui.hpp"
#include "typing_trainer/text_provider.hpp"
#include "typing_trainer/time_source.hpp"
#include "typing_trainer/trainer_app.hpp"

#ifndef TYPING_TRAINER_VERSION
#define TYPING_TRAINER_VERSION "0.0.0"
#endif

using tt::trainer::CommandLineError;
using tt::trainer::ConfigLoader;
using tt::trainer::KeyboardHeatmap;
using tt::trainer::SteadyTimeSource;
using tt::trainer::TerminalUi;
using tt::trainer::TextCorpus;
using tt::trainer::TextProvider;
using tt::trainer::TrainerApp;
using tt::trainer::TrainerConfig;

namespace {

TrainerConfig loadConfig(const tt::trainer::CommandLine& cli) {
    ConfigLoader loader;
    if (cli.config_path) {
        return loader.loadFromFile(*cli.config_path);
    }
    if (auto path = tt::trainer::defaultConfigPath(); path && std::filesystem::exists(*path)) {
        return loader.loadFromFile(*path);
    }
    TrainerConfig config;
    config.history_path = tt::trainer::defaultHistoryPath();
    return config;
}

std::unique_ptr<KeyboardHeatmap> buildKeyboard(const TrainerConfig& config) {
    if (!config.keyboard) {
        return nullptr;
    }
    const auto& keyboard = *config.keyboard;
    return std::make_unique<KeyboardHeatmap>(tt::trainer::buildKeyboardModel(keyboard),
                                             tt::trainer::createTransport(keyboard.transport),
                                             keyboard.heatmap);
}

}  // namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "typing-trainer";

    tt::trainer::CommandLine cli;
    try {
        cli = tt::trainer::parseCommandLine(argc, argv);
    } catch (const CommandLineError& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n" << tt::trainer::usageText(program);
        return 2;
    }

    if (cli.show_help) {
        std::cout << tt::trainer::usageText(program);
        return 0;
    }
    if (cli.show_version) {
        std::cout << "typing-trainer " << TYPING_TRAINER_VERSION << '\n';
        return 0;
    }

    try {
        TrainerConfig config = loadConfig(cli);
        tt::trainer::applyCommandLine(cli, config);

        auto corpus = std::make_shared<TextCorpus>(*tt::trainer::makeDefaultCorpus());
        corpus->dictionary_path = config.dictionary_path;

        auto keyboard = buildKeyboard(config);

        TerminalUi ui;
        TrainerApp app(std::move(config),
                       TextProvider(std::move(corpus)),
                       ui,
                       std::make_shared<SteadyTimeSource>(),
                       std::move(keyboard));
        app.run();
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
