#include "typing_trainer/command_line.hpp"

#include <cstdint>
#include <sstream>
#include <vector>

namespace tt::trainer {

namespace {

std::int64_t parseInteger(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw CommandLineError("Invalid value '" + value + "' for " + option + ": must be an integer");
    }
    if (consumed != value.size()) {
        throw CommandLineError("Invalid value '" + value + "' for " + option + ": must be an integer");
    }
    return parsed;
}

}  // namespace

CommandLine parseCommandLine(int argc, const char* const* argv) {
    CommandLine cli;
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            if (auto eq = arg.find('='); eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg.erase(eq);
            }
        }

        auto takeValue = [&]() -> std::string {
            if (inline_value) {
                return *inline_value;
            }
            if (i + 1 >= args.size()) {
                throw CommandLineError("Missing value for " + arg);
            }
            return args[++i];
        };
        auto rejectValue = [&]() {
            if (inline_value) {
                throw CommandLineError(arg + " does not take a value");
            }
        };

        if (arg == "-d" || arg == "--duration") {
            const auto value = takeValue();
            try {
                cli.duration = validateDuration(parseInteger(arg, value));
            } catch (const std::invalid_argument& err) {
                throw CommandLineError(err.what());
            }
        } else if (arg == "-c" || arg == "--require-correction") {
            rejectValue();
            cli.require_correction = true;
        } else if (arg == "-s" || arg == "--text-source") {
            const auto value = takeValue();
            cli.text_source = parseTextSource(value);
            if (!cli.text_source) {
                throw CommandLineError("Invalid text source '" + value +
                                       "'. Valid options: google, system, builtin");
            }
        } else if (arg == "-m" || arg == "--max-word-length") {
            const auto value = takeValue();
            try {
                cli.max_word_length = validateMaxWordLength(parseInteger(arg, value));
            } catch (const std::invalid_argument& err) {
                throw CommandLineError(err.what());
            }
        } else if (arg == "--config") {
            cli.config_path = std::filesystem::path(takeValue());
        } else if (arg == "--history") {
            cli.history_path = std::filesystem::path(takeValue());
        } else if (arg == "--no-history") {
            rejectValue();
            cli.no_history = true;
        } else if (arg == "-h" || arg == "--help") {
            rejectValue();
            cli.show_help = true;
        } else if (arg == "-V" || arg == "--version") {
            rejectValue();
            cli.show_version = true;
        } else {
            throw CommandLineError("Unknown option: " + args[i]);
        }
    }
    return cli;
}

void applyCommandLine(const CommandLine& cli, TrainerConfig& config) {
    if (cli.duration) config.duration = *cli.duration;
    if (cli.require_correction) config.require_correction = true;
    if (cli.text_source) config.text_source = *cli.text_source;
    if (cli.max_word_length) config.max_word_length = *cli.max_word_length;
    if (cli.history_path) config.history_path = *cli.history_path;
    if (cli.no_history) config.history_enabled = false;
}

std::string usageText(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  -d, --duration <secs>        length of the test in seconds (default 30)\n"
        << "  -c, --require-correction     mistakes must be fixed before moving on\n"
        << "  -s, --text-source <source>   google (top English words), system (/usr/share/dict/words),\n"
        << "                               builtin (sample texts) (default google)\n"
        << "  -m, --max-word-length <n>    longest word to use, " << kMinWordLength << "-"
        << kMaxWordLengthLimit << " (default 7)\n"
        << "      --config <file>          TOML config file\n"
        << "      --history <file>         session history CSV\n"
        << "      --no-history             do not record the session\n"
        << "  -h, --help                   show this help\n"
        << "  -V, --version                show the version\n";
    return oss.str();
}

}  // namespace tt::trainer
