#include "arg_parser.hpp"
#include <stdexcept>

void ArgParser::parse(int argc, const char* const argv[]) {
    bool optionsEnded = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (optionsEnded) {
            positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsEnded = true;
            continue;
        }

        // "--name=value" form
        std::string inlineValue;
        bool hasInlineValue = false;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            inlineValue = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            hasInlineValue = true;
        }

        // Is this a known option?
        auto def = optionDefs.find(arg);
        if (def != optionDefs.end()) {
            const auto& info = def->second;

            if (info.takesValue) {
                if (hasInlineValue) {
                    parsedOptions[info.canonicalName] = inlineValue;
                } else if (i + 1 >= argc) {
                    throw std::runtime_error("Missing value for option: " + arg);
                } else {
                    parsedOptions[info.canonicalName] = argv[++i];
                }
            } else if (hasInlineValue) {
                throw std::runtime_error("Option " + arg + " does not take a value");
            } else {
                parsedOptions[info.canonicalName] = "true";
            }
        }
        else if (arg.size() > 1 && arg[0] == '-' && positional.empty()) {
            // before the command name this is a mistyped option; after it, an argument
            throw std::runtime_error("Unknown option: " + arg);
        }
        else {
            // Not an option → positional argument ("-" is stdin/stdout)
            positional.push_back(argv[i]);
        }
    }
}

bool parseArgs(int argc, const char* const argv[], Config& config) {
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("-d", false, "debug");
    args.addOption("--debug", false, "debug");

    args.addOption("-q", false, "quiet");
    args.addOption("--quiet", false, "quiet");

    args.addOption("-v", false, "verbose");
    args.addOption("--verbose", false, "verbose");

    args.addOption("-o", true, "output");
    args.addOption("--output", true, "output");

    args.addOption("-j", true, "jsonPath");
    args.addOption("--jsonPath", true, "jsonPath");

    args.parse(argc, argv);

    // most verbose flag wins
    if(args.has("quiet"))
    {
        config.logLevel = LogLevel::NONE;
    }

    if(args.has("verbose"))
    {
        config.logLevel = LogLevel::INFO;
    }

    if(args.has("debug"))
    {
        config.logLevel = LogLevel::DEBUG;
    }
    Logger::setLevel(config.logLevel);

    if(args.has("output"))
    {
        config.outputFile = args.get("output");
        Logger::debug("Setting output path to " + config.outputFile);
    }

    if(args.has("jsonPath"))
    {
        config.jsonFile = args.get("jsonPath");
        config.jsonOutput = true;
        Logger::debug("Setting json output path to " + config.jsonFile);
    }

    if(args.has("help") || args.positional.empty())
    {
        if (!args.positional.empty())
            Logger::warn("Help requested, not running " + args.positional.front() +
                         "; put arguments that start with - after --");
        return false;
    }

    config.command = args.positional.front();
    config.args.assign(args.positional.begin() + 1, args.positional.end());
    return true;
}
