#include "scout/cli/command.hpp"

#include <algorithm>
#include <boost/program_options.hpp>
#include <iomanip>
#include <iostream>

namespace po = boost::program_options;

namespace scout::cli {

Command::Command(const std::string& name, const std::string& description)
    : name_(name), description_(description) {}

void Command::add_command(std::shared_ptr<Command> cmd) {
    subcommands_.push_back(std::move(cmd));
}

std::shared_ptr<Command> Command::find_command(const std::string& name) const {
    auto it = std::find_if(subcommands_.begin(), subcommands_.end(),
                           [&name](const std::shared_ptr<Command>& cmd) {
                               return cmd->name() == name;
                           });
    return it != subcommands_.end() ? *it : nullptr;
}

void Command::add_flag_with_short(const std::string& name,
                                  const std::string& short_name,
                                  const std::string& description,
                                  const std::string& default_value) {
    flags_.push_back({name, short_name, description, default_value, "string"});
}

void Command::add_bool_flag_with_short(const std::string& name,
                                       const std::string& short_name,
                                       const std::string& description) {
    flags_.push_back({name, short_name, description, "false", "bool"});
}

void Command::add_int_flag(const std::string& name,
                           const std::string& description, int default_value) {
    flags_.push_back(
        {name, "", description, std::to_string(default_value), "int"});
}

int Command::execute(int argc, char* argv[]) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        return parse_and_execute(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int Command::parse_and_execute(const std::vector<std::string>& args) {
    // A leading subcommand name takes over the rest of the arguments
    if (!args.empty() && !subcommands_.empty()) {
        if (auto subcmd = find_command(args.front())) {
            return subcmd->parse_and_execute(
                std::vector<std::string>(args.begin() + 1, args.end()));
        }
    }

    po::options_description desc("Options");
    desc.add_options()("help,h", "Show help message");

    for (const auto& flag : flags_) {
        std::string option_spec = flag.name;
        if (!flag.short_name.empty()) {
            option_spec += "," + flag.short_name;
        }

        if (flag.type == "bool") {
            desc.add_options()(option_spec.c_str(), flag.description.c_str());
        } else if (flag.type == "int") {
            desc.add_options()(
                option_spec.c_str(),
                po::value<int>()->default_value(std::stoi(flag.default_value)),
                flag.description.c_str());
        } else {
            desc.add_options()(
                option_spec.c_str(),
                po::value<std::string>()->default_value(flag.default_value),
                flag.description.c_str());
        }
    }

    po::positional_options_description positional;
    positional.add("args", -1);
    desc.add_options()("args", po::value<std::vector<std::string>>(),
                       "Positional arguments");

    po::variables_map vm;
    po::store(po::command_line_parser(args)
                  .options(desc)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);

    if (vm.count("help")) {
        print_help();
        return 0;
    }

    CommandContext ctx;
    for (const auto& flag : flags_) {
        // Flags with defaults are always stored, defaulted() tells them apart
        bool user_provided = vm.count(flag.name) && !vm[flag.name].defaulted();
        std::string value = flag.default_value;
        if (vm.count(flag.name)) {
            if (flag.type == "bool") {
                value = "true";
            } else if (flag.type == "int") {
                value = std::to_string(vm[flag.name].as<int>());
            } else {
                value = vm[flag.name].as<std::string>();
            }
        }
        if (user_provided) {
            ctx.set_user_flag(flag.name, value);
        } else {
            ctx.set_flag(flag.name, value);
        }
    }

    if (vm.count("args")) {
        for (const auto& arg : vm["args"].as<std::vector<std::string>>()) {
            ctx.add_arg(arg);
        }
    }

    return run(ctx);
}

void Command::print_help() const {
    std::cout << name_ << " - " << description_ << std::endl << std::endl;

    if (!long_description_.empty()) {
        std::cout << long_description_ << std::endl << std::endl;
    }

    if (!usage_.empty()) {
        std::cout << "Usage: " << usage_ << std::endl << std::endl;
    } else {
        std::cout << "Usage: " << name_;
        if (!flags_.empty()) {
            std::cout << " [OPTIONS]";
        }
        if (!subcommands_.empty()) {
            std::cout << " <COMMAND>";
        }
        std::cout << std::endl << std::endl;
    }

    if (!subcommands_.empty()) {
        std::cout << "Available Commands:" << std::endl;
        for (const auto& cmd : subcommands_) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name()
                      << cmd->description() << std::endl;
        }
        std::cout << std::endl;
    }

    if (!flags_.empty()) {
        std::cout << "Flags:" << std::endl;
        for (const auto& flag : flags_) {
            std::cout << "  --" << std::left << std::setw(12) << flag.name;
            if (!flag.short_name.empty()) {
                std::cout << "-" << flag.short_name << ", ";
            } else {
                std::cout << "    ";
            }
            std::cout << flag.description;
            if (flag.type != "bool" && !flag.default_value.empty()) {
                std::cout << " (default: " << flag.default_value << ")";
            }
            std::cout << std::endl;
        }
        std::cout << std::endl;
    }

    if (!example_.empty()) {
        std::cout << "Examples:" << std::endl << example_ << std::endl
                  << std::endl;
    }

    if (!subcommands_.empty()) {
        std::cout << "Use '" << name_
                  << " <command> --help' for more information about a command."
                  << std::endl;
    }
}

std::string CommandContext::get_flag(const std::string& name) const {
    auto it = flags_.find(name);
    return it != flags_.end() ? it->second : "";
}

bool CommandContext::get_bool_flag(const std::string& name) const {
    std::string value = get_flag(name);
    return value == "true" || value == "1";
}

int CommandContext::get_int_flag(const std::string& name) const {
    std::string value = get_flag(name);
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return 0;
    }
}

}  // namespace scout::cli
