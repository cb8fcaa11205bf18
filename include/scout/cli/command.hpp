#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace scout::cli {

class CommandContext;

// A node of the command tree, parsed with boost::program_options
class Command {
public:
    Command(const std::string& name, const std::string& description);
    virtual ~Command() = default;

    std::string name() const { return name_; }
    std::string description() const { return description_; }

    void add_command(std::shared_ptr<Command> cmd);
    std::shared_ptr<Command> find_command(const std::string& name) const;
    const std::vector<std::shared_ptr<Command>>& subcommands() const {
        return subcommands_;
    }

    void add_flag_with_short(const std::string& name,
                             const std::string& short_name,
                             const std::string& description,
                             const std::string& default_value = "");
    void add_bool_flag_with_short(const std::string& name,
                                  const std::string& short_name,
                                  const std::string& description);
    void add_int_flag(const std::string& name, const std::string& description,
                      int default_value = 0);

    virtual int run(CommandContext& ctx) = 0;

    // Parses argv, dispatches to the matching subcommand and returns its
    // exit code
    int execute(int argc, char* argv[]);

    void print_help() const;

    Command& set_long_description(const std::string& desc) {
        long_description_ = desc;
        return *this;
    }
    Command& set_usage(const std::string& usage) {
        usage_ = usage;
        return *this;
    }
    Command& set_example(const std::string& example) {
        example_ = example;
        return *this;
    }

protected:
    struct Flag {
        std::string name;
        std::string short_name;
        std::string description;
        std::string default_value;
        std::string type;  // "string", "bool", "int"
    };

    std::string name_;
    std::string description_;
    std::string long_description_;
    std::string usage_;
    std::string example_;

    std::vector<std::shared_ptr<Command>> subcommands_;
    std::vector<Flag> flags_;

private:
    int parse_and_execute(const std::vector<std::string>& args);
};

class CommandContext {
public:
    void set_flag(const std::string& name, const std::string& value) {
        flags_[name] = value;
    }
    void set_user_flag(const std::string& name, const std::string& value) {
        flags_[name] = value;
        user_provided_flags_.insert(name);
    }
    std::string get_flag(const std::string& name) const;
    bool get_bool_flag(const std::string& name) const;
    int get_int_flag(const std::string& name) const;
    bool is_user_provided(const std::string& name) const {
        return user_provided_flags_.count(name) > 0;
    }

    void add_arg(const std::string& arg) { args_.emplace_back(arg); }
    const std::vector<std::string>& args() const { return args_; }

private:
    std::unordered_map<std::string, std::string> flags_;
    std::unordered_set<std::string> user_provided_flags_;
    std::vector<std::string> args_;
};

}  // namespace scout::cli
