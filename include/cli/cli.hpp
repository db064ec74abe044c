#ifndef CHUNKER_CLI_HPP
#define CHUNKER_CLI_HPP

#include <string>
#include <vector>
#include <iostream>

// Exit statuses returned by CLI::run()
constexpr int EXIT_CODE_SUCCESS = 0;
constexpr int EXIT_CODE_ERROR = 1;
constexpr int EXIT_CODE_USAGE = 2;

class CLI {
public:
    CLI(int argc, char* argv[]);
    explicit CLI(std::vector<std::string> args);

    // Parses the arguments, runs one command and returns the exit status.
    int run();

private:
    void print_help(std::ostream& out);
    int handle_command(const std::string& cmd, const std::vector<std::string>& args);

    int cmd_encode(const std::vector<std::string>& args);
    int cmd_decode(const std::vector<std::string>& args);
    int cmd_info(const std::vector<std::string>& args);

    // Pulls global flags (-v, -q, --log-file, -h) out of args_.
    bool apply_global_flags();
    int usage_error(const std::string& message);

    std::string program_;
    std::vector<std::string> args_;
    bool help_requested_ = false;
};

#endif // CHUNKER_CLI_HPP
