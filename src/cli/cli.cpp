#include "cli/cli.hpp"
#include "files/chunker.hpp"
#include "files/dechunker.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <limits>
#include <map>

namespace fs = std::filesystem;

namespace {

struct ParsedArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options; // canonical name -> value
};

// `value_options` maps every accepted spelling to its canonical name.
bool parse_args(const std::vector<std::string>& args,
                const std::map<std::string, std::string>& value_options,
                ParsedArgs& out, std::string& error) {
    bool options_done = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (options_done || arg.size() < 2 || arg[0] != '-') {
            out.positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        std::string name = arg;
        std::string value;
        bool has_value = false;
        auto eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            has_value = true;
        }

        auto it = value_options.find(name);
        if (it == value_options.end()) {
            error = "Unknown option: " + name;
            return false;
        }
        if (!has_value) {
            if (i + 1 >= args.size()) {
                error = "Option " + name + " needs a value";
                return false;
            }
            value = args[++i];
        }
        out.options[it->second] = value;
    }
    return true;
}

// Accepts a positive decimal integer.
bool parse_positive(const std::string& text, uint64_t& out) {
    if (text.empty() || text.size() > 19) return false;
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value == 0) return false;
    out = value;
    return true;
}

} // namespace

CLI::CLI(int argc, char* argv[]) : program_(argc > 0 ? fs::path(argv[0]).filename().string() : "chunker") {
    for (int i = 1; i < argc; ++i) {
        args_.emplace_back(argv[i]);
    }
}

CLI::CLI(std::vector<std::string> args) : program_("chunker"), args_(std::move(args)) {}

int CLI::run() {
    if (!apply_global_flags()) {
        return EXIT_CODE_USAGE;
    }
    if (help_requested_) {
        print_help(std::cout);
        return EXIT_CODE_SUCCESS;
    }
    if (args_.empty()) {
        print_help(std::cerr);
        return EXIT_CODE_USAGE;
    }

    std::string cmd = args_.front();
    std::vector<std::string> rest(args_.begin() + 1, args_.end());
    try {
        return handle_command(cmd, rest);
    } catch (const ChunkerError& e) {
        LOG_ERR(e.what());
    } catch (const fs::filesystem_error& e) {
        LOG_ERR(e.what());
    } catch (const std::exception& e) {
        LOG_ERR("Unexpected error: ", e.what());
    }
    return EXIT_CODE_ERROR;
}

void CLI::print_help(std::ostream& out) {
    out << "Splits files into chunks small enough to get past an upload size limit, and joins them back.\n"
        << "\n"
        << "Usage: " << program_ << " [global options] <command> [arguments]\n"
        << "\n"
        << "Commands:\n"
        << "  encode <input_file_or_dir> <output_dir> [-s <MB>] [--chunk-bytes <N>]\n"
        << "                            - Pack a file or a whole directory tree into chunks\n"
        << "      -s, --chunk-size <MB> - Size of each chunk in MB (default " << DEFAULT_CHUNK_MB << ")\n"
        << "      --chunk-bytes <N>     - Size of each chunk in bytes\n"
        << "  decode <chunk_dir> [-o <output_dir>]\n"
        << "                            - Restore the original files\n"
        << "      -o, --outdir <dir>    - Where to write them (default: current directory)\n"
        << "  info <chunk_dir>          - Show what a chunk directory holds\n"
        << "  help                      - Show this help\n"
        << "\n"
        << "Global options:\n"
        << "  -v, --verbose             - Debug output\n"
        << "  -q, --quiet               - Only warnings and errors\n"
        << "  --log-file <path>         - Also append log lines to this file\n"
        << "  -h, --help                - Show this help\n"
        << "\n"
        << "Global options are recognised anywhere on the command line.\n"
        << "Put '--' before any path that starts with '-'.\n";
}

bool CLI::apply_global_flags() {
    bool verbose = false;
    bool quiet = false;
    std::vector<std::string> remaining;
    for (size_t i = 0; i < args_.size(); ++i) {
        const std::string& arg = args_[i];
        if (arg == "--") {
            remaining.insert(remaining.end(), args_.begin() + static_cast<std::ptrdiff_t>(i), args_.end());
            break;
        }
        if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            help_requested_ = true;
        } else if (arg == "--log-file") {
            if (i + 1 >= args_.size()) {
                usage_error("Option --log-file needs a value");
                return false;
            }
            Logger::instance().init(args_[++i]);
        } else if (arg.compare(0, 11, "--log-file=") == 0) {
            Logger::instance().init(arg.substr(11));
        } else {
            remaining.push_back(arg);
        }
    }
    if (verbose && quiet) {
        usage_error("--verbose and --quiet cannot be combined");
        return false;
    }
    if (verbose) Logger::instance().set_level(LogLevel::DEBUG);
    if (quiet) Logger::instance().set_level(LogLevel::WARNING);
    args_ = std::move(remaining);
    return true;
}

int CLI::usage_error(const std::string& message) {
    std::cerr << program_ << ": " << message << "\n"
              << "Run '" << program_ << " help' for usage." << std::endl;
    return EXIT_CODE_USAGE;
}

int CLI::handle_command(const std::string& cmd, const std::vector<std::string>& args) {
    if (cmd == "encode") return cmd_encode(args);
    if (cmd == "decode") return cmd_decode(args);
    if (cmd == "info") return cmd_info(args);
    if (cmd == "help") {
        print_help(std::cout);
        return EXIT_CODE_SUCCESS;
    }
    return usage_error("Unknown command: " + cmd);
}

int CLI::cmd_encode(const std::vector<std::string>& args) {
    ParsedArgs parsed;
    std::string error;
    if (!parse_args(args, {{"-s", "chunk-size"}, {"--chunk-size", "chunk-size"}, {"--chunk-bytes", "chunk-bytes"}},
                    parsed, error)) {
        return usage_error(error);
    }
    if (parsed.positional.size() != 2) {
        return usage_error("Usage: encode <input_file_or_dir> <output_dir> [-s <MB>]");
    }

    EncodeOptions options;
    options.input = parsed.positional[0];
    options.output_dir = parsed.positional[1];

    auto mb = parsed.options.find("chunk-size");
    auto bytes = parsed.options.find("chunk-bytes");
    if (mb != parsed.options.end() && bytes != parsed.options.end()) {
        return usage_error("--chunk-size and --chunk-bytes cannot be combined");
    }
    if (mb != parsed.options.end()) {
        uint64_t value = 0;
        if (!parse_positive(mb->second, value) || value > std::numeric_limits<uint64_t>::max() / BYTES_PER_MB) {
            return usage_error("Invalid chunk size in MB: " + mb->second);
        }
        options.chunk_size = value * BYTES_PER_MB;
    } else if (bytes != parsed.options.end()) {
        uint64_t value = 0;
        if (!parse_positive(bytes->second, value)) {
            return usage_error("Invalid chunk size in bytes: " + bytes->second);
        }
        options.chunk_size = value;
    }

    LOG_DEBUG("Encoding '", options.input.string(), "' into '", options.output_dir.string(),
              "' with ", options.chunk_size, "-byte chunks");
    Chunker chunker(options);
    chunker.encode();
    return EXIT_CODE_SUCCESS;
}

int CLI::cmd_decode(const std::vector<std::string>& args) {
    ParsedArgs parsed;
    std::string error;
    if (!parse_args(args, {{"-o", "outdir"}, {"--outdir", "outdir"}}, parsed, error)) {
        return usage_error(error);
    }
    if (parsed.positional.size() != 1) {
        return usage_error("Usage: decode <chunk_dir> [-o <output_dir>]");
    }

    DecodeOptions options;
    options.input_dir = parsed.positional[0];
    auto outdir = parsed.options.find("outdir");
    if (outdir != parsed.options.end()) {
        options.output_dir = outdir->second;
    }

    Dechunker dechunker(options);
    LOG_DEBUG("Decoding '", options.input_dir.string(), "' into '", dechunker.output_dir().string(), "'");
    dechunker.decode();
    return EXIT_CODE_SUCCESS;
}

int CLI::cmd_info(const std::vector<std::string>& args) {
    ParsedArgs parsed;
    std::string error;
    if (!parse_args(args, {}, parsed, error)) {
        return usage_error(error);
    }
    if (parsed.positional.size() != 1) {
        return usage_error("Usage: info <chunk_dir>");
    }

    DecodeOptions options;
    options.input_dir = parsed.positional[0];
    Dechunker dechunker(options);
    Header header = dechunker.inspect();
    header.print(std::cout);
    return EXIT_CODE_SUCCESS;
}
