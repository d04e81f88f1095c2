#include "diag.hpp"
#include "lexer.hpp"
#include "print_tokens.hpp"
#include "runner.hpp"
#include "sample.hpp"
#include "source.hpp"
#include "transpiler.hpp"
#include "vocabulary.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

static const char* USAGE =
    "Usage: amhapy <file.amha> [--tokens] [--emit] [--run] [--out <file.py>]\n"
    "                          [--python <interpreter>] [--no-color] [--verbose]\n"
    "       amhapy --sample <file.amha>\n";

// Exit codes
static constexpr int EXIT_USAGE = 1;
static constexpr int EXIT_LEX = 2;
static constexpr int EXIT_TRANSPILE = 3;
static constexpr int EXIT_EXECUTION = 4;

struct Options {
    std::string input;
    std::string out_path;
    std::string sample_path;
    std::string python = "python3";
    bool tokens = false;
    bool emit = false;
    bool run = false;
    bool colour = true;
    bool verbose = false;
};

static std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file: " + path);
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

static void write_file(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::out | std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for writing: " + path);
    file << text;
    if (!file) throw std::runtime_error("Failed to write file: " + path);
}

// Environment first, so flags override it. Returns false on a usage error.
static bool parse_args(int argc, char** argv, Options& opt) {
    if (const char* env = std::getenv("AMHAPY_PYTHON"); env && *env) opt.python = env;
    if (const char* env = std::getenv("NO_COLOR"); env && *env) opt.colour = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto value = [&](std::string& dst) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            dst = argv[++i];
            return true;
        };

        if (std::strcmp(arg, "--tokens") == 0) opt.tokens = true;
        else if (std::strcmp(arg, "--emit") == 0) opt.emit = true;
        else if (std::strcmp(arg, "--run") == 0) opt.run = true;
        else if (std::strcmp(arg, "--no-color") == 0) opt.colour = false;
        else if (std::strcmp(arg, "--verbose") == 0) opt.verbose = true;
        else if (std::strcmp(arg, "--out") == 0) { if (!value(opt.out_path)) return false; }
        else if (std::strcmp(arg, "--python") == 0) { if (!value(opt.python)) return false; }
        else if (std::strcmp(arg, "--sample") == 0) { if (!value(opt.sample_path)) return false; }
        else if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        else if (opt.input.empty()) opt.input = arg;
        else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return false;
        }
    }

    if (opt.input.empty() && opt.sample_path.empty()) {
        std::cerr << "Missing input file\n";
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            std::cout << USAGE;
            return 0;
        }
    }

    Options opt;
    if (!parse_args(argc, argv, opt)) {
        std::cerr << USAGE;
        return EXIT_USAGE;
    }

    try {
        if (!opt.sample_path.empty()) {
            write_sample(opt.sample_path);
            std::cout << "Sample program written to " << opt.sample_path << "\n";
            if (opt.input.empty()) return 0;
        }

        Source src(opt.input, read_file(opt.input));
        DiagnosticEngine diag(src, opt.colour);
        const Vocabulary& vocab = amhapy_vocabulary();

        // 1. Lex
        if (opt.verbose) diag.note("Tokenizing " + src.filename() + "...");
        LexResult lexed = lex(src, vocab);
        if (!lexed.ok()) {
            diag.report(*lexed.error);
            return EXIT_LEX;
        }

        if (opt.tokens) {
            print_tokens(lexed.tokens, std::cout);
            return 0;
        }

        // 2. Transpile
        if (opt.verbose) diag.note("Transpiling " + std::to_string(lexed.tokens.size()) + " tokens...");
        TranspileResult py = transpile(lexed.tokens, vocab);
        if (!py.ok()) {
            diag.report(*py.error);
            return EXIT_TRANSPILE;
        }

        // 3. Output
        if (!opt.out_path.empty()) {
            write_file(opt.out_path, py.text + "\n");
            if (opt.verbose) diag.note("Wrote " + opt.out_path);
        }

        if (opt.emit || !opt.run) {
            if (opt.run) std::cout << "--- Transpiled Python Code ---\n";
            std::cout << py.text << "\n";
            if (opt.run) std::cout << "------------------------------\n";
        }

        // 4. Execute
        if (opt.run) {
            if (opt.verbose) diag.note("Running with " + opt.python + "...");
            RunResult run = run_python(py.text, opt.python);
            if (!run.launched) {
                diag.report(DiagLevel::Error, SourceLoc{0, 0, 0}, "interpreter not found: " + opt.python);
                return EXIT_USAGE;
            }
            std::cout << "--- Program Output ---\n" << run.output;
            if (!run.output.empty() && run.output.back() != '\n') std::cout << "\n";
            std::cout << "----------------------\n";

            if (run.exit_code != 0) {
                diag.report(DiagLevel::Error, SourceLoc{0, 0, 0},
                            "execution error: " + opt.python + " exited with status " +
                            std::to_string(run.exit_code));
                return EXIT_EXECUTION;
            }
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
}
