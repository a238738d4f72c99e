/**
 * @file command_policy.cpp
 * @brief Implementation of the read-only command policy
 *
 * **Classification Pipeline**:
 * ```
 * command line
 *   → SplitSimpleCommands()        (quote-aware split on control operators)
 *   → Tokenize()                   (words with quotes removed, redirects kept)
 *   → redirect check               (> / >> / &> / >| to a real file)
 *   → strip wrappers               (sudo, env, VAR=x, nohup, timeout N, xargs)
 *   → program rules                (rm, mv, sed -i, git commit, pip install, ...)
 * ```
 *
 * Nested `bash -c '<script>'` arguments are classified recursively.
 *
 * @date 2025
 */

#include "envbox/core/command_policy.hpp"
#include "envbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <set>

namespace envbox {
namespace core {

using utils::StringUtils;

namespace {

struct Token {
    std::string text;        ///< Word with quotes removed
    bool is_redirect{false}; ///< Output redirection operator (">", ">>", "&>", ...)
};

// ============================================================================
// PROGRAM TABLES
// ============================================================================

const std::set<std::string>& MutatingPrograms() {
    static const std::set<std::string> programs = {
        "rm", "rmdir", "mv", "cp", "mkdir", "touch", "chmod", "chown", "chgrp",
        "ln", "tee", "truncate", "dd", "shred", "install", "rsync", "patch",
        "unlink", "mkfifo", "mknod", "gzip", "gunzip", "bzip2", "xz", "unxz",
        "zip", "useradd", "userdel", "usermod", "groupadd", "mount", "umount",
        "kill", "pkill", "killall", "reboot", "shutdown", "systemctl", "service",
        "crontab", "wget", "curl", "scp", "sftp"
    };
    return programs;
}

const std::set<std::string>& PackageManagers() {
    static const std::set<std::string> programs = {
        "pip", "pip3", "pipx", "conda", "mamba", "micromamba", "poetry", "pdm",
        "uv", "pipenv", "npm", "yarn", "pnpm", "apt", "apt-get", "aptitude",
        "dpkg", "yum", "dnf", "apk", "brew", "gem", "bundle", "cargo", "go",
        "mvn", "./mvnw", "mvnw", "gradle", "./gradlew", "gradlew", "pyenv",
        "sdk", "make", "cmake", "tox", "nox"
    };
    return programs;
}

const std::set<std::string>& PackageManagerWriteVerbs() {
    static const std::set<std::string> verbs = {
        "install", "uninstall", "remove", "add", "update", "upgrade", "purge",
        "autoremove", "sync", "lock", "create", "init", "build", "compile",
        "package", "clean", "deploy", "publish", "get", "mod", "local", "global",
        "shell", "env", "develop", "link", "unlink", "ci", "-i", "--install",
        "-S", "-U", "-R"
    };
    return verbs;
}

const std::set<std::string>& GitReadVerbs() {
    static const std::set<std::string> verbs = {
        "status", "log", "diff", "show", "ls-files", "ls-tree", "grep", "blame",
        "rev-parse", "rev-list", "describe", "shortlog", "cat-file", "config",
        "remote", "whatchanged", "reflog", "help", "version", "--version"
    };
    return verbs;
}

const std::set<std::string>& ShellKeywords() {
    static const std::set<std::string> keywords = {
        "{", "}", "!", "if", "then", "else", "elif", "fi", "do", "done",
        "while", "until"
    };
    return keywords;
}

const std::set<std::string>& WrapperPrograms() {
    static const std::set<std::string> programs = {
        "sudo", "env", "command", "nohup", "time", "nice", "exec", "builtin"
    };
    return programs;
}

bool IsAssignment(const std::string& word) {
    auto eq = word.find('=');
    return eq != std::string::npos && eq > 0 && StringUtils::IsValidIdentifier(word.substr(0, eq));
}

std::string BaseName(const std::string& program) {
    if (StringUtils::StartsWith(program, "./")) {
        return program;
    }
    auto slash = program.rfind('/');
    return slash == std::string::npos ? program : program.substr(slash + 1);
}

// ============================================================================
// TOKENIZER
// ============================================================================

std::vector<Token> Tokenize(const std::string& simple) {
    std::vector<Token> tokens;
    std::string current;
    bool in_word = false;
    char quote = 0;

    auto flush = [&]() {
        if (in_word) {
            tokens.push_back(Token{current, false});
            current.clear();
            in_word = false;
        }
    };

    for (std::size_t i = 0; i < simple.size(); ++i) {
        char c = simple[i];

        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < simple.size()) {
                current += simple[++i];
            } else {
                current += c;
            }
            continue;
        }

        if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
            continue;
        }
        if (c == '\\' && i + 1 < simple.size()) {
            current += simple[++i];
            in_word = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
            continue;
        }

        if (c == '>' || (c == '&' && i + 1 < simple.size() && simple[i + 1] == '>')) {
            // A pure digit word directly before '>' is a descriptor number
            bool fd_prefix = in_word && !current.empty() &&
                             std::all_of(current.begin(), current.end(),
                                         [](unsigned char d) { return std::isdigit(d); });
            if (fd_prefix) {
                current.clear();
                in_word = false;
            } else {
                flush();
            }

            std::string op(1, c);
            std::size_t j = i + 1;
            if (c == '&') {
                op += '>';
                ++j;
            }
            if (j < simple.size() && (simple[j] == '>' || simple[j] == '|')) {
                op += simple[j++];
            }
            if (j < simple.size() && simple[j] == '&') {
                // >&N duplicates a descriptor
                op += '&';
                ++j;
            }
            tokens.push_back(Token{op, true});
            i = j - 1;
            continue;
        }

        current += c;
        in_word = true;
    }
    flush();
    return tokens;
}

/// `>&N` and `>&-` only touch descriptors; any other target is a file
bool IsHarmlessTarget(const std::string& target, bool duplicates_fd) {
    if (target == "/dev/null" || target == "/dev/stdout" || target == "/dev/stderr") {
        return true;
    }
    if (!duplicates_fd) {
        return false;
    }
    return target == "-" ||
           (!target.empty() && std::all_of(target.begin(), target.end(),
                                           [](unsigned char c) { return std::isdigit(c); }));
}

} // anonymous namespace

// ============================================================================
// SPLITTING
// ============================================================================

std::vector<std::string> CommandPolicy::SplitSimpleCommands(const std::string& command) {
    std::vector<std::string> segments;
    std::string current;
    char quote = 0;

    auto flush = [&]() {
        std::string trimmed = StringUtils::Trim(current);
        if (!trimmed.empty()) {
            segments.push_back(trimmed);
        }
        current.clear();
    };

    for (std::size_t i = 0; i < command.size(); ++i) {
        char c = command[i];

        if (quote == '\'') {
            current += c;
            if (c == '\'') {
                quote = 0;
            }
            continue;
        }
        if (c == '\\' && i + 1 < command.size()) {
            current += c;
            current += command[++i];
            continue;
        }
        if (quote == '"') {
            if (c == '"') {
                quote = 0;
                current += c;
            } else if (c == '$' && i + 1 < command.size() && command[i + 1] == '(') {
                // Command substitution inside double quotes still runs
                flush();
                ++i;
            } else if (c == '`') {
                flush();
            } else {
                current += c;
            }
            continue;
        }

        if (c == '\'' || c == '"') {
            quote = c;
            current += c;
            continue;
        }

        char prev = i > 0 ? command[i - 1] : '\0';
        char next = i + 1 < command.size() ? command[i + 1] : '\0';

        if (c == '&' && (prev == '>' || next == '>')) {
            current += c;
            continue;
        }
        if (c == '|' && prev == '>') {
            current += c;
            continue;
        }
        if (c == '$' && next == '(') {
            flush();
            ++i;
            continue;
        }
        if (c == ';' || c == '&' || c == '|' || c == '\n' || c == '`' || c == '(' || c == ')') {
            flush();
            continue;
        }

        current += c;
    }
    flush();
    return segments;
}

// ============================================================================
// CLASSIFICATION
// ============================================================================

bool CommandPolicy::IsWriteCommand(const std::string& command) const {
    return Check(command).has_value();
}

std::optional<std::string> CommandPolicy::Check(const std::string& command) const {
    for (const auto& simple : SplitSimpleCommands(command)) {
        if (auto reason = CheckSimpleCommand(simple)) {
            spdlog::debug("Write intent in '{}': {}", StringUtils::Truncate(simple, 120), *reason);
            return reason;
        }
    }
    return std::nullopt;
}

std::optional<std::string> CommandPolicy::CheckSimpleCommand(const std::string& simple) const {
    auto tokens = Tokenize(simple);

    // Redirections and plain words
    std::vector<std::string> words;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (!tokens[i].is_redirect) {
            words.push_back(tokens[i].text);
            continue;
        }
        const std::string& op = tokens[i].text;
        if (i + 1 >= tokens.size() || tokens[i + 1].is_redirect) {
            continue;
        }
        const std::string& target = tokens[i + 1].text;
        bool duplicates_fd = StringUtils::EndsWith(op, "&") && op != "&>";
        if (!IsHarmlessTarget(target, duplicates_fd)) {
            return "output redirection to " + target;
        }
        ++i;
    }

    // Strip wrappers and assignments
    std::size_t pos = 0;
    while (pos < words.size()) {
        const std::string& word = words[pos];
        if (IsAssignment(word) || ShellKeywords().count(word) > 0) {
            ++pos;
            continue;
        }
        std::string base = BaseName(word);
        if (WrapperPrograms().count(base) > 0) {
            ++pos;
            while (pos < words.size() && (StringUtils::StartsWith(words[pos], "-") || IsAssignment(words[pos]))) {
                ++pos;
            }
            continue;
        }
        if (base == "timeout") {
            ++pos;
            while (pos < words.size() && StringUtils::StartsWith(words[pos], "-")) {
                ++pos;
            }
            ++pos;  // duration
            continue;
        }
        if (base == "xargs") {
            ++pos;
            while (pos < words.size() && StringUtils::StartsWith(words[pos], "-")) {
                const std::string& flag = words[pos++];
                if ((flag == "-I" || flag == "-n" || flag == "-P" || flag == "-d" ||
                     flag == "-L" || flag == "-s" || flag == "-E") && pos < words.size()) {
                    ++pos;
                }
            }
            continue;
        }
        break;
    }

    if (pos >= words.size()) {
        return std::nullopt;
    }

    const std::string program = BaseName(words[pos]);
    std::vector<std::string> args(words.begin() + static_cast<std::ptrdiff_t>(pos) + 1, words.end());

    if (MutatingPrograms().count(program) > 0) {
        if (program == "curl") {
            // Fetching to stdout is a read
            for (const auto& arg : args) {
                if (arg == "-o" || arg == "-O" || arg == "--output" || arg == "--remote-name" ||
                    StringUtils::StartsWith(arg, "--output=")) {
                    return std::string("curl writes files");
                }
            }
            return std::nullopt;
        }
        if (program == "wget") {
            for (std::size_t i = 0; i < args.size(); ++i) {
                if (args[i] == "-O-" || args[i] == "-qO-" || args[i] == "--output-document=-" ||
                    ((args[i] == "-O" || args[i] == "-qO") && i + 1 < args.size() && args[i + 1] == "-")) {
                    return std::nullopt;
                }
            }
            return std::string("wget writes files");
        }
        return program + " modifies the filesystem";
    }

    if (program == "sed" || program == "perl") {
        for (const auto& arg : args) {
            if (arg == "-i" || StringUtils::StartsWith(arg, "-i") || arg == "--in-place" ||
                StringUtils::StartsWith(arg, "--in-place=") ||
                (StringUtils::StartsWith(arg, "-") && !StringUtils::StartsWith(arg, "--") &&
                 arg.find('i') != std::string::npos && program == "perl")) {
                return program + " in-place edit";
            }
        }
        return std::nullopt;
    }

    if (program == "tar") {
        if (!args.empty()) {
            std::string mode = args[0];
            if (StringUtils::StartsWith(mode, "--")) {
                for (const auto& arg : args) {
                    if (arg == "--extract" || arg == "--create" || arg == "--append" || arg == "--update" ||
                        arg == "--delete" || arg == "--get") {
                        return "tar modifies archives or files";
                    }
                }
                return std::nullopt;
            }
            if (mode.find_first_of("xcruA") != std::string::npos) {
                return "tar modifies archives or files";
            }
        }
        return std::nullopt;
    }

    if (program == "unzip") {
        for (const auto& arg : args) {
            if (arg == "-l" || arg == "-t" || arg == "-v" || arg == "-Z") {
                return std::nullopt;
            }
        }
        return "unzip extracts files";
    }

    if (program == "find") {
        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "-delete" || arg == "-fprint" || arg == "-fprintf" || arg == "-fls") {
                return "find " + arg;
            }
            if ((arg == "-exec" || arg == "-execdir" || arg == "-ok" || arg == "-okdir") && i + 1 < args.size()) {
                std::vector<std::string> inner;
                for (std::size_t j = i + 1; j < args.size() && args[j] != ";" && args[j] != "+"; ++j) {
                    inner.push_back(args[j]);
                }
                if (auto reason = CheckSimpleCommand(StringUtils::Join(inner, " "))) {
                    return "find " + arg + ": " + *reason;
                }
            }
        }
        return std::nullopt;
    }

    if (program == "git") {
        std::size_t i = 0;
        // Global options: -C <dir>, -c k=v, --no-pager, ...
        while (i < args.size() && StringUtils::StartsWith(args[i], "-")) {
            if ((args[i] == "-C" || args[i] == "-c") && i + 1 < args.size()) {
                ++i;
            }
            ++i;
        }
        if (i >= args.size()) {
            return std::nullopt;
        }
        const std::string& verb = args[i];
        if (GitReadVerbs().count(verb) > 0) {
            return std::nullopt;
        }
        if (verb == "branch" || verb == "tag" || verb == "stash") {
            bool listing = true;
            for (std::size_t j = i + 1; j < args.size(); ++j) {
                const std::string& a = args[j];
                if (verb == "stash" && (a == "list" || a == "show")) {
                    return std::nullopt;
                }
                if (a != "-a" && a != "-r" && a != "-l" && a != "--list" && a != "-v" && a != "-vv" &&
                    a != "--all" && a != "--remotes" && !StringUtils::StartsWith(a, "--format") &&
                    !StringUtils::StartsWith(a, "--sort")) {
                    listing = false;
                }
            }
            if (listing && verb != "stash") {
                return std::nullopt;
            }
        }
        return "git " + verb;
    }

    if (PackageManagers().count(program) > 0) {
        if (program == "make" || program == "cmake") {
            return program + " builds artifacts";
        }
        // Verbs may follow a sub-tool ("uv pip install", "npm run build")
        int positional = 0;
        for (const auto& arg : args) {
            if (PackageManagerWriteVerbs().count(arg) > 0) {
                return program + " " + arg;
            }
            if (!StringUtils::StartsWith(arg, "-") && ++positional >= 2) {
                break;
            }
        }
        // "mvn compile", "gradle test" and friends use goals, not verbs
        if ((program == "mvn" || program == "./mvnw" || program == "mvnw" ||
             program == "gradle" || program == "./gradlew" || program == "gradlew") && !args.empty()) {
            for (const auto& arg : args) {
                if (!StringUtils::StartsWith(arg, "-") && arg != "help" && arg != "tasks" &&
                    arg != "dependencies" && arg != "dependency:tree" && arg != "projects" &&
                    arg != "properties" && arg != "help:effective-pom") {
                    return program + " " + arg;
                }
            }
        }
        return std::nullopt;
    }

    if (program == "python" || program == "python3" || StringUtils::StartsWith(program, "python3.")) {
        for (std::size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == "-m" && (args[i + 1] == "pip" || args[i + 1] == "venv" || args[i + 1] == "ensurepip")) {
                if (args[i + 1] != "pip") {
                    return "python -m " + args[i + 1];
                }
                std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(i) + 2, args.end());
                return CheckSimpleCommand("pip " + StringUtils::Join(rest, " "));
            }
        }
        for (const auto& arg : args) {
            if (arg == "setup.py") {
                return "python setup.py";
            }
        }
        return std::nullopt;
    }

    if (program == "bash" || program == "sh" || program == "zsh" || program == "dash") {
        for (std::size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == "-c" || (StringUtils::StartsWith(args[i], "-") && args[i].find('c') != std::string::npos &&
                                    !StringUtils::StartsWith(args[i], "--"))) {
                return Check(args[i + 1]);
            }
        }
        return std::nullopt;
    }

    return std::nullopt;
}

} // namespace core
} // namespace envbox
