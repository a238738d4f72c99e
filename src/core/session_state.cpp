/**
 * @file session_state.cpp
 * @brief Implementation of shell state capture and replay
 *
 * **Snapshot Format** (written by the EXIT trap after the marker):
 * ```
 * \n<marker>\n
 * <exit status>\n
 * <pwd>\n
 * K1=V1\0K2=V2\0...
 * ```
 *
 * Values may contain newlines, hence the NUL-separated `env -0` dump.
 *
 * @date 2025
 */

#include "envbox/core/session_state.hpp"
#include "envbox/utils/hash_utils.hpp"
#include "envbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace envbox {
namespace core {

using utils::StringUtils;

namespace {

const std::set<std::string>& ShellManagedVariables() {
    static const std::set<std::string> names = {
        "_", "PWD", "OLDPWD", "SHLVL", "HOSTNAME",
        "SHELLOPTS", "BASHOPTS", "BASH_ENV", "PS1", "PS2"
    };
    return names;
}

} // anonymous namespace

// ============================================================================
// STATE MUTATION
// ============================================================================

void SessionState::SetVariable(const std::string& name, const std::string& value) {
    environment_[name] = value;
    unset_variables_.erase(name);
}

void SessionState::SetWorkingDirectory(const std::string& path) {
    working_dir_ = path;
}

void SessionState::Apply(const StateSnapshot& snapshot) {
    std::map<std::string, std::string> replayable;
    for (const auto& [name, value] : snapshot.environment) {
        if (IsReplayable(name)) {
            replayable[name] = value;
        }
    }

    for (const auto& [name, value] : environment_) {
        if (replayable.count(name) == 0) {
            unset_variables_.insert(name);
        }
    }
    for (const auto& [name, value] : replayable) {
        unset_variables_.erase(name);
    }

    environment_ = std::move(replayable);
    if (!snapshot.working_dir.empty()) {
        working_dir_ = snapshot.working_dir;
    }
    last_exit_code_ = snapshot.exit_code;
}

void SessionState::Clear() {
    environment_.clear();
    unset_variables_.clear();
    working_dir_.reset();
    last_exit_code_.reset();
}

bool SessionState::IsReplayable(const std::string& name) {
    return StringUtils::IsValidIdentifier(name) && ShellManagedVariables().count(name) == 0;
}

// ============================================================================
// SCRIPT GENERATION
// ============================================================================

std::string SessionState::BuildScript(const std::string& command, const std::string& marker) const {
    std::ostringstream script;

    script << "__envbox_capture() {\n"
           << "  __envbox_rc=$?\n"
           << "  trap - EXIT\n"
           << "  printf '\\n%s\\n' " << StringUtils::ShellQuote(marker) << "\n"
           << "  printf '%s\\n' \"$__envbox_rc\"\n"
           << "  pwd\n"
           << "  env -0\n"
           << "  exit \"$__envbox_rc\"\n"
           << "}\n"
           << "trap __envbox_capture EXIT\n";

    for (const auto& name : unset_variables_) {
        script << "unset " << name << " 2>/dev/null\n";
    }

    for (const auto& [name, value] : environment_) {
        script << "export " << name << "=" << StringUtils::ShellQuote(value) << " 2>/dev/null\n";
    }

    if (working_dir_) {
        script << "cd -- " << StringUtils::ShellQuote(*working_dir_) << " 2>/dev/null\n";
    }

    script << command << "\n";
    return script.str();
}

// ============================================================================
// OUTPUT PARSING
// ============================================================================

SplitResult SessionState::SplitOutput(const std::string& raw, const std::string& marker) {
    SplitResult result;

    const std::string needle = "\n" + marker + "\n";
    auto pos = raw.rfind(needle);
    if (pos == std::string::npos) {
        result.output = raw;
        return result;
    }

    result.output = raw.substr(0, pos);

    std::string tail = raw.substr(pos + needle.size());

    auto status_end = tail.find('\n');
    if (status_end == std::string::npos) {
        spdlog::debug("State snapshot truncated after marker");
        return result;
    }
    auto pwd_end = tail.find('\n', status_end + 1);
    if (pwd_end == std::string::npos) {
        spdlog::debug("State snapshot missing working directory");
        return result;
    }

    StateSnapshot snapshot;
    try {
        snapshot.exit_code = std::stoi(tail.substr(0, status_end));
    } catch (const std::exception&) {
        spdlog::debug("Unparseable exit status in state snapshot");
        return result;
    }
    snapshot.working_dir = tail.substr(status_end + 1, pwd_end - status_end - 1);

    std::size_t begin = pwd_end + 1;
    while (begin < tail.size()) {
        auto end = tail.find('\0', begin);
        if (end == std::string::npos) {
            end = tail.size();
        }
        std::string entry = tail.substr(begin, end - begin);
        auto eq = entry.find('=');
        if (eq != std::string::npos && eq > 0) {
            snapshot.environment[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
        begin = end + 1;
    }

    result.snapshot = std::move(snapshot);
    return result;
}

std::string SessionState::NewMarker() {
    return "__ENVBOX_STATE_" + utils::HashUtils::RandomToken(24) + "__";
}

// ============================================================================
// SERIALIZATION
// ============================================================================

json SessionState::ToJson() const {
    json j;
    j["environment"] = environment_;
    j["unset_variables"] = unset_variables_;
    j["working_dir"] = working_dir_ ? json(*working_dir_) : json(nullptr);
    j["last_exit_code"] = last_exit_code_ ? json(*last_exit_code_) : json(nullptr);
    return j;
}

SessionState SessionState::FromJson(const json& j) {
    SessionState state;
    state.environment_ = j.value("environment", std::map<std::string, std::string>{});
    state.unset_variables_ = j.value("unset_variables", std::set<std::string>{});
    if (j.contains("working_dir") && j["working_dir"].is_string()) {
        state.working_dir_ = j["working_dir"].get<std::string>();
    }
    if (j.contains("last_exit_code") && j["last_exit_code"].is_number_integer()) {
        state.last_exit_code_ = j["last_exit_code"].get<int>();
    }
    return state;
}

} // namespace core
} // namespace envbox
