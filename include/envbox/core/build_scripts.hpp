/**
 * @file build_scripts.hpp
 * @brief Embedded in-container build scripts and bootstrap handling
 *
 * Every build script follows the same contract: it runs from the mounted
 * repository root, sources `./bootstrap_script.sh` when present, runs the
 * language's check, and writes `build_output/results.json`.
 *
 * @date 2025
 */

#pragma once

#include "envbox/core/job.hpp"

#include <string>

namespace envbox {
namespace core {

/**
 * @class BuildScripts
 * @brief Script texts injected into a checkout before a batch job
 *
 * All methods are static.
 */
class BuildScripts {
public:
    static constexpr const char* kBuildScriptName = "build.sh";
    static constexpr const char* kBootstrapScriptName = "bootstrap_script.sh";
    static constexpr const char* kResultFile = "build_output/results.json";

    /**
     * @brief Build script for a language
     *
     * - python: pyright; `issues_count` = missing-import errors
     * - jvm: Maven or Gradle compile; `issues_count` = compiler errors
     * - repo2run: `pytest --collect-only` JSON report under `pytest`
     */
    static std::string BuildScript(Language language);

    /**
     * @brief Default bootstrap used when a job supplies none
     *
     * repo2run shares the python baseline.
     */
    static std::string BaselineBootstrap(Language language);

    /**
     * @brief Remove compile/test invocations from a bootstrap script
     *
     * Drops every line whose trimmed text starts with `mvn compile`,
     * `./mvnw compile`, `mvn test`, `./mvnw test`, `gradle build`,
     * `./gradlew build`, `gradle test` or `./gradlew test`; the build script
     * runs those itself.
     */
    static std::string SanitizeBootstrap(const std::string& script);

    /**
     * @brief Whether a (trimmed) line is one SanitizeBootstrap() removes
     */
    static bool IsBuildCommand(const std::string& line);
};

} // namespace core
} // namespace envbox
