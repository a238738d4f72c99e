/**
 * @file build_scripts.cpp
 * @brief Embedded build and bootstrap scripts
 *
 * @date 2025
 */

#include "envbox/core/build_scripts.hpp"
#include "envbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <sstream>

namespace envbox {
namespace core {

using utils::StringUtils;

namespace {

const char* const kPythonBuild = R"SCRIPT(#!/bin/bash

set -e

mkdir -p build_output
chmod -R 777 .

if [ -f "./bootstrap_script.sh" ]; then
  echo "Bootstrap script contents:"
  cat ./bootstrap_script.sh
  echo "Running bootstrap script..."
  source ./bootstrap_script.sh
fi

echo "Using $(python --version) located at $(which python)"

if ! command -v pyright &> /dev/null; then
  python -m pip install --quiet pyright
fi

echo "Running pyright..."
pyright --outputjson /data/project > build_output/pyright_output.json || true

if ! python -c "import json; json.load(open('build_output/pyright_output.json'))" 2> /dev/null; then
  echo "Failed to get valid pyright output"
  exit 1
fi

python - << 'PY'
import json

with open("build_output/pyright_output.json") as f:
    report = json.load(f)

missing = [
    d for d in report.get("generalDiagnostics", [])
    if d.get("severity") == "error" and d.get("rule") == "reportMissingImports"
]

with open("build_output/results.json", "w") as f:
    json.dump({"issues_count": len(missing), "missing_imports": missing}, f)
PY

chmod -R 777 .
exit 0
)SCRIPT";

const char* const kJvmBuild = R"SCRIPT(#!/bin/bash

set -e

mkdir -p build_output
chmod -R 777 .

if [ -f "./bootstrap_script.sh" ]; then
  echo "Bootstrap script contents:"
  cat ./bootstrap_script.sh
  echo "Running bootstrap script..."
  source ./bootstrap_script.sh
fi

build_tool=none
build_exit_code=0

set +e
if [ -f "pom.xml" ]; then
  build_tool=maven
  if [ -x "./mvnw" ]; then MVN=./mvnw; else MVN=mvn; fi
  $MVN -B compile -DskipTests > build_output/build.log 2>&1
  build_exit_code=$?
  issues_count=$(grep -c "^\[ERROR\].*\.java" build_output/build.log)
elif [ -f "build.gradle" ] || [ -f "build.gradle.kts" ]; then
  build_tool=gradle
  if [ -x "./gradlew" ]; then GRADLE=./gradlew; else GRADLE=gradle; fi
  $GRADLE compileJava --no-daemon --console=plain > build_output/build.log 2>&1
  build_exit_code=$?
  issues_count=$(grep -c "\.java:[0-9]*: error:" build_output/build.log)
else
  echo "No Maven or Gradle build file found"
  issues_count=0
fi
set -e

cat build_output/build.log 2> /dev/null || true

cat > build_output/results.json << EOF
{"issues_count": ${issues_count:-0}, "build_tool": "${build_tool}", "build_exit_code": ${build_exit_code}}
EOF

chmod -R 777 .
exit 0
)SCRIPT";

const char* const kRepo2RunBuild = R"SCRIPT(#!/bin/bash

set -e

mkdir -p build_output
chmod -R 777 .

if [ -f "./bootstrap_script.sh" ]; then
  echo "Bootstrap script contents:"
  cat ./bootstrap_script.sh
  echo "Running bootstrap script..."
  source ./bootstrap_script.sh
fi

python -m pip install --quiet pytest pytest-json-report

echo "Using $(python --version) located at $(which python)"

echo "Running pytest..."
if ! command -v pytest &> /dev/null; then
  echo "pytest not found"
  exit 1
fi

python -m pytest --collect-only -q \
  --json-report --json-report-file=build_output/pytest_report.json \
  /data/project > build_output/pytest_output.txt || true

if [ ! -f build_output/pytest_report.json ]; then
  echo "Failed to get valid pytest output"
  exit 1
fi

python - << 'PY'
import json

with open("build_output/pytest_report.json") as f:
    report = json.load(f)

with open("build_output/results.json", "w") as f:
    json.dump({"pytest": report}, f)
PY

chmod -R 777 .
exit 0
)SCRIPT";

const char* const kPythonBaseline = R"SCRIPT(#!/bin/bash
# Install dependencies with whichever tool the repository declares

if [ -f "poetry.lock" ]; then
  poetry install --no-interaction
  source "$(poetry env info --path)/bin/activate"
elif [ -f "Pipfile" ]; then
  pipenv install --dev
  source "$(pipenv --venv)/bin/activate"
elif [ -f "requirements.txt" ]; then
  python -m pip install -r requirements.txt
elif [ -f "setup.py" ] || [ -f "pyproject.toml" ]; then
  python -m pip install -e .
fi
)SCRIPT";

const char* const kJvmBaseline = R"SCRIPT(#!/bin/bash
# Resolve dependencies so the build step only compiles

if [ -f "pom.xml" ]; then
  if [ -x "./mvnw" ]; then ./mvnw -B dependency:resolve; else mvn -B dependency:resolve; fi
elif [ -f "build.gradle" ] || [ -f "build.gradle.kts" ]; then
  if [ -x "./gradlew" ]; then ./gradlew dependencies --no-daemon; else gradle dependencies --no-daemon; fi
fi
)SCRIPT";

const std::array<const char*, 8> kBuildCommandPrefixes = {
    "mvn compile", "./mvnw compile",
    "mvn test", "./mvnw test",
    "gradle build", "./gradlew build",
    "gradle test", "./gradlew test"
};

} // anonymous namespace

std::string BuildScripts::BuildScript(Language language) {
    switch (language) {
        case Language::PYTHON: return kPythonBuild;
        case Language::JVM: return kJvmBuild;
        case Language::REPO2RUN: return kRepo2RunBuild;
    }
    return {};
}

std::string BuildScripts::BaselineBootstrap(Language language) {
    switch (language) {
        case Language::PYTHON:
        case Language::REPO2RUN:
            return kPythonBaseline;
        case Language::JVM:
            return kJvmBaseline;
    }
    return {};
}

bool BuildScripts::IsBuildCommand(const std::string& line) {
    std::string stripped = StringUtils::Trim(line);
    for (const char* prefix : kBuildCommandPrefixes) {
        if (StringUtils::StartsWith(stripped, prefix)) {
            return true;
        }
    }
    return false;
}

std::string BuildScripts::SanitizeBootstrap(const std::string& script) {
    std::ostringstream result;
    std::size_t removed = 0;
    bool first = true;

    for (const auto& line : StringUtils::SplitLines(script)) {
        if (IsBuildCommand(line)) {
            ++removed;
            continue;
        }
        if (!first) {
            result << '\n';
        }
        result << line;
        first = false;
    }

    if (removed > 0) {
        spdlog::debug("Removed {} maven/gradle build commands from bootstrap script", removed);
    }
    return result.str();
}

} // namespace core
} // namespace envbox
