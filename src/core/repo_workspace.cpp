/**
 * @file repo_workspace.cpp
 * @brief Archive-backed repository checkouts
 *
 * @date 2025
 */

#include "envbox/core/repo_workspace.hpp"
#include "envbox/core/job.hpp"
#include "envbox/utils/process_utils.hpp"
#include "envbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace envbox {
namespace core {

namespace fs = std::filesystem;

namespace {

constexpr auto kExtractTimeout = std::chrono::minutes(10);

// Archives of a single top-level directory (GitHub tarballs) are unwrapped
void HoistSingleDirectory(const fs::path& target) {
    fs::path only_child;
    std::size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(target)) {
        only_child = entry.path();
        ++entries;
    }
    if (entries != 1 || !fs::is_directory(only_child)) {
        return;
    }

    fs::path staging = target.string() + ".unwrap";
    fs::remove_all(staging);
    fs::rename(only_child, staging);
    fs::remove(target);
    fs::rename(staging, target);
}

} // anonymous namespace

ArchiveRepoWorkspace::ArchiveRepoWorkspace(fs::path archives_dir, fs::path output_dir)
    : archives_dir_(std::move(archives_dir))
    , output_dir_(std::move(output_dir)) {
}

fs::path ArchiveRepoWorkspace::GetRepoDirPath(const std::string& repository,
                                              const std::string& revision) const {
    return output_dir_ / JobKey{repository, revision}.FileStem();
}

bool ArchiveRepoWorkspace::Download(const std::string& repository, const std::string& revision) {
    const std::string stem = JobKey{repository, revision}.FileStem();
    const fs::path target = GetRepoDirPath(repository, revision);
    const fs::path archive = archives_dir_ / (stem + ".tar.gz");
    const fs::path source_dir = archives_dir_ / stem;

    try {
        if (fs::exists(target)) {
            spdlog::debug("Removing stale checkout {}", target.string());
            fs::remove_all(target);
        }
        fs::create_directories(target);

        if (fs::is_regular_file(archive)) {
            if (!ExtractArchive(archive, target)) {
                ClearRepo(repository, revision);
                return false;
            }
        } else if (fs::is_directory(source_dir)) {
            fs::copy(source_dir, target,
                     fs::copy_options::recursive | fs::copy_options::copy_symlinks);
        } else {
            spdlog::error("No archive for {}@{} in {}", repository, revision, archives_dir_.string());
            ClearRepo(repository, revision);
            return false;
        }
    } catch (const std::system_error& e) {
        // filesystem_error, or pipe/fork failure while extracting
        spdlog::error("Failed to materialize {}@{}: {}", repository, revision, e.what());
        ClearRepo(repository, revision);
        return false;
    }

    spdlog::info("✓ Checkout ready: {}", target.string());
    return true;
}

bool ArchiveRepoWorkspace::ExtractArchive(const fs::path& archive, const fs::path& target) {
    utils::ProcessOptions options;
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(kExtractTimeout);
    options.merge_stderr = true;

    auto result = utils::RunProcess(
        {"tar", "-xzf", archive.string(), "-C", target.string()}, options);
    if (!result.Succeeded()) {
        spdlog::error("Extracting {} failed: {}", archive.filename().string(),
                      result.timed_out ? std::string("timed out")
                                       : utils::StringUtils::Trim(result.stdout_output));
        return false;
    }

    HoistSingleDirectory(target);
    return true;
}

void ArchiveRepoWorkspace::ClearRepo(const std::string& repository, const std::string& revision) {
    const fs::path target = GetRepoDirPath(repository, revision);
    std::error_code ec;
    fs::remove_all(target, ec);
    if (ec) {
        spdlog::warn("Failed to remove checkout {}: {}", target.string(), ec.message());
    }
}

} // namespace core
} // namespace envbox
