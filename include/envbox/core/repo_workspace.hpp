/**
 * @file repo_workspace.hpp
 * @brief On-disk repository checkouts bind-mounted into containers
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <filesystem>

namespace envbox {
namespace core {

/**
 * @class RepoWorkspace
 * @brief Materializes and removes per-job repository checkouts
 *
 * Implementations must make concurrent calls for different
 * (repository, revision) pairs safe; one pair is only ever used by one job.
 */
class RepoWorkspace {
public:
    virtual ~RepoWorkspace() = default;

    /**
     * @brief Materialize a clean checkout
     * @return false if the revision could not be obtained
     */
    virtual bool Download(const std::string& repository, const std::string& revision) = 0;

    /**
     * @brief Host directory of the checkout (whether or not it exists yet)
     */
    virtual std::filesystem::path GetRepoDirPath(const std::string& repository,
                                                 const std::string& revision) const = 0;

    /**
     * @brief Remove the checkout (best effort, never throws)
     */
    virtual void ClearRepo(const std::string& repository, const std::string& revision) = 0;
};

/**
 * @class ArchiveRepoWorkspace
 * @brief Checkouts extracted from local archives
 *
 * For `owner/name@sha` the source is looked up in @p archives_dir as:
 * 1. `owner__name@sha.tar.gz` (extracted with `tar -xzf`)
 * 2. `owner__name@sha/` (copied recursively)
 *
 * The checkout lands in `output_dir/owner__name@sha`; an existing checkout
 * is removed first so every job starts from pristine sources.
 */
class ArchiveRepoWorkspace : public RepoWorkspace {
public:
    ArchiveRepoWorkspace(std::filesystem::path archives_dir, std::filesystem::path output_dir);

    bool Download(const std::string& repository, const std::string& revision) override;
    std::filesystem::path GetRepoDirPath(const std::string& repository,
                                         const std::string& revision) const override;
    void ClearRepo(const std::string& repository, const std::string& revision) override;

    const std::filesystem::path& ArchivesDir() const { return archives_dir_; }
    const std::filesystem::path& OutputDir() const { return output_dir_; }

private:
    bool ExtractArchive(const std::filesystem::path& archive, const std::filesystem::path& target);

    std::filesystem::path archives_dir_;  ///< Source archives
    std::filesystem::path output_dir_;    ///< Checkout root
};

} // namespace core
} // namespace envbox
