#pragma once

#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>
#include "core/errors/runner_errors.hpp"

namespace coderunner::session {

// Owns the workspace directory and the scratch files written into it.
// Requests naming the same file are serialized through a per-path lease that
// is taken by materialize() and given back by release().
class ScratchFileManager {
public:
    explicit ScratchFileManager(std::filesystem::path workspace_root);

    ScratchFileManager(const ScratchFileManager&) = delete;
    ScratchFileManager& operator=(const ScratchFileManager&) = delete;

    // Creates the workspace root if needed. Safe to call concurrently.
    core::errors::Result<std::filesystem::path> ensure_workspace() const;

    // Writes code verbatim to <root>/<filename>, replacing any existing file.
    // Blocks while another request holds the same path.
    core::errors::Result<std::filesystem::path> materialize(
        const std::string& code, const std::string& filename);

    // Deletes the file if present and gives back its lease. Returns whether a
    // file was removed.
    core::errors::Result<bool> release(const std::filesystem::path& path);

    const std::filesystem::path& workspace_root() const { return workspace_root_; }

    std::size_t active_lease_count() const;

private:
    void acquire_lease(const std::string& key);
    void drop_lease(const std::string& key);

    std::filesystem::path workspace_root_;
    mutable std::mutex mutex_;
    std::condition_variable lease_released_;
    std::unordered_set<std::string> leased_paths_;
};

// Releases one materialized scratch file exactly once, on whichever path the
// owning request leaves by.
class ScratchFileGuard {
public:
    ScratchFileGuard(ScratchFileManager& manager, std::filesystem::path path);
    ~ScratchFileGuard();

    ScratchFileGuard(ScratchFileGuard&& other) noexcept;
    ScratchFileGuard& operator=(ScratchFileGuard&&) = delete;
    ScratchFileGuard(const ScratchFileGuard&) = delete;
    ScratchFileGuard& operator=(const ScratchFileGuard&) = delete;

    // Early release; later calls and the destructor become no-ops.
    core::errors::Result<bool> release();

    const std::filesystem::path& path() const { return path_; }
    bool armed() const { return manager_ != nullptr; }

private:
    ScratchFileManager* manager_;
    std::filesystem::path path_;
};

}  // namespace coderunner::session
