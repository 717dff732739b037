#include "session/scratch_file_manager.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace coderunner::session {

using core::errors::ErrorCategory;
using core::errors::RunnerError;

namespace {

std::string errno_detail(const int err, const std::filesystem::path& path) {
    if (err == 0) {
        return "I/O error while writing: '" + path.string() + "'";
    }
    return std::generic_category().message(err) + ": '" + path.string() + "'";
}

}  // namespace

ScratchFileManager::ScratchFileManager(std::filesystem::path workspace_root)
    : workspace_root_(std::move(workspace_root)) {}

core::errors::Result<std::filesystem::path> ScratchFileManager::ensure_workspace()
    const {
    std::error_code ec;
    std::filesystem::create_directories(workspace_root_, ec);
    if (ec) {
        return RunnerError{ErrorCategory::Environment,
                           "Failed to write code to file: " + ec.message() + ": '" +
                               workspace_root_.string() + "'",
                           "write_failure"};
    }
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return RunnerError{ErrorCategory::Environment,
                           "Failed to write code to file: workspace root is not a "
                           "directory: '" + workspace_root_.string() + "'",
                           "write_failure"};
    }
    return workspace_root_;
}

core::errors::Result<std::filesystem::path> ScratchFileManager::materialize(
    const std::string& code, const std::string& filename) {
    auto workspace = ensure_workspace();
    if (core::errors::is_error(workspace)) {
        CODERUNNER_LOG_ERROR(core::errors::get_error(workspace).message);
        return core::errors::get_error(workspace);
    }

    const std::filesystem::path file_path = workspace_root_ / filename;
    const std::string key = file_path.lexically_normal().string();
    acquire_lease(key);

    errno = 0;
    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        const int err = errno;
        drop_lease(key);
        const std::string detail = errno_detail(err, file_path);
        CODERUNNER_LOG_ERROR("Failed to write code to file " + file_path.string() +
                             ": " + detail);
        return RunnerError{ErrorCategory::Environment,
                           "Failed to write code to file: " + detail,
                           "write_failure"};
    }

    errno = 0;
    out.write(code.data(), static_cast<std::streamsize>(code.size()));
    // Capture the cause before close() gets a chance to clobber errno.
    int err = out.fail() ? errno : 0;
    out.close();
    if (out.fail()) {
        if (err == 0) {
            err = errno;
        }
        drop_lease(key);
        std::error_code ec;
        std::filesystem::remove(file_path, ec);
        const std::string detail = errno_detail(err, file_path);
        CODERUNNER_LOG_ERROR("Failed to write code to file " + file_path.string() +
                             ": " + detail);
        return RunnerError{ErrorCategory::Environment,
                           "Failed to write code to file: " + detail,
                           "write_failure"};
    }

    CODERUNNER_LOG_INFO("Code written to " + file_path.string());
    return file_path;
}

core::errors::Result<bool> ScratchFileManager::release(
    const std::filesystem::path& path) {
    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    drop_lease(path.lexically_normal().string());

    if (ec) {
        CODERUNNER_LOG_ERROR("Failed to remove temporary file " + path.string() +
                             ": " + ec.message());
        return RunnerError{ErrorCategory::Environment,
                           "Failed to remove temporary file " + path.string() +
                               ": " + ec.message(),
                           "cleanup_failure"};
    }
    if (removed) {
        CODERUNNER_LOG_INFO("Successfully cleaned up temporary file: " + path.string());
    }
    return removed;
}

std::size_t ScratchFileManager::active_lease_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_paths_.size();
}

void ScratchFileManager::acquire_lease(const std::string& key) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (leased_paths_.count(key) != 0) {
        CODERUNNER_LOG_DEBUG("Waiting for in-flight request on " + key);
    }
    lease_released_.wait(lock, [&] { return leased_paths_.count(key) == 0; });
    leased_paths_.insert(key);
}

void ScratchFileManager::drop_lease(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leased_paths_.erase(key);
    }
    lease_released_.notify_all();
}

ScratchFileGuard::ScratchFileGuard(ScratchFileManager& manager,
                                   std::filesystem::path path)
    : manager_(&manager), path_(std::move(path)) {}

ScratchFileGuard::ScratchFileGuard(ScratchFileGuard&& other) noexcept
    : manager_(other.manager_), path_(std::move(other.path_)) {
    other.manager_ = nullptr;
}

ScratchFileGuard::~ScratchFileGuard() {
    // Cleanup failures are already logged by the manager and must not
    // replace the response the request produced.
    static_cast<void>(release());
}

core::errors::Result<bool> ScratchFileGuard::release() {
    if (manager_ == nullptr) {
        return false;
    }
    ScratchFileManager* manager = manager_;
    manager_ = nullptr;
    return manager->release(path_);
}

}  // namespace coderunner::session
