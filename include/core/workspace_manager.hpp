#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Request-scoped scratch directory
 */
struct Workspace
{
    std::string id;
    fs::path directory;

    fs::path inputPath() const { return directory / "input.ogg"; }
    fs::path outputPath() const { return directory / "output.mp3"; }
    bool valid() const { return !id.empty(); }
};

/**
 * @brief Allocates and reclaims per-request workspaces under a root directory
 *
 * Names have the form <prefix><pid>-<instance>-<counter>-<token>. The pid and
 * instance tag record the owner, so several processes (or managers) can share
 * one root, and the counter plus random token keep concurrent requests apart.
 */
class WorkspaceManager
{
public:
    /**
     * @param root Directory under which workspaces are created (created on demand)
     * @param prefix Name prefix identifying directories owned by this service
     */
    explicit WorkspaceManager(const std::string &root, const std::string &prefix = "ws-");

    /**
     * @brief Create a fresh, empty workspace
     * @throws ConversionError(ResourceExhausted) if the directory cannot be created
     */
    Workspace acquire();

    /**
     * @brief Persist the request payload as the workspace input file
     * @throws ConversionError(IOFailure) on any write error
     */
    void writeInput(const Workspace &workspace, const std::string &bytes);

    /**
     * @brief Read the encoder output
     * @throws ConversionError(NotFound) if the output file does not exist
     * @throws ConversionError(IOFailure) if it exists but cannot be read
     */
    std::vector<uint8_t> readOutput(const Workspace &workspace);

    /**
     * @brief Remove the workspace and everything in it. Idempotent; failures are logged.
     */
    void release(const Workspace &workspace) noexcept;

    /**
     * @brief Reclaim workspaces nobody is using any more
     *
     * Removes this instance's directories that are not live, and directories
     * whose owning process no longer exists. Workspaces of other live
     * processes, and names that do not parse, are left alone.
     * @return Number of directories removed
     */
    size_t sweepStale() noexcept;

    const fs::path &root() const { return root_; }
    const std::string &instanceTag() const { return instance_tag_; }
    size_t liveCount() const;
    uint64_t acquiredCount() const { return acquired_.load(); }
    uint64_t releasedCount() const { return released_.load(); }

private:
    std::string nextName();
    bool isReclaimable(const std::string &name) const;

    fs::path root_;
    std::string prefix_;
    std::string instance_tag_;

    std::atomic<uint64_t> counter_{0};
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    mutable std::mutex live_mutex_;
    std::set<std::string> live_;

    std::atomic<uint64_t> acquired_{0};
    std::atomic<uint64_t> released_{0};
};

/**
 * @brief Releases its workspace when the scope ends, whatever the exit path
 */
class WorkspaceGuard
{
public:
    WorkspaceGuard(WorkspaceManager &manager, Workspace workspace)
        : manager_(manager), workspace_(std::move(workspace)) {}

    ~WorkspaceGuard() { release(); }

    WorkspaceGuard(const WorkspaceGuard &) = delete;
    WorkspaceGuard &operator=(const WorkspaceGuard &) = delete;

    const Workspace &workspace() const { return workspace_; }

    void release() noexcept
    {
        if (!released_)
        {
            released_ = true;
            manager_.release(workspace_);
        }
    }

private:
    WorkspaceManager &manager_;
    Workspace workspace_;
    bool released_ = false;
};
