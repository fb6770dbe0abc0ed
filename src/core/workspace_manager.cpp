#include "core/workspace_manager.hpp"
#include "core/conversion_types.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <signal.h>
#include <unistd.h>

namespace
{
    constexpr int MAX_NAME_ATTEMPTS = 8;

    bool processExists(pid_t pid)
    {
        if (::kill(pid, 0) == 0)
        {
            return true;
        }
        // EPERM means it exists but belongs to someone else
        return errno != ESRCH;
    }
}

WorkspaceManager::WorkspaceManager(const std::string &root, const std::string &prefix)
    : root_(root), prefix_(prefix), rng_(std::random_device{}())
{
    std::ostringstream tag;
    tag << std::hex << std::setw(8) << std::setfill('0') << static_cast<uint32_t>(rng_());
    instance_tag_ = tag.str();
}

std::string WorkspaceManager::nextName()
{
    uint64_t token;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        token = rng_();
    }

    std::ostringstream name;
    name << prefix_ << ::getpid() << "-" << instance_tag_ << "-" << ++counter_ << "-" << std::hex << std::setw(16) << std::setfill('0') << token;
    return name.str();
}

Workspace WorkspaceManager::acquire()
{
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec)
    {
        throw ConversionError(ConversionErrorKind::ResourceExhausted,
                              "Cannot create workspace root " + root_.string() + ": " + ec.message());
    }

    for (int attempt = 0; attempt < MAX_NAME_ATTEMPTS; ++attempt)
    {
        Workspace workspace;
        workspace.id = nextName();
        workspace.directory = root_ / workspace.id;

        // create_directory returns false without error when the name already exists
        bool created = fs::create_directory(workspace.directory, ec);
        if (ec)
        {
            throw ConversionError(ConversionErrorKind::ResourceExhausted,
                                  "Cannot create workspace " + workspace.directory.string() + ": " + ec.message());
        }
        if (!created)
        {
            Logger::warn("WorkspaceManager: name collision on " + workspace.id + ", retrying");
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(live_mutex_);
            live_.insert(workspace.id);
        }
        ++acquired_;
        Logger::debug("WorkspaceManager: acquired " + workspace.directory.string());
        return workspace;
    }

    throw ConversionError(ConversionErrorKind::ResourceExhausted,
                          "Could not allocate a unique workspace name under " + root_.string());
}

void WorkspaceManager::writeInput(const Workspace &workspace, const std::string &bytes)
{
    const auto path = workspace.inputPath();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        throw ConversionError(ConversionErrorKind::IOFailure,
                              "Cannot open " + path.string() + " for writing: " + std::strerror(errno));
    }

    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out.good())
    {
        throw ConversionError(ConversionErrorKind::IOFailure, "Short write to " + path.string());
    }
}

std::vector<uint8_t> WorkspaceManager::readOutput(const Workspace &workspace)
{
    const auto path = workspace.outputPath();
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        throw ConversionError(ConversionErrorKind::NotFound, "Encoder produced no output at " + path.string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        throw ConversionError(ConversionErrorKind::IOFailure, "Cannot open " + path.string() + " for reading");
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        throw ConversionError(ConversionErrorKind::IOFailure, "Read error on " + path.string());
    }
    return data;
}

void WorkspaceManager::release(const Workspace &workspace) noexcept
{
    if (!workspace.valid())
    {
        return;
    }

    bool was_live = false;
    try
    {
        std::lock_guard<std::mutex> lock(live_mutex_);
        was_live = live_.erase(workspace.id) > 0;
    }
    catch (const std::exception &e)
    {
        Logger::error("WorkspaceManager: registry error releasing " + workspace.id + ": " + e.what());
    }

    std::error_code ec;
    fs::remove_all(workspace.directory, ec);
    if (ec)
    {
        Logger::error("WorkspaceManager: failed to remove " + workspace.directory.string() + ": " + ec.message());
    }
    else
    {
        Logger::debug("WorkspaceManager: released " + workspace.directory.string());
    }

    if (was_live)
    {
        ++released_;
    }
}

bool WorkspaceManager::isReclaimable(const std::string &name) const
{
    // <prefix><pid>-<instance>-...
    const size_t pid_begin = prefix_.size();
    const size_t pid_end = name.find('-', pid_begin);
    if (pid_end == std::string::npos || pid_end == pid_begin || pid_end - pid_begin > 10)
    {
        return false;
    }
    const std::string pid_text = name.substr(pid_begin, pid_end - pid_begin);
    if (pid_text.find_first_not_of("0123456789") != std::string::npos)
    {
        return false;
    }
    const long long owner = std::stoll(pid_text);
    if (owner <= 0 || owner > std::numeric_limits<pid_t>::max())
    {
        return false;
    }

    const size_t tag_end = name.find('-', pid_end + 1);
    if (tag_end == std::string::npos)
    {
        return false;
    }
    const std::string tag = name.substr(pid_end + 1, tag_end - pid_end - 1);

    if (static_cast<pid_t>(owner) == ::getpid())
    {
        if (tag != instance_tag_)
        {
            return false;
        }
        std::lock_guard<std::mutex> lock(live_mutex_);
        return live_.count(name) == 0;
    }
    return !processExists(static_cast<pid_t>(owner));
}

size_t WorkspaceManager::sweepStale() noexcept
{
    size_t removed = 0;
    std::error_code ec;
    if (!fs::is_directory(root_, ec))
    {
        return 0;
    }

    try
    {
        std::vector<fs::path> stale;
        for (const auto &entry : fs::directory_iterator(root_, ec))
        {
            const std::string name = entry.path().filename().string();
            if (name.compare(0, prefix_.size(), prefix_) != 0 || !entry.is_directory(ec))
            {
                continue;
            }
            if (isReclaimable(name))
            {
                stale.push_back(entry.path());
            }
        }

        for (const auto &path : stale)
        {
            std::error_code remove_ec;
            fs::remove_all(path, remove_ec);
            if (remove_ec)
            {
                Logger::warn("WorkspaceManager: could not remove stale workspace " + path.string() + ": " + remove_ec.message());
                continue;
            }
            ++removed;
        }
    }
    catch (const std::exception &e)
    {
        Logger::error("WorkspaceManager: stale workspace sweep failed: " + std::string(e.what()));
    }

    if (removed > 0)
    {
        Logger::info("WorkspaceManager: removed " + std::to_string(removed) + " stale workspace(s) from " + root_.string());
    }
    return removed;
}

size_t WorkspaceManager::liveCount() const
{
    std::lock_guard<std::mutex> lock(live_mutex_);
    return live_.size();
}
