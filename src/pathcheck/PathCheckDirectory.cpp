#include "PathCheck.hpp"

#include "fs/FsOps.hpp"
#include "fs/TempDirectoryRegistry.hpp"
#include "path/PathPredicates.hpp"
#include "process/Accounts.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

constexpr mode_t kModeMask = 07777;

auto toOctal(mode_t mode) -> std::string {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04o", static_cast<unsigned>(mode & kModeMask));
    return buffer;
}

} // namespace

namespace PC {

auto PathCheck::statusImpl(std::string_view pathIn, StatusOptions const& options) -> Outcome {
    auto path = untaintPath(pathIn, "status");
    if (!path)
        return std::unexpected(path.error());

    struct stat st{};
    if (::lstat(path->c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR)
            return std::unexpected(Error{Error::Code::NoSuchPath, "status: " + *path + " does not exist"});
        return std::unexpected(systemError("status: lstat " + *path));
    }

    bool const dryRun = this->resolveDryRun(options.keepsState, "status");
    bool const link   = S_ISLNK(st.st_mode);
    Change     change = Change::Unchanged;

    std::optional<uid_t> uid;
    std::optional<gid_t> gid;
    if (options.owner) {
        auto user = lookupUser(*options.owner);
        if (!user)
            return std::unexpected(withContext("status: owner of " + *path, user.error()));
        if (user->uid != st.st_uid)
            uid = user->uid;
    }
    if (options.group) {
        auto group = lookupGroup(*options.group);
        if (!group)
            return std::unexpected(withContext("status: group of " + *path, group.error()));
        if (*group != st.st_gid)
            gid = *group;
    }

    // Ownership goes first: chown may clear setuid/setgid bits set by chmod.
    if (uid || gid) {
        auto const newUid = uid.value_or(st.st_uid);
        auto const newGid = gid.value_or(st.st_gid);
        auto const what   = "ownership of " + *path + " to " + std::to_string(newUid) + ":" + std::to_string(newGid);
        if (dryRun) {
            this->verbose("status: simulate mode, would change " + what);
        } else {
            if (::lchown(path->c_str(), uid ? *uid : static_cast<uid_t>(-1), gid ? *gid : static_cast<gid_t>(-1)) != 0)
                return std::unexpected(systemError("status: changing " + what));
            this->verbose("status: changed " + what);
        }
        change = Change::Changed;
    }

    if (options.mode) {
        auto const wanted  = static_cast<mode_t>(*options.mode & kModeMask);
        auto const current = static_cast<mode_t>(st.st_mode & kModeMask);
        if (link) {
            this->debug(1, "status: mode does not apply to symlink " + *path);
        } else if (wanted != current) {
            auto const what = "mode of " + *path + " from " + toOctal(current) + " to " + toOctal(wanted);
            if (dryRun) {
                this->verbose("status: simulate mode, would change " + what);
            } else {
                if (::chmod(path->c_str(), wanted) != 0)
                    return std::unexpected(systemError("status: changing " + what));
                this->verbose("status: changed " + what);
            }
            change = Change::Changed;
        }
    }

    if (options.mtime && st.st_mtime != *options.mtime) {
        auto const what = "mtime of " + *path + " to " + std::to_string(*options.mtime);
        if (dryRun) {
            this->verbose("status: simulate mode, would change " + what);
        } else {
            struct timespec times[2];
            times[0].tv_sec  = 0;
            times[0].tv_nsec = UTIME_OMIT;
            times[1].tv_sec  = *options.mtime;
            times[1].tv_nsec = 0;
            if (::utimensat(AT_FDCWD, path->c_str(), times, AT_SYMLINK_NOFOLLOW) != 0)
                return std::unexpected(systemError("status: changing " + what));
            this->verbose("status: changed " + what);
        }
        change = Change::Changed;
    }

    return change;
}

auto PathCheck::directoryImpl(std::string_view pathIn, DirectoryOptions const& options) -> DirectoryOutcome {
    auto path = untaintPath(pathIn, "directory");
    if (!path)
        return std::unexpected(path.error());

    bool        newDirectory = true;
    std::string resolved     = *path;

    if (options.temp) {
        auto const templ = Fs::padTempTemplate(*path);
        if (this->resolveDryRun(options.keepsState, "directory (tempdir)")) {
            this->verbose("Simulate mode, not going to create a temporary directory " + templ);
            return DirectoryResult{Change::Changed, std::nullopt};
        }

        auto const base = parentDirectory(templ);
        if (!PC::directoryExists(base)) {
            DirectoryOptions baseOptions = options;
            baseOptions.temp             = false;
            auto made                    = this->directoryImpl(base, baseOptions);
            if (!made)
                return std::unexpected(
                        withContext("Failed to create basedir for temporary directory " + templ, made.error()));
        }

        auto created = Fs::makeTempDirectory(templ);
        if (!created)
            return std::unexpected(withContext("Failed to create temporary directory " + templ, created.error()));
        Fs::TempDirectoryRegistry::instance().add(*created);
        resolved = *created;
        this->debug(1, "Created temp directory " + resolved);
    } else if (PC::directoryExists(*path)) {
        newDirectory = false;
        this->debug(1, "Directory " + *path + " already exists");
    } else {
        if (this->resolveDryRun(options.keepsState, "directory")) {
            this->verbose("Simulate mode, not going to create directory " + *path);
            return DirectoryResult{Change::Changed, *path};
        }
        if (auto created = Fs::createDirectories(*path); !created)
            return std::unexpected(withContext("Failed to create directory " + *path, created.error()));
        this->debug(1, "Created directory " + *path);
    }

    // A symlink to a directory is accepted; its attributes are those of the directory it names.
    std::string statusTarget = resolved;
    if (!newDirectory && PC::isSymlink(resolved)) {
        auto real = Fs::canonicalPath(resolved);
        if (!real)
            return std::unexpected(withContext("directory: resolving symlink " + resolved, real.error()));
        this->debug(1, "Directory " + resolved + " is a symlink to " + *real);
        statusTarget = *real;
    }

    // Status always runs; a new directory counts as changed regardless.
    auto status = this->statusImpl(statusTarget, options);
    if (!status)
        return std::unexpected(status.error());

    auto const change = newDirectory ? Change::Changed : *status;
    return DirectoryResult{change, resolved};
}

auto PathCheck::ensureParent(std::string const& path, ActionOptions const& options, std::string_view purpose)
    -> Expected<void> {
    auto const base = parentDirectory(path);
    if (PC::directoryExists(base))
        return {};

    DirectoryOptions directoryOptions;
    directoryOptions.keepsState = options.keepsState;
    auto made                   = this->directoryImpl(base, directoryOptions);
    if (!made)
        return std::unexpected(withContext("Failed to create basedir for " + std::string(purpose) + " " + path,
                                           made.error()));
    return {};
}

} // namespace PC
