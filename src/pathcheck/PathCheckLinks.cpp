#include "PathCheck.hpp"

#include "fs/FsOps.hpp"
#include "path/PathPredicates.hpp"

#include <sys/stat.h>

namespace {

// Where a relative symlink target is looked up: next to the link.
auto resolveTarget(std::string const& target, std::string const& linkPath) -> std::string {
    if (!target.empty() && target.front() == '/')
        return target;
    return PC::parentDirectory(linkPath) + "/" + target;
}

} // namespace

namespace PC {

auto PathCheck::symlinkImpl(std::string_view targetIn, std::string_view linkPathIn, LinkOptions const& options)
    -> Outcome {
    auto linkPath = untaintPath(linkPathIn, "symlink");
    if (!linkPath)
        return std::unexpected(linkPath.error());
    auto target = untaintPath(targetIn, "symlink");
    if (!target)
        return std::unexpected(target.error());

    this->debug(2, "Creating symlink " + *linkPath + " to target " + *target);
    bool const dryRun = this->resolveDryRun(options.keepsState, "symlink");

    if (options.check && !PC::anyExists(resolveTarget(*target, *linkPath)))
        return std::unexpected(Error{Error::Code::PreconditionFailed,
                                     "symlink " + *linkPath + ": target " + *target + " doesn't exist"});

    if (PC::isSymlink(*linkPath)) {
        auto current = Fs::readSymlink(*linkPath);
        if (!current)
            return std::unexpected(current.error());
        if (*current == *target) {
            this->debug(1, "Symlink " + *linkPath + " already points to " + *target);
            return Change::Unchanged;
        }
        if (dryRun) {
            this->verbose("Simulate mode, not going to update symlink " + *linkPath + " from " + *current + " to "
                          + *target);
            return Change::Changed;
        }
        if (auto placed = Fs::placeSymlink(*target, *linkPath); !placed)
            return std::unexpected(placed.error());
        this->verbose("Updated symlink " + *linkPath + " from " + *current + " to " + *target);
        return Change::Changed;
    }

    if (PC::anyExists(*linkPath)) {
        auto st = lstatPath(*linkPath);
        if (!st)
            return std::unexpected(st.error());
        if (!(options.force && S_ISREG(st->st_mode)))
            return std::unexpected(Error{Error::Code::PreconditionFailed,
                                         "symlink " + *linkPath + " already exists and is not a symlink"});
        if (dryRun) {
            this->verbose("Simulate mode, not going to replace file " + *linkPath + " by a symlink to " + *target);
            return Change::Changed;
        }
        if (auto placed = Fs::placeSymlink(*target, *linkPath); !placed)
            return std::unexpected(placed.error());
        this->verbose("Replaced file " + *linkPath + " by a symlink to " + *target);
        return Change::Changed;
    }

    if (auto parent = this->ensureParent(*linkPath, options, "symlink"); !parent)
        return std::unexpected(parent.error());
    if (dryRun) {
        this->verbose("Simulate mode, not going to create symlink " + *linkPath + " to " + *target);
        return Change::Changed;
    }
    if (auto placed = Fs::placeSymlink(*target, *linkPath); !placed)
        return std::unexpected(placed.error());
    this->verbose("Created symlink " + *linkPath + " to " + *target);
    return Change::Changed;
}

auto PathCheck::hardlinkImpl(std::string_view targetIn, std::string_view linkPathIn, LinkOptions const& options)
    -> Outcome {
    auto linkPath = untaintPath(linkPathIn, "hardlink");
    if (!linkPath)
        return std::unexpected(linkPath.error());
    auto target = untaintPath(targetIn, "hardlink");
    if (!target)
        return std::unexpected(target.error());

    this->debug(2, "Creating hardlink " + *linkPath + " to target " + *target);
    bool const dryRun = this->resolveDryRun(options.keepsState, "hardlink");

    if (!PC::anyExists(*target))
        return std::unexpected(Error{Error::Code::PreconditionFailed,
                                     "hardlink " + *linkPath + ": target " + *target + " doesn't exist"});
    auto targetStat = lstatPath(*target);
    if (!targetStat)
        return std::unexpected(targetStat.error());
    if (S_ISDIR(targetStat->st_mode))
        return std::unexpected(Error{Error::Code::PreconditionFailed,
                                     "hardlink " + *linkPath + ": target " + *target + " is a directory"});

    if (PC::anyExists(*linkPath)) {
        auto linkStat = lstatPath(*linkPath);
        if (!linkStat)
            return std::unexpected(linkStat.error());

        bool const sameKind = (linkStat->st_mode & S_IFMT) == (targetStat->st_mode & S_IFMT);
        if (sameKind && linkStat->st_dev == targetStat->st_dev && linkStat->st_ino == targetStat->st_ino) {
            this->debug(1, "Hardlink " + *linkPath + " already refers to " + *target);
            return Change::Unchanged;
        }
        if (!sameKind && !(options.force && S_ISREG(linkStat->st_mode)))
            return std::unexpected(Error{Error::Code::PreconditionFailed,
                                         "hardlink " + *linkPath + " already exists and is not a file"});
        if (dryRun) {
            this->verbose("Simulate mode, not going to update hardlink " + *linkPath + " to " + *target);
            return Change::Changed;
        }
        if (auto placed = Fs::placeHardlink(*target, *linkPath); !placed)
            return std::unexpected(placed.error());
        this->verbose("Updated hardlink " + *linkPath + " to " + *target);
        return Change::Changed;
    }

    if (auto parent = this->ensureParent(*linkPath, options, "hardlink"); !parent)
        return std::unexpected(parent.error());
    if (dryRun) {
        this->verbose("Simulate mode, not going to create hardlink " + *linkPath + " to " + *target);
        return Change::Changed;
    }
    if (auto placed = Fs::placeHardlink(*target, *linkPath); !placed)
        return std::unexpected(placed.error());
    this->verbose("Created hardlink " + *linkPath + " to " + *target);
    return Change::Changed;
}

} // namespace PC
