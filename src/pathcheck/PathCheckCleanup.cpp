#include "PathCheck.hpp"

#include "fs/FsOps.hpp"
#include "path/PathPredicates.hpp"

namespace PC {

auto PathCheck::cleanupImpl(std::string_view destIn, std::optional<std::string> const& backup,
                            ActionOptions const& options) -> Outcome {
    auto dest = untaintPath(destIn, "cleanup dest");
    if (!dest)
        return std::unexpected(dest.error());

    if (!PC::anyExists(*dest))
        return Change::Unchanged;

    auto const& suffix = backup ? backup : this->backup_;

    // Empty suffix means no backup.
    std::optional<std::string> old;
    if (suffix && !suffix->empty()) {
        auto checked = untaintPath(*suffix, "cleanup backup");
        if (!checked)
            return std::unexpected(checked.error());
        old = *dest + *checked;
    }

    if (old) {
        // A stale backup is removed without being backed up itself.
        if (auto stale = this->cleanupImpl(*old, std::string{}, options); !stale)
            return std::unexpected(withContext("cleanup: removing previous backup " + *old + " failed", stale.error()));
        if (auto moved = this->moveImpl(*dest, *old, std::string{}, options); !moved)
            return std::unexpected(withContext("cleanup: move to backup failed", moved.error()));
        return Change::Changed;
    }

    auto const method = (PC::directoryExists(*dest) && !PC::isSymlink(*dest)) ? "rmtree" : "unlink";
    if (this->resolveDryRun(options.keepsState, "cleanup")) {
        this->verbose(std::string("cleanup: simulate mode, not going to ") + method + " " + *dest);
        return Change::Changed;
    }

    if (auto removed = Fs::removeEntry(*dest); !removed)
        return std::unexpected(
                withContext("Cleanup " + std::string(method) + " failed to remove " + *dest, removed.error()));
    this->verbose("Cleanup " + std::string(method) + " removed " + *dest);
    return Change::Changed;
}

auto PathCheck::moveImpl(std::string_view srcIn, std::string_view destIn, std::optional<std::string> const& backup,
                         ActionOptions const& options) -> Outcome {
    auto src = untaintPath(srcIn, "move src");
    if (!src)
        return std::unexpected(src.error());
    auto dest = untaintPath(destIn, "move dest");
    if (!dest)
        return std::unexpected(dest.error());

    // The goal is an absent src; nothing to do, and no backup of dest either.
    if (!PC::anyExists(*src))
        return Change::Unchanged;

    if (backup && !backup->empty() && PC::anyExists(*dest)) {
        auto checked = untaintPath(*backup, "move backup");
        if (!checked)
            return std::unexpected(checked.error());
        auto const old = *dest + *checked;

        LinkOptions linkOptions;
        linkOptions.keepsState = options.keepsState;
        linkOptions.force      = true;
        if (auto saved = this->hardlinkImpl(*dest, old, linkOptions); !saved)
            return std::unexpected(
                    withContext("move: backup of dest " + *dest + " to " + old + " failed", saved.error()));
    }

    if (this->resolveDryRun(options.keepsState, "move")) {
        this->verbose("move: simulate mode, not going to move " + *src + " to " + *dest);
        return Change::Changed;
    }

    if (auto parent = this->ensureParent(*dest, options, "dest"); !parent)
        return std::unexpected(parent.error());

    if (auto moved = Fs::moveEntry(*src, *dest); !moved)
        return std::unexpected(withContext("Failed to move " + *src + " to " + *dest, moved.error()));

    this->debug(1, "Moved src " + *src + " to dest " + *dest);
    return Change::Changed;
}

} // namespace PC
