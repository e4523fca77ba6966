#pragma once

#include "core/CheckOptions.hpp"
#include "core/Error.hpp"
#include "core/Outcome.hpp"
#include "log/LogSink.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PC {

/**
 * PathCheck makes paths on the local filesystem match a declared state.
 *
 * Every mutating operation returns an Outcome: Change::Unchanged when the
 * path already matched, Change::Changed when something was altered, or an
 * Error. Operations never throw; a failure is also kept in lastFailure()
 * until the next operation starts.
 *
 * In simulate mode mutating operations still inspect the filesystem so the
 * reported Outcome is accurate, but only log what they would have done.
 * Options carrying keepsState = true bypass simulate mode for that call.
 *
 * An instance is not meant to be shared between threads: lastFailure() is
 * overwritten by every call. Use one PathCheck per thread.
 */
class PathCheck {
public:
    /**
     * @brief Constructs a PathCheck.
     * @param sink     Destination for progress and diagnostic messages. May be null.
     * @param simulate Start in simulate (dry-run) mode.
     */
    explicit PathCheck(std::shared_ptr<LogSink> sink = {}, bool simulate = false);

    auto setSimulate(bool simulate) noexcept -> void { this->simulate_ = simulate; }
    auto simulate() const noexcept -> bool { return this->simulate_; }

    // Default backup suffix used by cleanup() when the call passes none.
    auto setBackup(std::optional<std::string> suffix) -> void { this->backup_ = std::move(suffix); }
    auto backup() const -> std::optional<std::string> const& { return this->backup_; }

    auto setSink(std::shared_ptr<LogSink> sink) -> void { this->sink_ = std::move(sink); }
    auto sink() const -> std::shared_ptr<LogSink> const& { return this->sink_; }

    // Error of the most recent failed operation; reset when an operation starts.
    auto lastFailure() const -> std::optional<Error> const& { return this->lastFailure_; }

    // ----- Predicates -----

    auto directoryExists(std::string_view path) const -> bool;
    auto fileExists(std::string_view path) const -> bool;
    auto anyExists(std::string_view path) const -> bool;
    auto isSymlink(std::string_view path) const -> bool;
    auto hasHardlinks(std::string_view path) const -> Expected<int>;
    auto isHardlink(std::string_view path1, std::string_view path2) const -> Expected<bool>;

    // ----- Reconciliation -----

    /**
     * Make sure `dest` does not exist.
     * With a backup suffix (argument, else the instance default; an empty
     * string disables it) `dest` is moved to `dest + suffix` after any stale
     * backup there is removed. Otherwise `dest` is removed, recursively for a
     * directory. An absent `dest` is Unchanged.
     */
    auto cleanup(std::string_view dest, std::optional<std::string> backup = std::nullopt, ActionOptions const& options = {})
        -> Outcome;

    /**
     * Make sure `path` is a directory with the requested status.
     * Missing parents are created. With options.temp the path is a mkdtemp
     * template and the created directory is removed at process exit; the
     * resolved name is returned in DirectoryResult::path.
     */
    auto directory(std::string_view path, DirectoryOptions const& options = {}) -> DirectoryOutcome;

    // Make `linkPath` a symlink to `target`. `target` is stored verbatim.
    auto symlink(std::string_view target, std::string_view linkPath, LinkOptions const& options = {}) -> Outcome;

    // Make `linkPath` another name of the existing `target` (same filesystem).
    auto hardlink(std::string_view target, std::string_view linkPath, LinkOptions const& options = {}) -> Outcome;

    // Apply owner/group/mode/mtime to an existing path, touching only what differs.
    auto status(std::string_view path, StatusOptions const& options = {}) -> Outcome;

    /**
     * Make sure `src` no longer exists by moving it to `dest`.
     * An absent `src` is Unchanged. With a non-empty backup suffix an
     * existing `dest` is first hardlinked to `dest + suffix`.
     */
    auto move(std::string_view src, std::string_view dest, std::optional<std::string> backup = std::nullopt,
              ActionOptions const& options = {}) -> Outcome;

    // Sorted entry names of `dir` (never "." or ".."), filtered by `options`.
    auto listdir(std::string_view dir, ListOptions const& options = {}) -> Expected<std::vector<std::string>>;

    // True when a mutation must only be logged. `label` names the operation in the trace.
    auto resolveDryRun(bool keepsState, std::string_view label) const -> bool;

private:
    template <typename T, typename Body>
    auto guarded(std::string_view operation, Body&& body) -> Expected<T>;

    auto cleanupImpl(std::string_view dest, std::optional<std::string> const& backup, ActionOptions const& options)
        -> Outcome;
    auto directoryImpl(std::string_view path, DirectoryOptions const& options) -> DirectoryOutcome;
    auto ensureParent(std::string const& path, ActionOptions const& options, std::string_view purpose) -> Expected<void>;
    auto symlinkImpl(std::string_view target, std::string_view linkPath, LinkOptions const& options) -> Outcome;
    auto hardlinkImpl(std::string_view target, std::string_view linkPath, LinkOptions const& options) -> Outcome;
    auto statusImpl(std::string_view path, StatusOptions const& options) -> Outcome;
    auto moveImpl(std::string_view src, std::string_view dest, std::optional<std::string> const& backup,
                  ActionOptions const& options) -> Outcome;
    auto listdirImpl(std::string_view dir, ListOptions const& options) -> Expected<std::vector<std::string>>;

    auto report(LogLevel level, std::string const& message) const -> void;
    auto verbose(std::string const& message) const -> void { this->report(LogLevel::Verbose, message); }
    auto debug(int level, std::string const& message) const -> void;

    std::shared_ptr<LogSink>   sink_;
    bool                       simulate_ = false;
    std::optional<std::string> backup_;
    std::optional<Error>       lastFailure_;
};

/**
 * Boundary between internal helpers and callers. Clears lastFailure,
 * runs `body`, turns any escaping exception into an Error, and records
 * a failure before handing the result back.
 */
template <typename T, typename Body>
auto PathCheck::guarded(std::string_view operation, Body&& body) -> Expected<T> {
    this->lastFailure_.reset();

    auto result = [&]() -> Expected<T> {
        try {
            return body();
        } catch (std::filesystem::filesystem_error const& e) {
            return std::unexpected(Error{Error::Code::SystemError, std::string(operation) + ": " + e.what()});
        } catch (std::exception const& e) {
            return std::unexpected(Error{Error::Code::UnknownError, std::string(operation) + ": " + e.what()});
        } catch (...) {
            return std::unexpected(Error{Error::Code::UnknownError, std::string(operation) + ": unknown exception"});
        }
    }();

    if (!result) {
        this->lastFailure_ = result.error();
        this->debug(1, std::string(operation) + " failed: " + describeError(result.error()));
    }
    return result;
}

} // namespace PC
