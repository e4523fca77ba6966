#include "PathCheck.hpp"

#include "path/PathPredicates.hpp"

#include <algorithm>
#include <cerrno>
#include <dirent.h>
#include <memory>
#include <regex>

namespace {

using PC::Error;
using PC::Expected;
using Test = PC::ListOptions::Test;

struct DirCloser {
    void operator()(DIR* dir) const {
        ::closedir(dir);
    }
};

auto compileFilter(PC::ListOptions::Filter const& filter) -> Expected<std::regex> {
    if (auto const* compiled = std::get_if<std::regex>(&filter))
        return *compiled;
    auto const& pattern = std::get<std::string>(filter);
    try {
        return std::regex(pattern);
    } catch (std::regex_error const& e) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "listdir: invalid filter pattern " + pattern + ": " + e.what()});
    }
}

// Raw scan of `dir`, keeping the names accepted by `test`.
auto scanDirectory(std::string const& dir, Test const& test) -> Expected<std::vector<std::string>> {
    std::unique_ptr<DIR, DirCloser> handle(::opendir(dir.c_str()));
    if (!handle)
        return std::unexpected(PC::systemError("_listdir: opendir " + dir + " failed"));

    std::vector<std::string> names;
    while (true) {
        errno             = 0;
        auto const* entry = ::readdir(handle.get());
        if (entry == nullptr) {
            if (errno != 0)
                return std::unexpected(PC::systemError("_listdir: readdir " + dir + " failed"));
            break;
        }
        std::string name{entry->d_name};
        if (test(name, dir))
            names.push_back(std::move(name));
    }
    return names;
}

} // namespace

namespace PC {

auto PathCheck::listdirImpl(std::string_view dirIn, ListOptions const& options) -> Expected<std::vector<std::string>> {
    auto checked = untaintPath(dirIn, "listdir directory");
    if (!checked)
        return std::unexpected(checked.error());

    std::string dir = *checked;
    while (dir.size() > 1 && dir.back() == '/')
        dir.pop_back();

    if (!PC::directoryExists(dir))
        return std::unexpected(Error{Error::Code::NoSuchPath, "listdir: directory " + dir + " is not a directory"});

    std::vector<Test> tests;
    if (options.test)
        tests.push_back(options.test);

    if (options.filter) {
        auto filter = compileFilter(*options.filter);
        if (!filter)
            return std::unexpected(filter.error());
        tests.push_back([pattern = std::move(*filter)](std::string const& name, std::string const&) {
            return std::regex_search(name, pattern);
        });
    }

    if (options.fileExists) {
        tests.push_back([](std::string const& name, std::string const& directory) {
            return PC::fileExists(directory + "/" + name);
        });
    }

    // Inverse applies to each caller test, never to the "." / ".." exclusion below.
    std::vector<Test> combined;
    combined.reserve(tests.size() + 1);
    for (auto& test : tests) {
        combined.push_back([inverse = options.inverse, test = std::move(test)](std::string const& name,
                                                                                std::string const& directory) {
            return inverse != test(name, directory);
        });
    }
    combined.push_back([](std::string const& name, std::string const&) { return name != "." && name != ".."; });

    auto names = scanDirectory(dir, combined.front());
    if (!names)
        return std::unexpected(names.error());

    std::sort(names->begin(), names->end());
    for (auto it = std::next(combined.begin()); it != combined.end(); ++it) {
        auto const& test = *it;
        std::erase_if(*names, [&](std::string const& name) { return !test(name, dir); });
    }

    if (options.addDir) {
        auto const prefix = dir == "/" ? std::string{"/"} : dir + "/";
        for (auto& name : *names)
            name.insert(0, prefix);
    }

    this->debug(2, "listdir " + dir + ": " + std::to_string(names->size()) + " entries");
    return names;
}

} // namespace PC
