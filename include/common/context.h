#pragma once

#include <memory>
#include <common/regexmatcher.h>

/** The state of one shell session. */
class Context {
public:
    /// The pattern `match` and `batch` run against, if any.
    std::shared_ptr<const Regex> regex;

    /// Set by `exit`.
    bool stopRequested = false;

    /** Return the current regex, or throw a CommandException. */
    const Regex &currentRegex() const;
};
