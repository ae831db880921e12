/******************************************************************************\
 * NamePattern.hpp - Selection predicate over bare remote file names.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <functional>
#include <string>

namespace ingest {

class NamePattern
{
private: // variables
    std::function<bool(std::string const&)> m_predicate;
    std::string m_description;

private:
    NamePattern(std::function<bool(std::string const&)> predicate, std::string description)
        : m_predicate{std::move(predicate)}
        , m_description{std::move(description)}
    {}

public: // interface
    // matches every name
    NamePattern();

    // ECMAScript regular expression, matched anywhere in the name.
    // throws ConfigurationError if the expression is invalid
    static NamePattern regex(std::string const& expression);
    // shell wildcard pattern (fnmatch), matched against the whole name
    static NamePattern glob(std::string const& pattern);

    bool matches(std::string const& name) const { return m_predicate(name); }
    bool operator()(std::string const& name) const { return matches(name); }

    std::string const& description() const { return m_description; }
};

} /* namespace ingest */
