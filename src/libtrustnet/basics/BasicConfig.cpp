//------------------------------------------------------------------------------
/*
    This file is part of trustnet, derived from rippled:
    https://github.com/ripple/rippled
    Copyright (c) 2012-2024 Ripple Labs Inc.

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include <trustnet/basics/BasicConfig.h>
#include <trustnet/basics/StringUtilities.h>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/regex.hpp>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace trustnet {

IniFileSections
parseIniFile(std::string const& strInput, bool const bTrim)
{
    std::string strData(strInput);
    std::vector<std::string> vLines;
    IniFileSections secResult;

    // Convert DOS format to unix.
    boost::algorithm::replace_all(strData, "\r\n", "\n");

    // Convert MacOS format to unix.
    boost::algorithm::replace_all(strData, "\r", "\n");

    boost::algorithm::split(vLines, strData, boost::algorithm::is_any_of("\n"));

    // Set the default Section name.
    std::string strSection;

    // Initialize the default Section.
    secResult[strSection] = IniFileSections::mapped_type();

    // Parse each line.
    for (auto& strValue : vLines)
    {
        if (bTrim)
            boost::algorithm::trim(strValue);

        if (strValue.empty() || strValue[0] == '#')
        {
            // Blank line or comment, do nothing.
        }
        else if (strValue[0] == '[' && strValue[strValue.length() - 1] == ']')
        {
            // New Section.
            strSection = strValue.substr(1, strValue.length() - 2);
            secResult.emplace(strSection, IniFileSections::mapped_type{});
        }
        else
        {
            // Another line for Section.
            if (!strValue.empty())
                secResult[strSection].push_back(strValue);
        }
    }

    // Lines ahead of the first header have no section to belong to.
    secResult.erase(std::string{});

    return secResult;
}

//------------------------------------------------------------------------------

Section::Section(std::string const& name) : name_(name)
{
}

void
Section::set(std::string const& key, std::string const& value)
{
    lookup_.insert_or_assign(key, value);
}

void
Section::append(std::vector<std::string> const& lines)
{
    // <key> '=' <value>
    static boost::regex const re1(
        "^"                        // start of line
        "(?:\\s*)"                 // whitespace (optonal)
        "([a-zA-Z][_a-zA-Z0-9]*)"  // <key>
        "(?:\\s*)"                 // whitespace (optional)
        "(?:=)"                    // '='
        "(?:\\s*)"                 // whitespace (optional)
        "(.*\\S+)"                 // <value>
        "(?:\\s*)"                 // whitespace (optional)
        ,
        boost::regex_constants::optimize);

    lines_.reserve(lines_.size() + lines.size());
    for (auto line : lines)
    {
        // Strips a trailing comment. "\#" is an escaped '#'.
        auto remove_comment = [](std::string& val) -> bool {
            auto comment = val.find('#');
            while (comment != std::string::npos)
            {
                if (comment == 0)
                {
                    val.clear();
                    return false;
                }
                if (val.at(comment - 1) != '\\')
                {
                    val = trim_whitespace(val.substr(0, comment));
                    return true;
                }
                val.erase(comment - 1, 1);
                comment = val.find('#', comment);
            }
            return false;
        };

        if (remove_comment(line) && !line.empty())
            had_trailing_comments_ = true;

        if (line.empty())
            continue;

        boost::smatch match;
        if (boost::regex_match(line, match, re1))
            set(match[1], match[2]);
        else
            values_.push_back(line);

        lines_.push_back(std::move(line));
    }
}

bool
Section::exists(std::string const& name) const
{
    return lookup_.find(name) != lookup_.end();
}

std::ostream&
operator<<(std::ostream& os, Section const& section)
{
    for (auto const& [k, v] : section.lookup_)
        os << k << "=" << v << "\n";
    return os;
}

//------------------------------------------------------------------------------

bool
BasicConfig::exists(std::string const& name) const
{
    return map_.find(name) != map_.end();
}

Section&
BasicConfig::section(std::string const& name)
{
    auto const result = map_.emplace(
        std::piecewise_construct,
        std::make_tuple(name),
        std::make_tuple(name));
    return result.first->second;
}

Section const&
BasicConfig::section(std::string const& name) const
{
    static Section const none("");
    auto const iter = map_.find(name);
    if (iter == map_.end())
        return none;
    return iter->second;
}

void
BasicConfig::overwrite(
    std::string const& section,
    std::string const& key,
    std::string const& value)
{
    this->section(section).set(key, value);
}

void
BasicConfig::loadFromString(std::string const& fileContents)
{
    build(parseIniFile(fileContents, true));
}

void
BasicConfig::loadFromFile(boost::filesystem::path const& path)
{
    boost::filesystem::ifstream in(path);
    if (!in)
        Throw<std::runtime_error>(
            "Unable to open configuration file " + path.string());

    std::ostringstream ss;
    ss << in.rdbuf();
    loadFromString(ss.str());
}

void
BasicConfig::build(IniFileSections const& ifs)
{
    for (auto const& entry : ifs)
        section(entry.first).append(entry.second);
}

std::ostream&
operator<<(std::ostream& ss, BasicConfig const& c)
{
    for (auto const& [k, v] : c.map_)
        ss << "[" << k << "]\n" << v;
    return ss;
}

}  // namespace trustnet
