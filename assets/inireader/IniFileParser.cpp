#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

#include <ini.h>

#include "IniFileParser.h"
#include "logging/Logger.hpp"

IniFileParser::IniFileParser()
{
}

IniFileParser::IniFileParser(const std::string& filename)
{
    if (!parseFile(filename))
    {
        globe::Logger::log(globe::Logger::Level::Error,
                           "Error parsing " + mFilename + " (line " + std::to_string(mError) + ")");
    }
}

bool IniFileParser::parseFile(const std::string& filename)
{
    mFilename = filename;
    mValues.clear();
    mError = ini_parse(mFilename.c_str(), valueHandler, this);
    return mError == 0;
}

int IniFileParser::parseError() const
{
    return mError;
}

bool IniFileParser::hasValue(const std::string& section, const std::string& name) const
{
    return mValues.count(makeKey(section, name)) > 0U;
}

std::string IniFileParser::getString(const std::string& section,
                                     const std::string& name,
                                     const std::string& default_value) const
{
    const auto it = mValues.find(makeKey(section, name));
    return it != mValues.end() ? it->second : default_value;
}

void IniFileParser::readString(const std::string& section, const std::string& name, std::string& value) const
{
    value = getString(section, name, value);
}

long IniFileParser::getInteger(const std::string& section, const std::string& name, long default_value) const
{
    std::string valstr = getString(section, name, "");
    const char* value  = valstr.c_str();
    char*       end    = nullptr;
    // This parses "1234" (decimal) and also "0x4D2" (hex)
    long n = strtol(value, &end, 0);
    return end > value ? n : default_value;
}

void IniFileParser::readInteger(const std::string& sectionName, const std::string& variableName, int& value) const
{
    value = static_cast<int>(getInteger(sectionName, variableName, value));
}

void IniFileParser::readSize(const std::string& sectionName,
                             const std::string& variableName,
                             std::size_t& value) const
{
    const long parsed = getInteger(sectionName, variableName, -1);
    if (parsed >= 0)
    {
        value = static_cast<std::size_t>(parsed);
    }
}

double IniFileParser::getReal(const std::string& section, const std::string& name, double default_value) const
{
    std::string valstr = getString(section, name, "");
    const char* value  = valstr.c_str();
    char*       end    = nullptr;
    double      n      = strtod(value, &end);
    return end > value ? n : default_value;
}

void IniFileParser::readScalar(const std::string& sectionName, const std::string& variableName, float& value) const
{
    value = static_cast<float>(getReal(sectionName, variableName, value));
}

void IniFileParser::readScalar(const std::string& sectionName, const std::string& variableName, double& value) const
{
    value = getReal(sectionName, variableName, value);
}

bool IniFileParser::getBoolean(const std::string& section, const std::string& name, bool default_value) const
{
    std::string valstr = getString(section, name, "");
    // Convert to lower case to make string comparisons case-insensitive
    std::transform(valstr.begin(),
                   valstr.end(),
                   valstr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (valstr == "true" || valstr == "yes" || valstr == "on" || valstr == "1")
        return true;
    else if (valstr == "false" || valstr == "no" || valstr == "off" || valstr == "0")
        return false;
    else
        return default_value;
}

void IniFileParser::readBoolean(const std::string& sectionName, const std::string& variableName, bool& value) const
{
    value = getBoolean(sectionName, variableName, value);
}

bool IniFileParser::getRealList(const std::string& section,
                                const std::string& name,
                                std::vector<float>& outputList) const
{
    const std::string valstr = getString(section, name, "");
    if (valstr.empty())
    {
        return false;
    }

    std::vector<float> parsed;
    std::stringstream  stream(valstr);
    std::string        token;
    while (std::getline(stream, token, ','))
    {
        const char* value = token.c_str();
        char*       end   = nullptr;
        const double n    = strtod(value, &end);
        if (end == value)
        {
            return false;
        }
        while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end)))
        {
            ++end;
        }
        if (*end != '\0')
        {
            return false;
        }
        parsed.push_back(static_cast<float>(n));
    }

    outputList = std::move(parsed);
    return true;
}

std::string IniFileParser::getFullFilename() const
{
    return mFilename;
}

std::string IniFileParser::makeKey(const std::string& section, const std::string& name)
{
    std::string key = section + "=" + name;
    // Convert to lower case to make section/name lookups case-insensitive
    std::transform(key.begin(),
                   key.end(),
                   key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

int IniFileParser::valueHandler(void* user, const char* section, const char* name, const char* value)
{
    auto*             reader = static_cast<IniFileParser*>(user);
    const std::string key    = makeKey(section, name);
    if (reader->mValues.count(key) > 0U)
    {
        globe::Logger::log(globe::Logger::Level::Warning,
                           "[IniFileParser] Found multiple definitions of parameter \"" + std::string(name) +
                               "\" within section \"" + std::string(section) + "\" of " + reader->mFilename +
                               "; using only the first value.");
    }
    else
    {
        reader->mValues.emplace(key, value);
    }
    return 1;
}
