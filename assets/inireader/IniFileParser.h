#pragma once

#include <cstddef>
#include <map>
#include <sstream>
#include <string>
#include <vector>

class IniFileParser
{
  public:
    // Construct IniFileParser and parse given filename. See ini.h for more info about the parsing.
    IniFileParser();
    explicit IniFileParser(const std::string& filename);
    bool parseFile(const std::string& filename);

    // Return the result of ini_parse(), i.e., 0 on success, line number of first error on parse error, or -1 on file
    // open error.
    int parseError() const;

    bool hasValue(const std::string& section, const std::string& name) const;

    // Get a string value from INI file, returning default_value if not found.
    std::string getString(const std::string& section, const std::string& name, const std::string& default_value) const;
    void        readString(const std::string& section, const std::string& name, std::string& value) const;

    // Get an integer (long) value from INI file, returning default_value if not found or not a valid integer (decimal
    // "1234", "-1234", or hex "0x4d2").
    long getInteger(const std::string& section, const std::string& name, long default_value) const;
    void readInteger(const std::string& sectionName, const std::string& variableName, int& value) const;
    // Negative values are rejected and leave value untouched.
    void readSize(const std::string& sectionName, const std::string& variableName, std::size_t& value) const;

    // Get a real (floating point double) value from INI file, returning default_value if not found or not a valid
    // floating point value according to strtod().
    double getReal(const std::string& section, const std::string& name, double default_value) const;
    void   readScalar(const std::string& sectionName, const std::string& variableName, float& value) const;
    void   readScalar(const std::string& sectionName, const std::string& variableName, double& value) const;

    // Get a boolean value from INI file, returning default_value if not found or if not a valid true/false value. Valid
    // true values are "true", "yes", "on", "1", and valid false values are "false", "no", "off", "0" (not case
    // sensitive).
    bool getBoolean(const std::string& section, const std::string& name, bool default_value) const;
    void readBoolean(const std::string& sectionName, const std::string& variableName, bool& value) const;

    // Comma separated list of reals. Returns false if the key is missing or any entry fails to parse, in which case
    // outputList is left untouched.
    bool getRealList(const std::string& section, const std::string& name, std::vector<float>& outputList) const;

    // This method get the full filename of the INI file being parsed
    std::string getFullFilename() const;

  private:
    std::string                        mFilename;
    int                                mError = -1;
    std::map<std::string, std::string> mValues;
    static std::string                 makeKey(const std::string& section, const std::string& name);
    static int valueHandler(void* user, const char* section, const char* name, const char* value);
};
