// vim: set sts=4 ts=8 sw=4 tw=99 et:
//
// Copyright (C) 2016-2020 David Anderson
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#include "ini-reader.h"

#include "logging.h"
#include "utility.h"

namespace wardcast {

static std::string_view
Trim(std::string_view text)
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() &&
           (text.back() == ' ' || text.back() == '\t' || text.back() == '\r'))
    {
        text.remove_suffix(1);
    }
    return text;
}

class IniParser final
{
  public:
    IniParser(std::string_view source, IniFile* out)
      : source_(source),
        out_(out)
    {}

    bool Parse(std::string_view text);

  private:
    bool ParseLine(std::string_view line);

  private:
    std::string_view source_;
    IniFile* out_;
    IniSection* section_ = nullptr;
    unsigned line_ = 0;
};

bool
IniParser::Parse(std::string_view text)
{
    while (!text.empty()) {
        line_++;

        size_t eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        if (eol == std::string_view::npos)
            text = {};
        else
            text.remove_prefix(eol + 1);

        if (!ParseLine(Trim(line)))
            return false;
    }
    return true;
}

bool
IniParser::ParseLine(std::string_view line)
{
    if (line.empty() || line.front() == ';' || line.front() == '#')
        return true;

    if (line.front() == '[') {
        if (line.back() != ']') {
            Err() << source_ << ":" << line_ << ": unterminated section header";
            return false;
        }
        std::string name(Trim(line.substr(1, line.size() - 2)));
        if (name.empty()) {
            Err() << source_ << ":" << line_ << ": empty section name";
            return false;
        }
        section_ = &(*out_)[name];
        return true;
    }

    if (!section_) {
        Err() << source_ << ":" << line_ << ": key outside of any section";
        return false;
    }

    size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
        Err() << source_ << ":" << line_ << ": expected key = value";
        return false;
    }

    std::string key(Trim(line.substr(0, eq)));
    if (key.empty()) {
        Err() << source_ << ":" << line_ << ": empty key";
        return false;
    }
    (*section_)[key] = std::string(Trim(line.substr(eq + 1)));
    return true;
}

bool
ParseIniText(std::string_view text, std::string_view source, IniFile* out)
{
    IniParser parser(source, out);
    return parser.Parse(text);
}

bool
ParseIni(std::string_view path, IniFile* out)
{
    std::string contents;
    if (!ReadFile(path, &contents))
        return false;

    if (!ParseIniText(contents, path, out)) {
        Err() << "Failed to parse ini file: " << path;
        return false;
    }
    return true;
}

const IniSection*
FindSection(const IniFile& ini, const std::string& name)
{
    auto iter = ini.find(name);
    if (iter == ini.end())
        return nullptr;
    return &iter->second;
}

bool
ReadIniString(const IniSection& section, const std::string& key, std::string* out)
{
    auto iter = section.find(key);
    if (iter != section.end())
        *out = iter->second;
    return true;
}

bool
ReadIniDouble(const IniSection& section, const std::string& key, double* out)
{
    auto iter = section.find(key);
    if (iter == section.end())
        return true;
    if (!ParseFloat(iter->second, out)) {
        Err() << "Invalid number for " << key << ": " << iter->second;
        return false;
    }
    return true;
}

bool
ReadIniInt(const IniSection& section, const std::string& key, int* out)
{
    auto iter = section.find(key);
    if (iter == section.end())
        return true;
    if (!ParseInt(iter->second, out)) {
        Err() << "Invalid integer for " << key << ": " << iter->second;
        return false;
    }
    return true;
}

bool
ReadIniBool(const IniSection& section, const std::string& key, bool* out)
{
    auto iter = section.find(key);
    if (iter == section.end())
        return true;
    if (!ParseBool(iter->second, out)) {
        Err() << "Invalid boolean for " << key << ": " << iter->second;
        return false;
    }
    return true;
}

} // namespace wardcast
