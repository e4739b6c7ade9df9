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
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace wardcast {

typedef std::unordered_map<std::string, std::string> IniSection;
typedef std::unordered_map<std::string, IniSection> IniFile;

// Sections repeated in one file are merged; a later key wins. Lines starting
// with ';' or '#' are comments.
bool ParseIni(std::string_view path, IniFile* out);
bool ParseIniText(std::string_view text, std::string_view source, IniFile* out);

const IniSection* FindSection(const IniFile& ini, const std::string& name);

// Each reader leaves |out| untouched when the key is absent, and fails only
// if the key is present but malformed.
bool ReadIniString(const IniSection& section, const std::string& key, std::string* out);
bool ReadIniDouble(const IniSection& section, const std::string& key, double* out);
bool ReadIniInt(const IniSection& section, const std::string& key, int* out);
bool ReadIniBool(const IniSection& section, const std::string& key, bool* out);

} // namespace wardcast
