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

#include <errno.h>
#include <stdlib.h>

#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <string_view>

#include <google/protobuf/map.h>
#include <proto/history.pb.h>

namespace wardcast {

// Party name to fractional vote share. Ordered so that every stage iterates
// parties in the same sequence.
typedef std::map<std::string, double> ShareMap;

Date Today();
bool ParseYyyyMmDd(std::string_view text, Date* d);
bool IsValidDate(const Date& d);

// Year the election counts towards: the explicit year field, else the date's.
int ElectionYear(const ElectionRecord& record);

bool FileExists(std::string_view path);
bool ReadFile(std::string_view path, std::string* data);
bool SaveFile(const std::string& data, std::string_view path);

ShareMap ToShareMap(const google::protobuf::Map<std::string, double>& map);
void CopyShareMap(const ShareMap& shares, google::protobuf::Map<std::string, double>* out);

static inline double GetShare(const ShareMap& shares, const std::string& party) {
    auto iter = shares.find(party);
    if (iter == shares.end())
        return 0.0;
    return iter->second;
}

static inline double GetShare(const google::protobuf::Map<std::string, double>& shares,
                              const std::string& party) {
    auto iter = shares.find(party);
    if (iter == shares.end())
        return 0.0;
    return iter->second;
}

static inline std::ostream& operator <<(std::ostream& os, const Date& date) {
    return os << date.year() << "-" << date.month() << "-" << date.day();
}

static inline bool operator <(const Date& a, const Date& b) {
    if (a.year() < b.year()) return true;
    if (a.year() > b.year()) return false;
    if (a.month() < b.month()) return true;
    if (a.month() > b.month()) return false;
    return a.day() < b.day();
}

static inline bool operator >(const Date& a, const Date& b) {
    return b < a;
}

static inline bool operator ==(const Date& a, const Date& b) {
    return a.year() == b.year() && a.month() == b.month() && a.day() == b.day();
}

static inline bool operator !=(const Date& a, const Date& b) {
    return !(a == b);
}

template <typename T>
static inline bool ParseInt(std::string_view text, T* v) {
    std::string buffer(text);
    errno = 0;
    char* end;
    long long value = strtoll(buffer.c_str(), &end, 10);
    if (errno != 0 || buffer.c_str() == end || *end != '\0')
        return false;
    if (value > std::numeric_limits<T>::max() || value < std::numeric_limits<T>::min())
        return false;
    *v = static_cast<T>(value);
    return true;
}

static inline bool ParseFloat(std::string_view text, double* d) {
    std::string buffer(text);
    errno = 0;
    char* end;
    double value = strtod(buffer.c_str(), &end);
    if (errno != 0 || buffer.c_str() == end || *end != '\0')
        return false;
    *d = value;
    return true;
}

bool ParseBool(std::string_view text, bool* b);

} // namespace wardcast
