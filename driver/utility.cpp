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
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <memory>

#include <date/date.h>
#include "logging.h"
#include "utility.h"

namespace wardcast {

static Date
FromYmd(const date::year_month_day& ymd)
{
    Date date;
    date.set_year((int)ymd.year());
    date.set_month((unsigned)ymd.month());
    date.set_day((unsigned)ymd.day());
    return date;
}

Date
Today()
{
    auto today = date::floor<date::days>(std::chrono::system_clock::now());
    return FromYmd(date::year_month_day{today});
}

bool
IsValidDate(const Date& d)
{
    auto ymd = date::year_month_day(date::year(d.year()), date::month(d.month()),
                                    date::day(d.day()));
    return ymd.ok();
}

bool
ParseYyyyMmDd(std::string_view text, Date* date)
{
    std::string buffer(text);
    int year, month, day;
    if (sscanf(buffer.c_str(), "%d-%d-%d", &year, &month, &day) != 3)
        return false;
    if (month <= 0 || day <= 0)
        return false;

    Date result;
    result.set_year(year);
    result.set_month(month);
    result.set_day(day);
    if (!IsValidDate(result))
        return false;
    *date = result;
    return true;
}

int
ElectionYear(const ElectionRecord& record)
{
    if (record.year())
        return record.year();
    return record.date().year();
}

bool
ParseBool(std::string_view text, bool* b)
{
    if (text == "true" || text == "yes" || text == "1") {
        *b = true;
        return true;
    }
    if (text == "false" || text == "no" || text == "0") {
        *b = false;
        return true;
    }
    return false;
}

ShareMap
ToShareMap(const google::protobuf::Map<std::string, double>& map)
{
    return ShareMap(map.begin(), map.end());
}

void
CopyShareMap(const ShareMap& shares, google::protobuf::Map<std::string, double>* out)
{
    out->clear();
    for (const auto& [party, share] : shares)
        (*out)[party] = share;
}

bool
FileExists(std::string_view path)
{
    std::string buffer(path);
    return access(buffer.c_str(), F_OK) == 0;
}

bool
ReadFile(std::string_view path, std::string* data)
{
    std::string name(path);
    std::unique_ptr<FILE, decltype(&fclose)> fp(fopen(name.c_str(), "rb"), fclose);
    if (!fp) {
        Err() << "open " << path << " failed: " << strerror(errno);
        return false;
    }

    struct stat s;
    if (fstat(fileno(fp.get()), &s)) {
        Err() << "stat " << path << " failed: " << strerror(errno);
        return false;
    }

    *data = std::string(s.st_size, '\0');

    std::string& buffer = *data;
    if (fread(&buffer[0], 1, buffer.size(), fp.get()) != buffer.size()) {
        Err() << "read " << path << " failed: " << strerror(errno);
        return false;
    }
    return true;
}

bool
SaveFile(const std::string& data, std::string_view path)
{
    std::string name(path);
    std::unique_ptr<FILE, decltype(&fclose)> fp(fopen(name.c_str(), "wb"), fclose);
    if (!fp) {
        PErr() << "Could not open path for writing: " << path;
        return false;
    }
    if (fwrite(data.data(), 1, data.size(), fp.get()) != data.size()) {
        Err() << "Failed to write to: " << path;
        return false;
    }
    return true;
}

} // namespace wardcast
