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
#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <string>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "context.h"
#include "logging.h"
#include "utility.h"

namespace wardcast {

static constexpr int kDefaultThreads = 8;

Context::Context()
{
}

Context::~Context()
{
}

bool
Context::Init(const std::string& settings_file, int num_threads)
{
    std::string data;
    if (!ReadFile(settings_file, &data))
        return false;

    std::string base_dir = ".";
    auto slash = settings_file.rfind('/');
    if (slash != std::string::npos)
        base_dir = settings_file.substr(0, slash);

    if (!InitFromJson(data, base_dir, num_threads)) {
        Err() << "Could not load settings from " << settings_file;
        return false;
    }
    return true;
}

bool
Context::InitFromJson(std::string_view json, const std::string& base_dir, int num_threads)
{
    if (num_threads < 0)
        num_threads = kDefaultThreads;
    workers_ = std::make_unique<ThreadPool>(num_threads);
    base_dir_ = base_dir;

    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        Err() << "Settings JSON error at offset " << doc.GetErrorOffset() << ": "
              << rapidjson::GetParseError_En(doc.GetParseError());
        return false;
    }
    if (!doc.IsObject()) {
        Err() << "Settings must be a JSON object";
        return false;
    }

    for (const auto& m : doc.GetObject()) {
        if (m.value.IsString())
            props_[m.name.GetString()] = m.value.GetString();
        else if (m.value.IsInt())
            props_[m.name.GetString()] = std::to_string(m.value.GetInt());
        else if (m.value.IsBool())
            props_[m.name.GetString()] = m.value.GetBool() ? "true" : "false";
    }

    outdir_ = GetProp("data-dir");
    if (outdir_.empty()) {
        Err() << "No data-dir found in config";
        return false;
    }
    if (outdir_[0] != '/')
        outdir_ = ResolveInput(outdir_);
    if (mkdir(outdir_.c_str(), 0770) && errno != EEXIST) {
        Err() << "mkdir " << outdir_ << " failed: " << strerror(errno);
        return false;
    }

    if (GetProp("council").empty()) {
        Err() << "No council found in config";
        return false;
    }
    return true;
}

bool
Context::Read(const std::string& path, std::string* data)
{
    return ReadFile(PathTo(path), data);
}

bool
Context::Save(const std::string& data, const std::string& path)
{
    auto local_path = PathTo(path);
    if (!SaveFile(data, local_path))
        return false;
    Debug() << "Wrote " << local_path;
    return true;
}

std::string
Context::PathTo(const std::string& path) const
{
    return outdir_ + "/" + path;
}

std::string
Context::ResolveInput(const std::string& path) const
{
    if (path.empty() || path[0] == '/')
        return path;
    return base_dir_ + "/" + path;
}

std::string
Context::GetProp(const std::string& prop, const std::string& default_value) const
{
    auto iter = props_.find(prop);
    if (iter == props_.end())
        return default_value;
    return iter->second;
}

int
Context::GetPropInt(const std::string& prop, int default_value) const
{
    auto iter = props_.find(prop);
    if (iter == props_.end())
        return default_value;

    int v;
    if (!ParseInt(iter->second, &v)) {
        Err() << "Warning: property " << prop << " is not an integer.";
        return default_value;
    }
    return v;
}

int
Context::current_year() const
{
    int year = GetPropInt("year", 0);
    if (year > 0)
        return year;
    return Today().year();
}

} // namespace wardcast
