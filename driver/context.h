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

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "threadpool.h"

namespace wardcast {

// Process-wide settings read from the JSON settings file: where outputs go,
// which council to model, and the worker pool.
class Context final
{
  public:
    Context();
    ~Context();

    bool Init(const std::string& settings_file, int num_threads);
    bool InitFromJson(std::string_view json, const std::string& base_dir, int num_threads);

    bool Save(const std::string& data, const std::string& path);
    bool Read(const std::string& path, std::string* data);
    std::string PathTo(const std::string& path) const;

    // Resolves a path named in the settings file against the settings
    // file's directory.
    std::string ResolveInput(const std::string& path) const;

    std::string GetProp(const std::string& prop, const std::string& default_value = {}) const;
    int GetPropInt(const std::string& prop, int default_value = 0) const;

    // The "year" property if set, else the current calendar year.
    int current_year() const;

    ThreadPool& workers() const {
        return *workers_.get();
    }

  private:
    std::string outdir_;
    std::string base_dir_;
    std::unique_ptr<ThreadPool> workers_;
    std::unordered_map<std::string, std::string> props_;
};

} // namespace wardcast
