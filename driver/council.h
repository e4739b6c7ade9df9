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

#include <map>
#include <string>
#include <string_view>

#include <proto/history.pb.h>
#include "adjustments.h"
#include "ini-reader.h"

namespace wardcast {

class Context;

static constexpr int kDefaultCampaignHours = 1000;

// One council's run configuration: the dataset, the party we campaign for,
// the model tuning and any manual seat calls.
class Council
{
  public:
    bool Init(Context* cx);

    // |base_dir| resolves a relative dataset path.
    bool InitFromIni(const IniFile& file, std::string_view file_name,
                     const std::string& base_dir);

    const std::string& name() const { return name_; }
    const std::string& our_party() const { return our_party_; }
    const std::string& election_type() const { return election_type_; }
    int total_hours() const { return total_hours_; }
    int session_cap() const { return session_cap_; }
    const CouncilData& data() const { return data_; }
    CouncilData* mutable_data() { return &data_; }
    const Assumptions& assumptions() const { return assumptions_; }
    const DemographicRules& rules() const { return rules_; }
    const std::map<std::string, std::string>& overrides() const { return overrides_; }

  private:
    bool InitMain(const IniFile& file, std::string_view file_name);
    bool InitAssumptions(const IniFile& file, std::string_view file_name);
    bool InitDemographicRules(const IniFile& file, std::string_view file_name);
    void InitOverrides(const IniFile& file);
    bool LoadDataset(const std::string& path);

  private:
    std::string name_;
    std::string dataset_;
    std::string our_party_;
    std::string election_type_ = "borough";
    int total_hours_ = kDefaultCampaignHours;
    int session_cap_;
    CouncilData data_;
    Assumptions assumptions_;
    DemographicRules rules_;
    std::map<std::string, std::string> overrides_;
};

} // namespace wardcast
