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
#include "council.h"

#include <google/protobuf/text_format.h>

#include "canvass.h"
#include "context.h"
#include "logging.h"
#include "utility.h"

namespace wardcast {

bool
Council::Init(Context* cx)
{
    auto file_name = cx->ResolveInput(cx->GetProp("council"));

    IniFile file;
    if (!ParseIni(file_name, &file))
        return false;

    std::string base_dir = ".";
    if (auto slash = file_name.rfind('/'); slash != std::string::npos)
        base_dir = file_name.substr(0, slash);
    return InitFromIni(file, file_name, base_dir);
}

bool
Council::InitFromIni(const IniFile& file, std::string_view file_name,
                     const std::string& base_dir)
{
    session_cap_ = kDefaultSessionCap;

    if (!InitMain(file, file_name))
        return false;
    if (!InitAssumptions(file, file_name))
        return false;
    if (!InitDemographicRules(file, file_name))
        return false;
    InitOverrides(file);

    std::string path = dataset_;
    if (path[0] != '/')
        path = base_dir + "/" + path;
    if (!LoadDataset(path))
        return false;

    if (name_.empty())
        name_ = data_.name();
    return true;
}

bool
Council::InitMain(const IniFile& file, std::string_view file_name)
{
    const IniSection* section = FindSection(file, "council");
    if (!section) {
        Err() << "No council section found in " << file_name;
        return false;
    }

    ReadIniString(*section, "name", &name_);
    ReadIniString(*section, "election_type", &election_type_);

    if (!ReadIniString(*section, "dataset", &dataset_) || dataset_.empty()) {
        Err() << "No dataset in " << file_name;
        return false;
    }
    if (!ReadIniString(*section, "our_party", &our_party_) || our_party_.empty()) {
        Err() << "No our_party in " << file_name;
        return false;
    }

    if (!ReadIniInt(*section, "total_hours", &total_hours_) ||
        !ReadIniInt(*section, "session_cap", &session_cap_))
    {
        Err() << "Invalid council section in " << file_name;
        return false;
    }
    if (total_hours_ < 0) {
        Err() << "total_hours must not be negative in " << file_name;
        return false;
    }
    if (session_cap_ < 1) {
        Err() << "session_cap must be at least 1 in " << file_name;
        return false;
    }
    return true;
}

bool
Council::InitAssumptions(const IniFile& file, std::string_view file_name)
{
    Assumptions a = DefaultAssumptions();

    if (const IniSection* section = FindSection(file, "assumptions")) {
        struct DoubleField {
            const char* key;
            double (Assumptions::*get)() const;
            void (Assumptions::*set)(double);
        };
        static const DoubleField kFields[] = {
            {"national_to_local_dampening", &Assumptions::national_to_local_dampening,
             &Assumptions::set_national_to_local_dampening},
            {"incumbency_bonus", &Assumptions::incumbency_bonus,
             &Assumptions::set_incumbency_bonus},
            {"retirement_penalty", &Assumptions::retirement_penalty,
             &Assumptions::set_retirement_penalty},
            {"entrant_primary_weight", &Assumptions::entrant_primary_weight,
             &Assumptions::set_entrant_primary_weight},
            {"entrant_secondary_weight", &Assumptions::entrant_secondary_weight,
             &Assumptions::set_entrant_secondary_weight},
            {"entrant_local_dampening", &Assumptions::entrant_local_dampening,
             &Assumptions::set_entrant_local_dampening},
            {"turnout_adjustment", &Assumptions::turnout_adjustment,
             &Assumptions::set_turnout_adjustment},
            {"swing_multiplier", &Assumptions::swing_multiplier,
             &Assumptions::set_swing_multiplier},
        };
        for (const auto& field : kFields) {
            double value = (a.*field.get)();
            if (!ReadIniDouble(*section, field.key, &value)) {
                Err() << "Invalid assumptions in " << file_name;
                return false;
            }
            (a.*field.set)(value);
        }

        bool stands = a.entrant_stands_everywhere();
        if (!ReadIniBool(*section, "entrant_stands_everywhere", &stands)) {
            Err() << "Invalid assumptions in " << file_name;
            return false;
        }
        a.set_entrant_stands_everywhere(stands);

        std::string entrant = a.entrant_party();
        ReadIniString(*section, "entrant_party", &entrant);
        a.set_entrant_party(entrant);
    }

    assumptions_ = ClampAssumptions(a);
    return true;
}

bool
Council::InitDemographicRules(const IniFile& file, std::string_view file_name)
{
    const IniSection* section = FindSection(file, "demographic_rules");
    if (!section)
        return true;

    DemographicRules& r = rules_;
    ReadIniString(*section, "left_party", &r.left_party);
    ReadIniString(*section, "right_party", &r.right_party);
    ReadIniString(*section, "independent_party", &r.independent_party);

    bool ok = ReadIniInt(*section, "high_deprivation_decile", &r.high_deprivation_decile) &&
        ReadIniDouble(*section, "high_deprivation_left_bonus", &r.high_deprivation_left_bonus) &&
        ReadIniDouble(*section, "high_deprivation_right_penalty",
                      &r.high_deprivation_right_penalty) &&
        ReadIniDouble(*section, "high_deprivation_entrant_bonus",
                      &r.high_deprivation_entrant_bonus) &&
        ReadIniDouble(*section, "over65_threshold", &r.over65_threshold) &&
        ReadIniDouble(*section, "over65_right_bonus", &r.over65_right_bonus) &&
        ReadIniDouble(*section, "over65_entrant_bonus", &r.over65_entrant_bonus) &&
        ReadIniDouble(*section, "white_british_threshold", &r.white_british_threshold) &&
        ReadIniDouble(*section, "white_british_entrant_bonus",
                      &r.white_british_entrant_bonus) &&
        ReadIniDouble(*section, "asian_heritage_threshold", &r.asian_heritage_threshold) &&
        ReadIniDouble(*section, "asian_heritage_independent_bonus",
                      &r.asian_heritage_independent_bonus) &&
        ReadIniDouble(*section, "asian_heritage_entrant_penalty",
                      &r.asian_heritage_entrant_penalty);
    if (!ok) {
        Err() << "Invalid demographic_rules in " << file_name;
        return false;
    }
    return true;
}

void
Council::InitOverrides(const IniFile& file)
{
    const IniSection* section = FindSection(file, "overrides");
    if (!section)
        return;
    for (const auto& [ward, party] : *section) {
        if (party.empty())
            continue;
        overrides_[ward] = party;
    }
}

bool
Council::LoadDataset(const std::string& path)
{
    std::string text;
    if (!ReadFile(path, &text)) {
        Err() << "Could not read dataset " << path;
        return false;
    }
    if (!google::protobuf::TextFormat::ParseFromString(text, &data_)) {
        Err() << "Could not parse dataset " << path;
        return false;
    }
    if (data_.wards().empty()) {
        Err() << "Dataset " << path << " has no wards";
        return false;
    }
    Debug() << "Loaded " << data_.wards_size() << " wards from " << path;
    return true;
}

} // namespace wardcast
