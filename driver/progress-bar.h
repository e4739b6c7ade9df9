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

#include <indicators/indicators.hpp>

namespace wardcast {

// Per-ward progress shown while a council is predicted. Only touched from the
// thread that runs completion callbacks.
class WardProgress
{
  public:
    WardProgress(const std::string& council, size_t wards) {
        bar_.set_option(indicators::option::BarWidth{40});
        bar_.set_option(indicators::option::MaxProgress{wards});
        bar_.set_option(indicators::option::PrefixText{council + " "});
        bar_.set_option(indicators::option::ShowPercentage{true});
        bar_.print_progress();
    }
    ~WardProgress() {
        Finish();
    }

    void Tick(const std::string& ward) {
        bar_.set_option(indicators::option::PostfixText{ward});
        bar_.tick();
    }

    void Finish() {
        if (!bar_.is_completed())
            bar_.mark_as_completed();
    }

  private:
    indicators::ProgressBar bar_;
};

} // namespace wardcast
