/*
   Copyright 2023 The Bithash Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#pragma once

#include <CLI/CLI.hpp>

#include <bithash/infra/common/log.hpp>

namespace bithash::cmd {

//! \brief Accepts UTC or any IANA time zone name known to the system
struct TimeZoneValidator : public CLI::Validator {
    explicit TimeZoneValidator(bool allow_empty = false);
};

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

}  // namespace bithash::cmd
