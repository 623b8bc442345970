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

namespace bithash {

// ANSI escape sequences used to colorize log lines
inline constexpr const char* kColorReset{"\x1b[0m"};
inline constexpr const char* kColorCoal{"\x1b[90m"};
inline constexpr const char* kColorGreen{"\x1b[32m"};
inline constexpr const char* kColorCyan{"\x1b[36m"};
inline constexpr const char* kColorRed{"\x1b[31m"};
inline constexpr const char* kColorYellow{"\x1b[93m"};
inline constexpr const char* kColorWhite{"\x1b[97m"};
inline constexpr const char* kBackgroundPurple{"\x1b[45m"};
inline constexpr const char* kBackgroundRed{"\x1b[41m"};

//! \brief Whether the standard stream (stdout when use_stdout, stderr otherwise) is an interactive console able to
//! render ANSI colors
//! \remarks On Windows this also switches the console into virtual terminal mode
bool console_supports_colors(bool use_stdout);

}  // namespace bithash
