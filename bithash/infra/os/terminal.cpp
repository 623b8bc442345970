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

#include "terminal.hpp"

#include <cstdio>

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace bithash {

bool console_supports_colors(bool use_stdout) {
    std::FILE* stream{use_stdout ? stdout : stderr};
#if defined(_WIN32)
    if (_isatty(_fileno(stream)) == 0) return false;
    const HANDLE handle{GetStdHandle(use_stdout ? STD_OUTPUT_HANDLE : STD_ERROR_HANDLE)};
    DWORD mode{0};
    if (handle == INVALID_HANDLE_VALUE or GetConsoleMode(handle, &mode) == 0) return false;
    return SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

}  // namespace bithash
