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

// Detect compiler
#if defined(_MSC_VER) && !defined(__clang__)
#define BITHASH_COMPILER_MSVC
#elif defined(__clang__) || defined(__INTEL_COMPILER) || defined(__GNUC__)
#define BITHASH_COMPILER_GNU_LIKE
#else
#error Cannot detect compiler or compiler is not supported
#endif

#if defined(BITHASH_COMPILER_MSVC)
#define __func__ __FUNCTION__
#endif
