/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#if !defined(STREAMCODEC_API)
#if defined(STREAMCODEC_BUILD_SHARED)
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(STREAMCODEC_BUILDING_LIBRARY)
#define STREAMCODEC_API __declspec(dllexport)
#else
#define STREAMCODEC_API __declspec(dllimport)
#endif
#else
#define STREAMCODEC_API __attribute__((visibility("default")))
#endif
#else
#define STREAMCODEC_API
#endif
#endif

#if !defined(STREAMCODEC_LOCAL)
#if defined(_WIN32) || defined(__CYGWIN__)
#define STREAMCODEC_LOCAL
#else
#define STREAMCODEC_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
