// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#ifndef AIFO_FASTBIF_INCLUDE_FASTBIF_STATUS_STATUS_MACROS_H_
#define AIFO_FASTBIF_INCLUDE_FASTBIF_STATUS_STATUS_MACROS_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"

namespace fastbif::status {

/**
 * @brief Formats a single stack-frame line.
 *
 * Produces a line of the form:
 *     "  at FunctionName (file.cpp:123) [StatusCode] - optional message"
 */
inline std::string FormatStackFrame(char const* function, char const* file,
                                    int line, absl::StatusCode code,
                                    std::string_view message) {
  std::string s = "  at ";
  s.append(function);
  s.append(" (");
  s.append(file);
  s.push_back(':');
  s.append(std::to_string(line));
  s.append(") [");
  s.append(absl::StatusCodeToString(code));
  s.append("]");

  if (!message.empty()) {
    s.append(" - ");
    s.append(message);
  }
  return s;
}

/**
 * @brief Strips any existing stack-frame lines from a full message,
 *        leaving only the root error text.
 *
 * Removes everything from the first "\n  at " onward.
 */
inline std::string StripStackTrace(std::string_view full_message) {
  if (auto pos = full_message.find("\n  at "); pos != std::string_view::npos) {
    return std::string(full_message.substr(0, pos));
  }
  return std::string(full_message);
}

/**
 * @brief Appends exactly one new stack frame to a Status.
 *
 * If the input status is ok(), returns it unmodified. Otherwise the root
 * error text and earlier frames are kept, the new frame is appended and all
 * payloads of the input status are carried over to the result.
 *
 * @param st        Original absl::Status.
 * @param function  Name of the calling function.
 * @param file      Source file path.
 * @param line      Source line number.
 * @param message   Optional per-frame message.
 * @return A new absl::Status with the appended frame.
 */
inline absl::Status AddTraceImpl(absl::Status const& st, char const* function,
                                 char const* file, int line,
                                 std::string_view message) {
  if (st.ok()) {
    return st;
  }

  std::string root = StripStackTrace(st.message());

  std::string tail;
  if (auto pos = st.message().find("\n  at "); pos != std::string::npos) {
    tail = std::string(st.message().substr(pos));
  }

  std::string frame =
      FormatStackFrame(function, file, line, st.code(), message);

  std::string out = root;
  if (!tail.empty()) {
    out += tail;
  }
  out.push_back('\n');
  out += frame;

  absl::Status traced(st.code(), out);
  st.ForEachPayload(
      [&traced](std::string_view type_url, const absl::Cord& payload) {
        traced.SetPayload(type_url, payload);
      });
  return traced;
}

/// @brief Overload for absl::StatusOr<T>.
template <typename T>
inline absl::StatusOr<T> AddTraceImpl(absl::StatusOr<T> const& sor,
                                      char const* function, char const* file,
                                      int line, std::string_view message) {
  if (sor.ok()) {
    return sor;
  }
  return AddTraceImpl(sor.status(), function, file, line, message);
}

/// @brief Public entrypoint for appending a trace frame to an absl::Status.
inline absl::Status AddTrace(absl::Status const& st, char const* function,
                             char const* file, int line,
                             std::string_view message = {}) {
  return AddTraceImpl(st, function, file, line, message);
}

/// @brief Public entrypoint for appending a trace frame to a StatusOr<T>.
template <typename T>
inline absl::StatusOr<T> AddTrace(absl::StatusOr<T> const& sor,
                                  char const* function, char const* file,
                                  int line, std::string_view message = {}) {
  return AddTraceImpl(sor, function, file, line, message);
}

}  // namespace fastbif::status

//------------------------------------------------------------------------------
// Macros
//------------------------------------------------------------------------------

/**
 * @brief Create a traced absl::Status with an initial frame.
 *
 * @param code    The absl::StatusCode to use.
 * @param message The error message.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS(code, message)                                       \
  ::fastbif::status::AddTrace(absl::Status((code), (message)), __func__, \
                              __FILE__, __LINE__, (message))

/**
 * @brief Add a trace frame to an already constructed absl::Status.
 *
 * Used where the status carries payloads set before it is returned.
 *
 * @param st      The absl::Status to trace.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define TRACE_STATUS(st) \
  ::fastbif::status::AddTrace((st), __func__, __FILE__, __LINE__)

/**
 * @brief Propagate an absl::Status, appending this function as a frame.
 *
 * @param expr  A Status-producing expression.
 * @param msg   Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define RETURN_IF_ERROR(expr, msg)                                          \
  do {                                                                      \
    auto _st = (expr);                                                      \
    if (!_st.ok()) {                                                        \
      return ::fastbif::status::AddTrace(_st, __func__, __FILE__, __LINE__, \
                                         (msg));                            \
    }                                                                       \
  } while (0)

/**
 * @brief Unpack a StatusOr<T> into lhs or return on error with a trace.
 *
 * @param lhs   Target variable to assign.
 * @param expr  A StatusOr<T>-producing expression.
 * @param ...   Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN(lhs, expr, ...)                                    \
  do {                                                                      \
    auto _sor = (expr);                                                     \
    if (!_sor.ok()) {                                                       \
      return ::fastbif::status::AddTrace(_sor.status(), __func__, __FILE__, \
                                         __LINE__, ##__VA_ARGS__);          \
    }                                                                       \
    lhs = std::move(_sor.value());                                          \
  } while (0)

/**
 * @brief Move-aware version of ASSIGN_OR_RETURN for move-only types.
 *
 * @param lhs   Target variable to assign (must be already declared).
 * @param expr  A StatusOr<T>-producing expression.
 * @param ...   Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN_MOVE(lhs, expr, ...)                          \
  do {                                                                 \
    auto _status_or_result = (expr);                                   \
    if (!_status_or_result.ok()) {                                     \
      return ::fastbif::status::AddTrace(_status_or_result.status(),   \
                                         __func__, __FILE__, __LINE__, \
                                         ##__VA_ARGS__);               \
    }                                                                  \
    lhs = std::move(_status_or_result).value();                        \
  } while (0)

#endif  // AIFO_FASTBIF_INCLUDE_FASTBIF_STATUS_STATUS_MACROS_H_
