#pragma once

#include <cstdio>
#include <cstdlib>

#include <atomic>
#include <mutex>
#include <type_traits>

#include "common.hpp"


namespace glint {

//
// Trivial extension of "printf" supporting any streamable object for "%s".
// (e.g. format("xxx %s", some_object) where (cout << some_object) is defined.)
//

// identity function if "is_scalar"
template<typename T, std::enable_if_t<std::is_scalar_v<T>, int> = 0>
inline T toScalarOrString(T v) {
  return v;
}

// outstream to std::string if not "is_scalar"
template<typename T, std::enable_if_t<!std::is_scalar_v<T>, int> = 0>
inline std::string toScalarOrString(const T& v) {
  std::ostringstream result;
  result << v;
  return result.str();
}

// char literals (non-template wins over both templates above)
inline const char* toScalarOrString(const char* v) {
  return v;
}

// identity function if "is_scalar"
template<typename T, std::enable_if_t<std::is_scalar_v<T>, int> = 0>
inline T toScalarOrChars(T v) {
  return v;
}

// obtain c-string if std::string
inline const char* toScalarOrChars(const std::string& v) {
  return v.c_str();
}

// usual safer snprintf call
template<typename... Ts>
inline std::string formatScalarOrString(const char* format_str, const Ts&... vs) {
  int size = std::snprintf(nullptr, 0, format_str, toScalarOrChars(vs)...);
  GLINT_ASSERT(size >= 0);
  std::string result;
  result.resize(size);
  std::snprintf(result.data(), size + 1, format_str, toScalarOrChars(vs)...);
  return result;
}

// This prevents calling snprintf without vararg, which triggers clang warnings.
inline std::string format(const char* fmtstr) {
  return std::string{fmtstr};
}

template<typename T, typename... Ts>
inline std::string format(const char* fmtstr, const T& v, const Ts&... vs) {
  return formatScalarOrString(fmtstr, toScalarOrString(v), toScalarOrString(vs)...);
}

template<typename... Ts>
inline void print(const char* fmtstr, const Ts&... vs) {
  std::printf("%s", format(fmtstr, vs...).c_str());
}

// const string& versions
template<typename... Ts>
inline std::string format(const std::string& fmtstr, const Ts&... vs) {
  return format(fmtstr.c_str(), vs...);
}

template<typename... Ts>
inline void print(const std::string& fmtstr, const Ts&... vs) {
  print(fmtstr.c_str(), vs...);
}


//
// Leveled logging to stderr
//   log::info("bvh", "built %u nodes", n)  ~~>  "[info:bvh] built 123 nodes"
//
namespace log {

enum class Level : int { kDebug = 0, kInfo, kWarn, kError, kQuiet };

inline const char* levelName(Level level) {
  switch (level) {
    case Level::kDebug: return "debug";
    case Level::kInfo:  return "info";
    case Level::kWarn:  return "warn";
    case Level::kError: return "error";
    case Level::kQuiet: return "quiet";
  }
  return "?";
}

inline bool parseLevel(const std::string& s, /*out*/ Level& level) {
  for (auto l : {Level::kDebug, Level::kInfo, Level::kWarn, Level::kError, Level::kQuiet}) {
    if (s == levelName(l)) {
      level = l;
      return true;
    }
  }
  return false;
}

struct State {
  std::atomic<int> threshold;
  std::mutex mutex;

  State() : threshold{static_cast<int>(Level::kInfo)} {
    // GLINT_LOG_LEVEL overrides the default threshold
    const char* env = std::getenv("GLINT_LOG_LEVEL");
    Level level;
    if (env && parseLevel(env, level))
      threshold = static_cast<int>(level);
  }

  static State& get() {
    static State state;
    return state;
  }
};

inline void setLevel(Level level) {
  State::get().threshold = static_cast<int>(level);
}

inline Level getLevel() {
  return static_cast<Level>(State::get().threshold.load());
}

inline bool enabled(Level level) {
  return level != Level::kQuiet && static_cast<int>(level) >= State::get().threshold.load();
}

template<typename... Ts>
inline void write(Level level, const char* tag, const char* fmtstr, const Ts&... vs) {
  if (!enabled(level))
    return;
  std::string line = format("[%s:%s] ", levelName(level), tag) + format(fmtstr, vs...) + "\n";
  std::lock_guard<std::mutex> lock{State::get().mutex};
  std::fputs(line.c_str(), stderr);
}

template<typename... Ts>
inline void debug(const char* tag, const char* fmtstr, const Ts&... vs) {
  write(Level::kDebug, tag, fmtstr, vs...);
}

template<typename... Ts>
inline void info(const char* tag, const char* fmtstr, const Ts&... vs) {
  write(Level::kInfo, tag, fmtstr, vs...);
}

template<typename... Ts>
inline void warn(const char* tag, const char* fmtstr, const Ts&... vs) {
  write(Level::kWarn, tag, fmtstr, vs...);
}

template<typename... Ts>
inline void error(const char* tag, const char* fmtstr, const Ts&... vs) {
  write(Level::kError, tag, fmtstr, vs...);
}

} // namespace log

} // namespace glint


