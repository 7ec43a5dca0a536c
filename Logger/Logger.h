/*
 * Copyright 2022 HEAVY.AI, Inc.
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

/*
 * @file    Logger.h
 * @description Boost.Log based logging with injected, attribute-tagged sources.
 *
 * Usage:
 * - Initialize a LogOptions object. E.g.
 *   logger::LogOptions log_options(argv[0]);
 * - LogOptions can optionally be added to boost::program_options:
 *   help_desc.add(log_options.get_options());
 * - Initialize the sinks once per application:
 *   logger::init(log_options);
 * - Give each component a LogSource, optionally tagged:
 *   logger::LogSource log = parent_log.tag("Component", "channel");
 * - Log through it:
 *    - LOG(log, INFO) << "Nice import!";
 *    - LOG(log, DEBUG1) << "x = " << x;
 *    - CHECK(condition);
 *    - CHECK_LE(x, xmax);
 *   Newlines are automatically appended to log messages.
 */

#ifndef CSV2DB_LOGGER_LOGGER_H
#define CSV2DB_LOGGER_LOGGER_H

#include <boost/config.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/program_options/options_description.hpp>

#include <array>
#include <iosfwd>
#include <memory>
#include <sstream>
#include <string>

#ifdef ERROR
#error "ERROR must not be globally defined during preprocessing."
#endif

namespace csv2db {
namespace logger {

// Severity, SeverityNames, and SeveritySymbols must be updated together.
enum Severity {
  DEBUG4 = 0,
  DEBUG3,
  DEBUG2,
  DEBUG1,
  INFO,
  WARNING,
  ERROR,
  FATAL,
  _NSEVERITIES  // number of severity levels
};

constexpr std::array<char const*, 8> SeverityNames{"DEBUG4",
                                                   "DEBUG3",
                                                   "DEBUG2",
                                                   "DEBUG1",
                                                   "INFO",
                                                   "WARNING",
                                                   "ERROR",
                                                   "FATAL"};

constexpr std::array<char, 8> SeveritySymbols{'4', '3', '2', '1', 'I', 'W', 'E', 'F'};

static_assert(Severity::_NSEVERITIES == SeverityNames.size(),
              "Size of SeverityNames must equal number of Severity levels.");
static_assert(Severity::_NSEVERITIES == SeveritySymbols.size(),
              "Size of SeveritySymbols must equal number of Severity levels.");

// Used by boost::program_options when parsing and printing enum Severity.
std::istream& operator>>(std::istream&, Severity&);
std::ostream& operator<<(std::ostream&, Severity const&);

// Filled by boost::program_options
class LogOptions {
  std::string base_path_{"."};  // ignored if log_dir_ is absolute.
  // boost::program_options::options_description is not copyable so unique_ptr
  // allows for modification after initialization (e.g. changing default values.)
  std::unique_ptr<boost::program_options::options_description> options_;

 public:
  // Initialize to default values
  boost::filesystem::path log_dir_{"csv2db_log"};
  // file_name_pattern and symlink are prepended with base_name.
  std::string file_name_pattern_{".{SEVERITY}.%Y%m%d-%H%M%S.log"};
  std::string symlink_{".{SEVERITY}"};
  Severity severity_{Severity::INFO};
  Severity severity_clog_{Severity::ERROR};
  bool auto_flush_{true};
  size_t max_files_{100};
  size_t min_free_space_{20 << 20};
  bool rotate_daily_{true};
  size_t rotation_size_{10 << 20};

  LogOptions(char const* argv0);
  boost::filesystem::path full_log_dir() const;
  boost::program_options::options_description const& get_options() const;
  void parse_command_line(int, char const* const*);
  void set_base_path(std::string const& base_path);
  void set_options();
};

// Execute once in main() to add the sinks.
void init(LogOptions const&);

// Flush all sinks.
// https://www.boost.org/libs/log/doc/html/log/rationale/why_crash_on_term.html
void shutdown();

struct LogShutdown {
  inline ~LogShutdown() { shutdown(); }
};

using SeverityLogger = boost::log::sources::severity_logger_mt<Severity>;

// A log source handed to each component. Copies are independent: tagging a copy does
// not affect the source it was copied from. The sinks print the "Component" and "Table"
// tags in brackets in front of the message.
class LogSource {
 public:
  LogSource() = default;
  LogSource tag(std::string const& name, std::string const& value) const;
  SeverityLogger& get() const { return logger_; }

 private:
  mutable SeverityLogger logger_;
};

// Lifetime of Logger is each call to LOG().
class Logger {
  // Set only for records not bound to a LogSource (CHECK failures).
  std::unique_ptr<SeverityLogger> owned_source_;
  SeverityLogger* source_;
  Severity const severity_;
  // Pointers are used to minimize size of inline objects.
  std::unique_ptr<boost::log::record> record_;
  std::unique_ptr<boost::log::record_ostream> stream_;

 public:
  Logger(LogSource const&, Severity);
  explicit Logger(Severity);
  Logger(Logger&&) = default;
  ~Logger();
  operator bool() const;
  // Must check operator bool() first before calling stream().
  boost::log::record_ostream& stream(char const* file, int line);
};

// These macros risk inadvertent else-matching to the if statements.
// These can be changed to for/while loops with slight performance degradation.

#define LOG(source, tag)                                                       \
  if (auto _csv2db_logger_ =                                                   \
          ::csv2db::logger::Logger((source), ::csv2db::logger::tag))           \
  _csv2db_logger_.stream(__FILE__, __LINE__)

#define LOG_IF(source, tag, condition) \
  if (condition)                       \
  LOG(source, tag)

#define CSV2DB_LOG_FATAL()                                                           \
  if (auto _csv2db_logger_ = ::csv2db::logger::Logger(::csv2db::logger::FATAL)) \
  _csv2db_logger_.stream(__FILE__, __LINE__)

#define CHECK(condition)            \
  if (BOOST_UNLIKELY(!(condition))) \
  CSV2DB_LOG_FATAL() << "Check failed: " #condition " "

#define CHECK_OP(OP, x, y)                                                \
  if (std::string* fatal_msg = ::csv2db::logger::Check##OP(x, y, #x, #y)) \
  CSV2DB_LOG_FATAL() << *std::unique_ptr<std::string>(fatal_msg)

#define CHECK_EQ(x, y) CHECK_OP(EQ, x, y)
#define CHECK_NE(x, y) CHECK_OP(NE, x, y)
#define CHECK_LT(x, y) CHECK_OP(LT, x, y)
#define CHECK_LE(x, y) CHECK_OP(LE, x, y)
#define CHECK_GT(x, y) CHECK_OP(GT, x, y)
#define CHECK_GE(x, y) CHECK_OP(GE, x, y)

template <typename X, typename Y>
BOOST_NOINLINE std::string* check_failed(X const& x,
                                         Y const& y,
                                         char const* xstr,
                                         char const* ystr,
                                         char const* op_str) {
  std::stringstream ss;
  ss << "Check failed: " << xstr << op_str << ystr << " (" << x << op_str << y << ") ";
  return new std::string(ss.str());  // Deleted by CHECK_OP macro.
}

// Complexity comes from requirement that x and y be evaluated only once.
#define CSV2DB_CHECKOP_FUNCTION(name, op)                                 \
  template <typename X, typename Y>                                       \
  inline std::string* Check##name(                                        \
      X const& x, Y const& y, char const* xstr, char const* ystr) {       \
    if (BOOST_LIKELY(x op y))                                             \
      return nullptr;                                                     \
    else                                                                  \
      return ::csv2db::logger::check_failed(x, y, xstr, ystr, " " #op " "); \
  }
CSV2DB_CHECKOP_FUNCTION(EQ, ==)
CSV2DB_CHECKOP_FUNCTION(NE, !=)
CSV2DB_CHECKOP_FUNCTION(LT, <)
CSV2DB_CHECKOP_FUNCTION(LE, <=)
CSV2DB_CHECKOP_FUNCTION(GT, >)
CSV2DB_CHECKOP_FUNCTION(GE, >=)
#undef CSV2DB_CHECKOP_FUNCTION

#define UNREACHABLE() CSV2DB_LOG_FATAL() << "UNREACHABLE "

}  // namespace logger
}  // namespace csv2db

#endif  // CSV2DB_LOGGER_LOGGER_H
