/*
 Copyright (C) 2025 The MPE Authors
 All rights reserved.

 This file is part of MPE, a free-software/open-source library
 for mortgage amortization and payoff projection

 MPE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program, see the LICENSE file.

 This program is distributed in the hope that it will be useful, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file mped/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

// accumulated 'filter' for 'external' DEBUG_MASK
#define MPE_ALERT 1    // 00000001   1 = 2^1-1
#define MPE_CRITICAL 2 // 00000010   2 = 2^2-2
#define MPE_ERROR 4    // 00000100   4
#define MPE_WARNING 8  // 00001000   8
#define MPE_NOTICE 16  // 00010000   16
#define MPE_DEBUG 32   // 00100000   32
#define MPE_DATA 64    // 01000000   64

#include <fstream>
#include <list>
#include <map>
#include <queue>
#include <sstream>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <boost/thread/lock_types.hpp>
#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>

namespace mpe {
namespace data {

//! The Base Custom Log Handler class
/*!
  This base log handler class can be used to define your own custom handler and then registered with the Log class.
  Once registered it will receive all log messages as soon as they occur via it's log() method
  \ingroup utilities
  \see Log
 */
class Logger {
public:
    //! Destructor
    virtual ~Logger() {}

    //! The Log call back function
    /*!
      This function will be called every time a log message is produced.
      \param level the log level
      \param s the log message
     */
    virtual void log(unsigned level, const std::string& s) = 0;

    //! Returns the Logger name
    const std::string& name() { return name_; }

protected:
    //! Constructor
    /*!
      Implementations must provide a logger name
      \param name the logger name
     */
    Logger(const std::string& name) : name_(name) {}

private:
    std::string name_;
};

//! Stderr Logger
/*!
  This logger writes each log message out to stderr
  \ingroup utilities
  \see Log
 */
class StderrLogger : public Logger {
public:
    //! the name "StderrLogger"
    static const std::string name;
    //! Constructor
    /*!
      This logger writes all logs to stderr.
      If alertOnly is set to true, it will only write alerts.
     */
    StderrLogger(bool alertOnly = false) : Logger(name), alertOnly_(alertOnly) {}
    //! Destructor
    virtual ~StderrLogger() {}
    //! The log callback that writes to stderr
    virtual void log(unsigned l, const std::string& s) override;

private:
    bool alertOnly_;
};

//! FileLogger
/*!
  This logs all messages to a file
  \ingroup utilities
  \see Log
 */
class FileLogger : public Logger {
public:
    //! the name "FileLogger"
    static const std::string name;
    //! Constructor
    /*!
      Construct a file logger using the given filename, this filename is passed to std::fostream::open()
      and this constructor will throw an exception if the file is not opened (e.g. if the filename is invalid)
      \param filename the log filename
     */
    FileLogger(const std::string& filename);
    //! Destructor
    virtual ~FileLogger();
    //! The log callback
    virtual void log(unsigned, const std::string&) override;

private:
    std::string filename_;
    std::fstream fout_;
};

//! BufferLogger
/*!
  This logger stores each log message in an internal buffer, it can then be probed for log messages at a later point.
  Log messages are always returned in FIFO order.

  Typical usage to display log messages would be
  <pre>
      while (bLogger.hasNext()) {
          MsgBox("Log Message", bLogger.next());
      }
  </pre>
  \ingroup utilities
  \see Log
 */
class BufferLogger : public Logger {
public:
    //! the name "BufferLogger"
    static const std::string name;
    //! Constructor
    BufferLogger(unsigned minLevel = MPE_DATA) : Logger(name), minLevel_(minLevel) {}
    //! Destructor
    virtual ~BufferLogger() {}
    //! The log callback
    virtual void log(unsigned, const std::string&) override;

    //! Checks if Logger has new messages
    /*!
      \return True if this Logger has new messages
     */
    bool hasNext();
    //! Retrieve new messages
    /*!
      Retrieve the next new message from the buffer, this will throw if the buffer is empty.
      \return The next message
     */
    std::string next();

private:
    std::queue<std::string> buffer_;
    unsigned minLevel_;
};

//! Global static Log class
/*!
  The Global Log class gets registered with individual loggers and receives application log messages.
  Once a message is received, it is immediately dispatched to each of the registered loggers, the order in which
  the loggers are called is not guaranteed.

  Logging is done by the calling thread and the LOG call blocks until all the loggers have returned.

  At start up, the Log class has no loggers and so will ignore any LOG() messages until it is configured.

  To configure the Log class to log to a file "/tmp/mpe.log":
  <pre>
      Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>("/tmp/mpe.log"));
      Log::instance().switchOn();
  </pre>

  To change the Log class to only use a BufferLogger:
  <pre>
      Log::instance().removeAllLoggers();
      Log::instance().registerLogger(QuantLib::ext::make_shared<BufferLogger>());
  </pre>

  \ingroup utilities
  \see Logger
 */
class Log : public QuantLib::Singleton<Log, std::integral_constant<bool, true>> {

    friend class QuantLib::Singleton<Log, std::integral_constant<bool, true>>;

private:
    // may be empty but never uninitialised
    Log();

public:
    //! Add a new Logger.
    /*! Adding a new logger will throw if a logger with the same name is already registered
     */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    /*! Retrieve a Logger by name, this will throw if there is no logger with this name
     */
    QuantLib::ext::shared_ptr<Logger>& logger(const std::string& name);
    //! Remove a Logger
    /*! Remove a logger by name, this will throw if there is no logger with this name
     */
    void removeLogger(const std::string& name);
    //! Remove all loggers
    void removeAllLoggers();

    //! macro utility function - do not use directly
    void header(unsigned m, const char* filename, int lineNo);
    //! macro utility function - do not use directly
    std::ostream& logStream() { return ls_; }
    //! macro utility function - do not use directly
    void log(unsigned m);

    //! mutex to acquire locks
    boost::shared_mutex& mutex() { return mutex_; }

    // Avoid a large number of warnings in VS by adding 0 !=
    bool filter(unsigned mask) {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return 0 != (mask & mask_);
    }
    unsigned mask() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return mask_;
    }
    void setMask(unsigned mask) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        mask_ = mask;
    }

    const boost::filesystem::path& rootPath() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return rootPath_;
    }
    void setRootPath(const boost::filesystem::path& pth) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        rootPath_ = pth;
    }
    int maxLen() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return maxLen_;
    }
    void setMaxLen(const int n) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        maxLen_ = n;
    }

    bool enabled() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return enabled_;
    }
    void switchOn() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = true;
    }
    void switchOff() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = false;
    }

private:
    std::map<std::string, QuantLib::ext::shared_ptr<Logger>> loggers_;
    bool enabled_;
    unsigned mask_;
    boost::filesystem::path rootPath_;
    std::ostringstream ls_;

    int maxLen_ = 45;

    mutable boost::shared_mutex mutex_;
};

/*!
  Main Logging macro, do not use this directly, use on of the below 6 macros instead
 */
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (mpe::data::Log::instance().enabled() && mpe::data::Log::instance().filter(mask)) {                        \
            std::ostringstream __mpe_mlog_tmp_stringstream;                                                            \
            __mpe_mlog_tmp_stringstream << text;                                                                       \
            boost::unique_lock<boost::shared_mutex> lock(mpe::data::Log::instance().mutex());                          \
            mpe::data::Log::instance().header(mask, __FILE__, __LINE__);                                               \
            mpe::data::Log::instance().logStream() << __mpe_mlog_tmp_stringstream.str();                              \
            mpe::data::Log::instance().log(mask);                                                                      \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(MPE_ALERT, text)
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(MPE_CRITICAL, text)
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(MPE_ERROR, text)
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(MPE_WARNING, text)
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(MPE_NOTICE, text)
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(MPE_DEBUG, text)
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(MPE_DATA, text)

//! Structured log message
/*!
  A message with a category, a group, a free text and a set of named sub-fields. It is rendered as a single line
  of JSON and logged at ALOG (errors) or WLOG (warnings) so that callers can pick it up from any registered Logger.
  \ingroup utilities
 */
class StructuredMessage {
public:
    enum class Category { Error, Warning, Unknown };
    enum class Group { Loan, Plan, Engine, Configuration, Unknown };

    StructuredMessage(const Category& category, const Group& group, const std::string& message,
                      const std::map<std::string, std::string>& subFields = {});
    virtual ~StructuredMessage() {}

    static constexpr const char* name = "StructuredMessage";

    const Category& category() const { return category_; }
    const Group& group() const { return group_; }
    const std::string& message() const { return message_; }
    const std::map<std::string, std::string>& subFields() const { return subFields_; }

    //! JSON representation of the message
    std::string json() const;

    //! Log the message at the level matching its category
    void log() const;

protected:
    Category category_;
    Group group_;
    std::string message_;
    std::map<std::string, std::string> subFields_;
};

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category& category);
std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group& group);

//! Escape a string for use as a JSON value
std::string jsonify(const std::string& s);

} // namespace data
} // namespace mpe
