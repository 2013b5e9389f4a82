/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file lxd/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

#include <boost/thread/shared_mutex.hpp>
#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>

#include <fstream>
#include <map>
#include <queue>
#include <sstream>
#include <string>

//! Log levels, combined into a bit mask
#define LEND_ALERT 1
#define LEND_CRITICAL 2
#define LEND_ERROR 4
#define LEND_WARNING 8
#define LEND_NOTICE 16
#define LEND_DEBUG 32
#define LEND_DATA 64

namespace lend {
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
    const std::string& name() const { return name_; }

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
  This logger writes each log message out to stderr. Messages above the
  threshold level are dropped.
  \ingroup utilities
  \see Log
 */
class StderrLogger : public Logger {
public:
    //! the name "StderrLogger"
    static const std::string name;
    //! Constructor
    StderrLogger(unsigned threshold = LEND_WARNING) : Logger(name), threshold_(threshold) {}
    //! The log callback that writes to stderr
    void log(unsigned level, const std::string& msg) override;

private:
    unsigned threshold_;
};

//! FileLogger
/*!
  This logger writes each log message out to the given file.
  The file is flushed, but not closed, after each log message.
  \ingroup utilities
  \see Log
 */
class FileLogger : public Logger {
public:
    //! the name "FileLogger"
    static const std::string name;
    //! Constructor
    /*!
      Opens the given file.
      \param filename the log filename
     */
    FileLogger(const std::string& filename);
    //! Destructor
    ~FileLogger();
    //! The log callback
    void log(unsigned, const std::string&) override;

private:
    std::string filename_;
    std::fstream fout_;
};

//! BufferLogger
/*!
  This logger stores each log message in an internal buffer, it can then be probed for log messages at a later point.
  Log messages are always returned in FIFO order.

  \ingroup utilities
  \see Log
 */
class BufferLogger : public Logger {
public:
    //! the name "BufferLogger"
    static const std::string name;
    //! Constructor
    BufferLogger(unsigned minLevel = LEND_DATA) : Logger(name), minLevel_(minLevel) {}
    //! The log callback
    void log(unsigned level, const std::string& s) override;

    //! Checks if Logger has new messages
    bool hasNext();
    //! Retrieve new messages
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

  To configure the Log class to log to a file "/tmp/lendval.log":
  <pre>
      Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>("/tmp/lendval.log"));
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

public:
    //! Add a new Logger.
    /*! Adding a new logger will fail if one with the same name already exists */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    QuantLib::ext::shared_ptr<Logger>& logger(const std::string& name);
    //! Remove a Logger
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
        return enabled_ && 0 != (mask & mask_);
    }
    unsigned mask() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return mask_;
    }
    void setMask(unsigned mask) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        mask_ = mask;
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
    Log();

    std::map<std::string, QuantLib::ext::shared_ptr<Logger>> loggers_;
    bool enabled_;
    unsigned mask_;
    std::ostringstream ls_;

    int maxLen_ = 45;
    mutable boost::shared_mutex mutex_;
};

/*!
  Main Logging macro, do not use this directly, use on of the below 7 macros instead
 */
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (lend::data::Log::instance().filter(mask)) {                                                                \
            boost::unique_lock<boost::shared_mutex> lock(lend::data::Log::instance().mutex());                         \
            lend::data::Log::instance().header(mask, __FILE__, __LINE__);                                              \
            lend::data::Log::instance().logStream() << text;                                                           \
            lend::data::Log::instance().log(mask);                                                                     \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(LEND_ALERT, text);
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(LEND_CRITICAL, text);
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(LEND_ERROR, text);
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(LEND_WARNING, text);
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(LEND_NOTICE, text);
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(LEND_DEBUG, text);
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(LEND_DATA, text);

} // namespace data
} // namespace lend
