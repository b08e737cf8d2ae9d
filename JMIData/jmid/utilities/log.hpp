/*
 Copyright (C) 2016 Quaternion Risk Management Ltd
 Copyright (C) 2026 JMI Developers
 All rights reserved.

 This file is part of JMI, a free-software/open-source library
 for market-implied rate and credit analytics.

 JMI is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file jmid/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

// accumulated 'filter' for 'external' DEBUG_MASK
#define JMI_ALERT 1    // 00000001   1 = 2^1-1
#define JMI_CRITICAL 2 // 00000010   2 = 2^2-2
#define JMI_ERROR 4    // 00000100   4
#define JMI_WARNING 8  // 00001000   8
#define JMI_NOTICE 16  // 00010000   16
#define JMI_DEBUG 32   // 00100000   32
#define JMI_DATA 64    // 01000000   64

#include <boost/thread/shared_mutex.hpp>
#include <fstream>
#include <iostream>
#include <map>
#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>
#include <queue>
#include <sstream>
#include <string>

namespace jmi {
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
  This logger writes each log message out to stderr (std::cerr)
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
    //! Desctructor
    virtual ~StderrLogger() {}
    //! The log callback that writes to stderr
    virtual void log(unsigned l, const std::string& s) override {
        if (!alertOnly_ || l <= JMI_CRITICAL)
            std::cerr << s << std::endl;
    }

private:
    bool alertOnly_;
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
  This logger stores each log message in an internal buffer, it can then be queried for log messages at a later point.
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
    BufferLogger(unsigned minLevel = JMI_DATA) : Logger(name), minLevel_(minLevel) {}
    //! Destructor
    virtual ~BufferLogger() {}
    //! The log callback
    virtual void log(unsigned, const std::string&) override;

    //! Checks if Logger has new messages
    /*!
      \return True if this BufferLogger has any new log messages
     */
    bool hasNext();
    //! Retrieve new messages
    /*!
      Retrieve the next new message from the buffer, this will throw if the buffer is empty.
      Messages are returned in a FIFO order. Messages are deleted from the buffer once returned.
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

  To configure the Log class to log to a file "/tmp/jmi.log":
  <pre>
      Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>("/tmp/jmi.log"));
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
    /*! Adds a new logger to the Log class, the logger will be stored by it's Logger::name() method.
        \param logger the logger to add
     */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    /*! Retrieve a Logger from it's name. This will throw if the name is not found.
        \param name the name of the Logger
     */
    QuantLib::ext::shared_ptr<Logger> logger(const std::string& name);
    //! Remove a Logger
    /*! Remove a logger by name
        \param name the name of the Logger
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

    //! Returns true if the log mask filters the given level
    bool filter(unsigned mask) const { return (mask & mask_) != 0; }
    unsigned mask() const { return mask_; }
    void setMask(unsigned mask) { mask_ = mask; }

    bool enabled() const { return enabled_; }
    void switchOn() { enabled_ = true; }
    void switchOff() { enabled_ = false; }

private:
    Log();

    std::map<std::string, QuantLib::ext::shared_ptr<Logger>> loggers_;
    bool enabled_;
    unsigned mask_;
    std::ostringstream ls_;
    mutable boost::shared_mutex mutex_;
};

/*!
  Main Logging macro, do not use this directly, use on of the below 7 macros instead
 */
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (jmi::data::Log::instance().enabled() && jmi::data::Log::instance().filter(mask)) {                         \
            boost::unique_lock<boost::shared_mutex> lock(jmi::data::Log::instance().mutex());                          \
            jmi::data::Log::instance().header(mask, __FILE__, __LINE__);                                               \
            jmi::data::Log::instance().logStream() << text;                                                            \
            jmi::data::Log::instance().log(mask);                                                                      \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(JMI_ALERT, text);
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(JMI_CRITICAL, text);
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(JMI_ERROR, text);
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(JMI_WARNING, text);
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(JMI_NOTICE, text);
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(JMI_DEBUG, text);
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(JMI_DATA, text);

//! Utility class for having structured messages in the log
/*!
  A structured message is rendered as a single JSON object and written to the log at alert level for errors and at
  warning level for warnings, so that downstream consumers can pick them out of a plain text log.
  \ingroup utilities
 */
class StructuredMessage {
public:
    enum class Category { Error, Warning, Unknown };
    enum class Group { Analytics, Model, MarketData, Configuration, Curve, Unknown };

    StructuredMessage(const Category& category, const Group& group, const std::string& message,
                      const std::map<std::string, std::string>& subFields = {});

    virtual ~StructuredMessage() {}

    static constexpr const char* name = "StructuredMessage";

    const Category& category() const { return category_; }
    const Group& group() const { return group_; }
    const std::string& message() const { return message_; }
    const std::map<std::string, std::string>& subFields() const { return subFields_; }

    //! Returns the message in JSON format
    std::string json() const;

    //! Write the message to the log
    void log() const;

protected:
    Category category_;
    Group group_;
    std::string message_;
    std::map<std::string, std::string> subFields_;
};

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category& category);
std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group& group);

//! Remove or escape characters that would break a JSON string
std::string jsonify(const std::string& s);

} // namespace data
} // namespace jmi
