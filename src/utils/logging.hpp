#pragma once

#include <iostream>
#include <fstream>
#include <string>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <algorithm>
#include <filesystem>
#include <cctype>
#include <ctime>

using namespace std;

namespace logging
{
    enum class LogLevel
    {
        ERROR = 0,   // Most important - always show
        WARNING = 1, // Important - usually show
        INFO = 2,    // Normal - state changes and controls
        DEBUG = 3    // Least important - per-cycle traces
    };

    // Global settings
    inline LogLevel globalLogLevel = LogLevel::INFO;         // Default: show everything except per-cycle traces
    inline bool showTimestamp = false;                       // Console timestamps off by default
    inline bool enableFileLogging = false;                   // File logging off by default
    inline string logFilePath = "logs/autoclicker.log";      // Default log file

    // Set the global log level
    inline void setLogLevel(LogLevel level)
    {
        globalLogLevel = level;
    }

    // Enable/disable console timestamps
    inline void setShowTimestamp(bool show)
    {
        showTimestamp = show;
    }

    // Enable/disable file logging
    inline void setFileLogging(bool enable, const string &filepath = "logs/autoclicker.log")
    {
        enableFileLogging = enable;
        logFilePath = filepath;

        if (enable)
        {
            std::error_code ec;
            filesystem::path parent = filesystem::path(logFilePath).parent_path();
            if (!parent.empty())
                filesystem::create_directories(parent, ec);

            ofstream logFile(logFilePath, ios::app);
            if (logFile.is_open())
            {
                logFile << "\n========== AutoClicker Session Started ==========\n";
                logFile.close();
            }
            else
            {
                cerr << "Cannot open log file " << logFilePath << ", file logging disabled" << endl;
                enableFileLogging = false;
            }
        }
    }

    // Get current timestamp as string
    inline string getCurrentTimestamp()
    {
        auto now = chrono::system_clock::now();
        auto time_t = chrono::system_clock::to_time_t(now);
        auto ms = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()) % 1000;

        stringstream ss;
        ss << put_time(localtime(&time_t), "%H:%M:%S");
        ss << '.' << setfill('0') << setw(3) << ms.count();
        return ss.str();
    }

    // Convert log level to string
    inline string logLevelToString(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG:
            return "DEBUG";
        default:
            return "UNKNOWN";
        }
    }

// Highlight a number in cyan, works for anything std::to_string accepts
#define log_string(value) ("\033[36m" + std::to_string(value) + "\033[0m")

    // "ret ns::Class::fn(args)" -> "NS", anything else -> "SYSTEM"
    inline string extractModuleName(const string &function)
    {
        if (function.find("logging::") != string::npos ||
            function.find("extractModuleName") != string::npos)
        {
            return "SYSTEM";
        }

        // Drop the argument list and the return type, which may itself be qualified
        string signature = function.substr(0, function.find('('));
        size_t spacePos = signature.rfind(' ');
        string qualifiedName = (spacePos == string::npos) ? signature : signature.substr(spacePos + 1);

        size_t colonPos = qualifiedName.find("::");
        if (colonPos != string::npos)
        {
            string moduleName = qualifiedName.substr(0, colonPos);
            transform(moduleName.begin(), moduleName.end(), moduleName.begin(), ::toupper);

            return moduleName;
        }

        return "SYSTEM";
    }

    // Remove ANSI escape sequences (for file logging)
    inline string stripColorCodes(const string &text)
    {
        string result = text;
        size_t pos = 0;

        while ((pos = result.find("\033[", pos)) != string::npos)
        {
            size_t endPos = result.find('m', pos);
            if (endPos != string::npos)
            {
                result.erase(pos, endPos - pos + 1);
            }
            else
            {
                break; // Malformed escape sequence
            }
        }

        return result;
    }

    // Main logging function
    inline void log(const string &message, LogLevel level = LogLevel::INFO, const string &moduleName = "SYSTEM")
    {
        // Lower number = higher priority
        if (level > globalLogLevel)
            return;

        string timestamp = getCurrentTimestamp();
        string levelStr = logLevelToString(level);

        string timestampColor = "\033[32m"; // Green for timestamp
        string bracketColor = "\033[37m";   // White for brackets
        string moduleColor = "\033[90m";    // Gray for module name
        string levelColor = "";
        string resetCode = "\033[0m";

        switch (level)
        {
        case LogLevel::ERROR:
            levelColor = "\033[91m"; // Bright red
            break;
        case LogLevel::WARNING:
            levelColor = "\033[93m"; // Yellow
            break;
        case LogLevel::INFO:
            levelColor = "\033[97m"; // White
            break;
        case LogLevel::DEBUG:
            levelColor = "\033[94m"; // Blue
            break;
        }

        string consoleMessage = "";

        if (showTimestamp)
        {
            consoleMessage += bracketColor + "[" + timestampColor + timestamp + bracketColor + "]" + resetCode;
        }

        consoleMessage += bracketColor + "[" + levelColor + levelStr + bracketColor + "]";
        consoleMessage += bracketColor + "[" + moduleColor + moduleName + bracketColor + "]" + resetCode;
        consoleMessage += " - " + message;

        cout << consoleMessage << endl;

        // File logging (always with timestamp, NO colors)
        if (enableFileLogging)
        {
            ofstream logFile(logFilePath, ios::app);
            if (logFile.is_open())
            {
                string cleanMessage = stripColorCodes(message);
                logFile << "[" << timestamp << "][" << levelStr << "][" << moduleName << "] - " << cleanMessage << endl;
                logFile.close();
            }
        }
    }

// Macros that pick the module name from the calling function
#define LOG_ERROR(message) logging::log(message, logging::LogLevel::ERROR, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_WARNING(message) logging::log(message, logging::LogLevel::WARNING, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_INFO(message) logging::log(message, logging::LogLevel::INFO, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_DEBUG(message) logging::log(message, logging::LogLevel::DEBUG, logging::extractModuleName(__PRETTY_FUNCTION__))

#define log_error(message) LOG_ERROR(message)
#define log_warning(message) LOG_WARNING(message)
#define log_info(message) LOG_INFO(message)
#define log_debug(message) LOG_DEBUG(message)

}
