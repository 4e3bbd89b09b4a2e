#pragma once
#include <string>
#include <stdexcept>

// Check if a flag exists in command line args
inline bool hasFlag(int argc, char **argv, const std::string &flag)
{
    for (int i = 1; i < argc; i++)
    {
        if (std::string(argv[i]) == flag)
        {
            return true;
        }
    }
    return false;
}

// Get a string argument from command line, the value follows the flag
inline std::string getArg(int argc, char **argv, const std::string &flag, const std::string &defaultValue)
{
    for (int i = 1; i + 1 < argc; i++)
    {
        if (std::string(argv[i]) == flag)
        {
            return argv[i + 1];
        }
    }
    return defaultValue;
}

// Get an integer argument, throws std::invalid_argument naming the flag on junk
inline int getArg(int argc, char **argv, const std::string &flag, int defaultValue)
{
    std::string value = getArg(argc, argv, flag, "");
    if (value.empty())
    {
        return defaultValue;
    }

    size_t used = 0;
    int number = 0;
    try
    {
        number = std::stoi(value, &used);
    }
    catch (const std::exception &)
    {
        used = 0;
    }
    if (used == 0 || used != value.size())
    {
        throw std::invalid_argument(flag + " expects a whole number, got '" + value + "'");
    }
    return number;
}

// Get a single key character, throws std::invalid_argument for anything longer
inline char getArg(int argc, char **argv, const std::string &flag, char defaultValue)
{
    std::string value = getArg(argc, argv, flag, "");
    if (value.empty())
    {
        return defaultValue;
    }
    if (value.size() != 1)
    {
        throw std::invalid_argument(flag + " expects a single key, got '" + value + "'");
    }
    return value[0];
}
