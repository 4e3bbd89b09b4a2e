#pragma once

#include <stdexcept>
#include <string>

// Base for every error the clicker raises on its own
class ClickerError : public std::runtime_error
{
public:
    explicit ClickerError(const std::string &message) : std::runtime_error(message) {}
};

// Screen grab failed: no display, region off screen, or the server refused the image
class CaptureError : public ClickerError
{
public:
    explicit CaptureError(const std::string &message) : ClickerError(message) {}
};

// Zero/negative region size, or a frame that does not match its region
class InvalidRegionError : public ClickerError
{
public:
    explicit InvalidRegionError(const std::string &message) : ClickerError(message) {}
};
