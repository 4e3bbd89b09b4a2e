#pragma once

#include <string>
#include <map>
#include <fstream>
#include <optional>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include "utils.hpp"
#include "detector/detector_interface.hpp"

using namespace std;

namespace coordinates
{
    inline const string DEFAULT_FILENAME = "window_coordinates.txt";

    // Trim whitespace and one pair of matching quotes
    inline string cleanValue(const string &raw)
    {
        size_t start = raw.find_first_not_of(" \t\r\n");
        if (start == string::npos)
            return "";
        size_t end = raw.find_last_not_of(" \t\r\n");
        string value = raw.substr(start, end - start + 1);

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
        {
            value = value.substr(1, value.size() - 2);
        }
        return value;
    }

    // KEY=VALUE lines, '#' comments and blank lines skipped, later keys win
    inline map<string, string> parseFile(istream &input)
    {
        map<string, string> values;
        string line;

        while (getline(input, line))
        {
            string trimmed = cleanValue(line);
            if (trimmed.empty() || trimmed[0] == '#')
                continue;

            size_t eq = trimmed.find('=');
            if (eq == string::npos)
                continue;

            values[cleanValue(trimmed.substr(0, eq))] = cleanValue(trimmed.substr(eq + 1));
        }

        return values;
    }

    // Non-empty and only decimal digits, so no signs and no blanks
    inline bool isNumber(const string &value)
    {
        return !value.empty() && all_of(value.begin(), value.end(), [](unsigned char c)
                                        { return isdigit(c) != 0; });
    }

    // start_x/end_x/start_y/end_y from parsed values, no region if anything is off
    inline optional<Region> toRegion(const map<string, string> &values)
    {
        const char *keys[] = {"start_x", "end_x", "start_y", "end_y"};
        int numbers[4] = {0, 0, 0, 0};

        for (int i = 0; i < 4; i++)
        {
            auto it = values.find(keys[i]);
            if (it == values.end())
            {
                log_warning(string("Missing coordinate '") + keys[i] + "' in coordinates file!");
                return nullopt;
            }
            if (!isNumber(it->second))
            {
                log_warning("Make sure all coordinates are numbers!");
                return nullopt;
            }

            try
            {
                numbers[i] = stoi(it->second);
            }
            catch (const out_of_range &)
            {
                log_warning(string("Coordinate '") + keys[i] + "' is too large: " + it->second);
                return nullopt;
            }
        }

        Region region;
        region.x = numbers[0];
        region.y = numbers[2];
        region.width = numbers[1] - numbers[0];
        region.height = numbers[3] - numbers[2];

        if (!region.isValid())
        {
            log_warning("End coordinates must be greater than start coordinates, got " + region.toString());
            return nullopt;
        }

        return region;
    }

    // Load the watched region from a coordinates file
    inline optional<Region> load(const string &filename = DEFAULT_FILENAME)
    {
        if (!filesystem::exists(filename))
        {
            log_warning("Make sure " + filesystem::path(filename).filename().string() + " file exists in the directory!");
            return nullopt;
        }

        ifstream file(filename);
        if (!file)
        {
            log_error("Failed to open coordinates file: " + filename);
            return nullopt;
        }

        optional<Region> region = toRegion(parseFile(file));
        if (region)
        {
            log_debug("Loaded region " + region->toString() + " from " + filename);
        }
        return region;
    }
}
