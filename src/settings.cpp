/*
    Copyright 2019-2025 Hydr8gon

    This file is part of GeoDS.

    GeoDS is free software: you can redistribute it and/or modify it
    under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    GeoDS is distributed in the hope that it will be useful, but
    WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
    General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with GeoDS. If not, see <https://www.gnu.org/licenses/>.
*/

#include <sys/stat.h>
#include "settings.h"
#include "defines.h"

int Settings::threaded3D = 1;
int Settings::commandQueueSize = 1024;
int Settings::dumpScene = 0;
int Settings::disable3D = 0;
int Settings::fillColor = 0x3FFFF;

std::string Settings::basePath = ".";

std::vector<Setting> Settings::settings =
{
    Setting("threaded3D", &threaded3D, false),
    Setting("commandQueueSize", &commandQueueSize, false),
    Setting("dumpScene", &dumpScene, false),
    Setting("disable3D", &disable3D, false),
    Setting("fillColor", &fillColor, false)
};

void Settings::add(std::vector<Setting> &settings)
{
    // Add additional settings to be loaded from the settings file
    Settings::settings.insert(Settings::settings.end(), settings.begin(), settings.end());
}

bool Settings::load(std::string path)
{
    // Set the base path and ensure it exists
    mkdir((basePath = path).c_str() MKDIR_ARGS);

    // Open the settings file or create one with defaults if it doesn't exist
    FILE *file = fopen((basePath + "/geods.ini").c_str(), "r");
    if (!file)
    {
        Settings::save();
        return false;
    }

    // Read each line of the settings file and load values from them
    char data[512];
    while (fgets(data, 512, file) != nullptr)
    {
        std::string line = data;
        size_t split = line.find('=');
        if (split == std::string::npos) continue;
        std::string name = line.substr(0, split);
        for (size_t i = 0; i < settings.size(); i++)
        {
            if (name != settings[i].name) continue;
            std::string value = line.substr(split + 1);
            while (!value.empty() && (value.back() == '\n' || value.back() == '\r'))
                value.pop_back();
            if (settings[i].isString)
                *(std::string*)settings[i].value = value;
            else if (!value.empty() && value[0] >= '0' && value[0] <= '9')
                *(int*)settings[i].value = stoi(value, nullptr, 0);
            break;
        }
    }

    // Close the file after reading it
    fclose(file);
    return true;
}

bool Settings::save()
{
    // Attempt to open the settings file
    FILE *file = fopen((basePath + "/geods.ini").c_str(), "w");
    if (!file) return false;

    // Write each setting to the settings file
    for (size_t i = 0; i < settings.size(); i++)
    {
        std::string value = settings[i].isString ?
            *(std::string*)settings[i].value : std::to_string(*(int*)settings[i].value);
        fprintf(file, "%s=%s\n", settings[i].name.c_str(), value.c_str());
    }

    // Close the file after writing it
    fclose(file);
    return true;
}
