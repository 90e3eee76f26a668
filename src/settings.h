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

#ifndef SETTINGS_H
#define SETTINGS_H

#include <string>
#include <vector>

struct Setting
{
    std::string name;
    void *value;
    bool isString;

    Setting(std::string name, void *value, bool isString):
        name(name), value(value), isString(isString) {}
};

class Settings
{
    public:
        static int threaded3D;
        static int commandQueueSize;
        static int dumpScene;
        static int disable3D;
        static int fillColor;

        static std::string basePath;

        static void add(std::vector<Setting> &settings);
        static bool load(std::string path = ".");
        static bool save();

    private:
        static std::vector<Setting> settings;
        Settings() {} // Private to prevent instantiation
};

#endif // SETTINGS_H
