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

#ifndef GPU_3D_RENDERER_H
#define GPU_3D_RENDERER_H

#include <cstdint>
#include <vector>

#include "defines.h"

class Gpu3D;
struct RenderPolygon;

// Attribute bit marking a pixel as drawn by the 3D engine
#define PIXEL_3D BIT(26)

// Debug toggles for a single frame, decided by the caller before drawing starts
struct RenderConfig
{
    bool enabled = true;
    uint32_t color = 0x3FFFF; // RGB6

    static RenderConfig fromSettings();
};

struct Line
{
    uint32_t *data = nullptr;
    int width = 0;

    bool isNull() const { return data == nullptr; }
    void set(int x, uint32_t value) { data[x] = value; }
};

// Hands out the lines of a compositor framebuffer from top to bottom, exactly once each
class ScanlineCursor
{
    public:
        ScanlineCursor(uint32_t *buffer, int width = SCREEN_WIDTH, int height = SCREEN_HEIGHT):
            buffer(buffer), width(width), height(height) {}

        Line nextLine();
        int getLinesLeft() const { return height - next; }

    private:
        uint32_t *buffer;
        int width, height;
        int next = 0;
};

class Gpu3DRenderer
{
    public:
        Gpu3DRenderer(Gpu3D *gpu3D): gpu3D(gpu3D) {}

        void beginFrame();
        void drawFrame(ScanlineCursor *cursor, int y, const RenderConfig &config);
        void endFrame();

        void renderFrame(ScanlineCursor *cursor, const RenderConfig &config);

        const std::vector<uint16_t> &getLinePolygons(int line) { return polygonsPerLine[line]; }

    private:
        Gpu3D *gpu3D;
        std::vector<uint16_t> polygonsPerLine[SCREEN_HEIGHT];

        static void drawSpan(Line *line, RenderPolygon *polygon, uint32_t value);
};

#endif // GPU_3D_RENDERER_H
