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

#ifndef FRAME_STORE_H
#define FRAME_STORE_H

#include <cstdint>
#include <cstdio>
#include <vector>

#include "defines.h"
#include "fixed.h"

enum VertexFlags
{
    CLIP_LEFT   = BIT(0),
    CLIP_RIGHT  = BIT(1),
    CLIP_TOP    = BIT(2),
    CLIP_BOTTOM = BIT(3),
    CLIP_NEAR   = BIT(4),
    CLIP_FAR    = BIT(5),
    TRANSFORMED = BIT(6), // Screen coordinates are valid

    CLIP_ANY = CLIP_LEFT | CLIP_RIGHT | CLIP_TOP | CLIP_BOTTOM | CLIP_NEAR | CLIP_FAR
};

// Polygon attribute bit marking a quad at submission time
// Matches the spare top bit of the geometry engine's polygon attribute word
const uint32_t POLYGON_QUAD = 0x80000000;

struct RenderVertex
{
    // Clip-space coordinates, after model-view-projection
    Fixed12 cx, cy, cz, cw;

    uint32_t flags = 0;

    // Screen coordinates, only valid once transformed
    int32_t sx = 0, sy = 0, sz = 0;
};

struct RenderPolygon
{
    int vertices[4] = {};
    uint32_t attr = 0;

    // Y coordinate of the middle vertex, where the edges switch slopes
    int32_t hy = 0;

    // Edge slopes for the top and bottom halves
    Fixed12 dl0, dl1;
    Fixed12 dr0, dr1;

    // Span bounds at the top vertex, and while drawing
    Fixed12 startX0, startX1;
    Fixed12 cx0, cx1;
};

// Two vertex/polygon RAM slots that alternate every frame
// The slot matching the frame counter's parity accumulates the next frame, while the other is drawn
class FrameStore
{
    public:
        FrameStore();

        void saveState(FILE *file);
        bool loadState(FILE *file);

        void swap();
        void reset();

        uint32_t getFrameCount() const { return frameCount; }
        int getNextSlot() const { return frameCount & 1; }
        int getCurSlot() const { return ~frameCount & 1; }

        std::vector<RenderVertex> &getNextVertices() { return vertexRams[getNextSlot()]; }
        std::vector<RenderPolygon> &getNextPolygons() { return polygonRams[getNextSlot()]; }
        std::vector<RenderVertex> &getCurVertices() { return vertexRams[getCurSlot()]; }
        std::vector<RenderPolygon> &getCurPolygons() { return polygonRams[getCurSlot()]; }

    private:
        std::vector<RenderVertex> vertexRams[2];
        std::vector<RenderPolygon> polygonRams[2];
        uint32_t frameCount = 0;
};

#endif // FRAME_STORE_H
