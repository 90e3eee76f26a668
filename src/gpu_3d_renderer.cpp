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

#include <algorithm>

#include "gpu_3d_renderer.h"
#include "gpu_3d.h"
#include "settings.h"

RenderConfig RenderConfig::fromSettings()
{
    RenderConfig config;
    config.enabled = !Settings::disable3D;
    config.color = Settings::fillColor & 0x3FFFF;
    return config;
}

Line ScanlineCursor::nextLine()
{
    // Return a null line once every line has been handed out
    Line line;
    if (next >= height)
        return line;

    line.data = &buffer[next * width];
    line.width = width;
    next++;
    return line;
}

void Gpu3DRenderer::beginFrame()
{
    // Hold the current frame for the whole pass, so a swap can't replace it mid-draw
    gpu3D->beginFrame();

    std::vector<RenderVertex> &vertices = gpu3D->getVertices();
    std::vector<RenderPolygon> &polygons = gpu3D->getPolygons();

    for (int i = 0; i < SCREEN_HEIGHT; i++)
        polygonsPerLine[i].clear();

    // Build a lookup of which polygons are visible on each line
    for (size_t i = 0; i < polygons.size(); i++)
    {
        RenderPolygon &polygon = polygons[i];
        int top = vertices[polygon.vertices[0]].sy;
        int bottom = vertices[polygon.vertices[2]].sy;
        if (top < 0) top = 0;
        if (bottom > SCREEN_HEIGHT - 1) bottom = SCREEN_HEIGHT - 1;

        for (int y = top; y <= bottom; y++)
            polygonsPerLine[y].push_back(i);

        // Restart the spans at the top vertex, in case this frame was drawn before
        polygon.cx0 = polygon.startX0;
        polygon.cx1 = polygon.startX1;
    }
}

void Gpu3DRenderer::drawFrame(ScanlineCursor *cursor, int y, const RenderConfig &config)
{
    std::vector<RenderPolygon> &polygons = gpu3D->getPolygons();
    uint32_t value = PIXEL_3D | config.color;

    // Draw each line the cursor hands out, starting at the given line
    for (Line line = cursor->nextLine(); !line.isNull(); line = cursor->nextLine(), y++)
    {
        if (y < 0 || y >= SCREEN_HEIGHT)
            continue;

        for (size_t i = 0; i < polygonsPerLine[y].size(); i++)
        {
            RenderPolygon *polygon = &polygons[polygonsPerLine[y][i]];
            if (config.enabled)
                drawSpan(&line, polygon, value);

            // Step the bounds to the next line, switching slopes past the middle vertex
            if (y < polygon->hy)
            {
                polygon->cx0 += polygon->dl0;
                polygon->cx1 += polygon->dr0;
            }
            else
            {
                polygon->cx0 += polygon->dl1;
                polygon->cx1 += polygon->dr1;
            }
        }
    }
}

void Gpu3DRenderer::endFrame()
{
    // Let the geometry thread swap in a new frame
    gpu3D->endFrame();
}

void Gpu3DRenderer::renderFrame(ScanlineCursor *cursor, const RenderConfig &config)
{
    // Release the frame on every way out of the pass
    struct FrameGuard
    {
        Gpu3DRenderer *renderer;
        FrameGuard(Gpu3DRenderer *renderer): renderer(renderer) { renderer->beginFrame(); }
        ~FrameGuard() { renderer->endFrame(); }
    } guard(this);

    drawFrame(cursor, 0, config);
}

void Gpu3DRenderer::drawSpan(Line *line, RenderPolygon *polygon, uint32_t value)
{
    // Fill the span between the bounds, skipping pixels off the edge of the screen
    int x0 = polygon->cx0.toInt();
    int x1 = polygon->cx1.toInt();
    if (x0 < 0) x0 = 0;
    x1 = std::min(x1, std::min(line->width, SCREEN_WIDTH) - 1);

    for (int x = x0; x <= x1; x++)
        line->set(x, value);
}
