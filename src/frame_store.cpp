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

#include "frame_store.h"

FrameStore::FrameStore()
{
    // Allocate both slots up front so they never reallocate while in use
    for (int i = 0; i < 2; i++)
    {
        vertexRams[i].reserve(VERTEX_RAM_SIZE);
        polygonRams[i].reserve(POLYGON_RAM_SIZE);
    }
}

void FrameStore::swap()
{
    // Promote the next slot to current, and reuse the old current slot for the next frame
    frameCount++;
    vertexRams[getNextSlot()].clear();
    polygonRams[getNextSlot()].clear();
}

void FrameStore::reset()
{
    // Empty both slots and restart the frame counter
    for (int i = 0; i < 2; i++)
    {
        vertexRams[i].clear();
        polygonRams[i].clear();
    }
    frameCount = 0;
}

void FrameStore::saveState(FILE *file)
{
    // Write the frame counter and both slots to the file
    fwrite(&frameCount, sizeof(frameCount), 1, file);
    for (int i = 0; i < 2; i++)
    {
        uint32_t vertexCount = vertexRams[i].size();
        uint32_t polygonCount = polygonRams[i].size();
        fwrite(&vertexCount, sizeof(vertexCount), 1, file);
        fwrite(vertexRams[i].data(), sizeof(RenderVertex), vertexCount, file);
        fwrite(&polygonCount, sizeof(polygonCount), 1, file);
        fwrite(polygonRams[i].data(), sizeof(RenderPolygon), polygonCount, file);
    }
}

bool FrameStore::loadState(FILE *file)
{
    // Read the frame counter and both slots from the file
    if (fread(&frameCount, sizeof(frameCount), 1, file) != 1)
        return false;

    for (int i = 0; i < 2; i++)
    {
        uint32_t vertexCount, polygonCount;

        // Restore the vertex RAM, rejecting counts the hardware can't hold
        if (fread(&vertexCount, sizeof(vertexCount), 1, file) != 1 || vertexCount > VERTEX_RAM_SIZE)
            return false;
        vertexRams[i].resize(vertexCount);
        if (fread(vertexRams[i].data(), sizeof(RenderVertex), vertexCount, file) != vertexCount)
            return false;

        // Restore the polygon RAM, making sure every index still resolves
        if (fread(&polygonCount, sizeof(polygonCount), 1, file) != 1 || polygonCount > POLYGON_RAM_SIZE)
            return false;
        polygonRams[i].resize(polygonCount);
        if (fread(polygonRams[i].data(), sizeof(RenderPolygon), polygonCount, file) != polygonCount)
            return false;

        for (size_t j = 0; j < polygonRams[i].size(); j++)
        {
            for (int k = 0; k < 3; k++)
            {
                int index = polygonRams[i][j].vertices[k];
                if (index < 0 || index >= (int)vertexCount)
                    return false;
            }
        }
    }

    return true;
}
