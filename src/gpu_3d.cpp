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

#include <string>

#include "gpu_3d.h"
#include "settings.h"

Command Command::setViewport(int x0, int y0, int x1, int y1)
{
    Command command;
    command.type = CMD_SET_VIEWPORT;
    command.params[0] = x0;
    command.params[1] = y0;
    command.params[2] = x1;
    command.params[3] = y1;
    return command;
}

Command Command::vertex(Fixed12 x, Fixed12 y, Fixed12 z, Fixed12 w)
{
    Command command;
    command.type = CMD_VERTEX;
    command.params[0] = x.value;
    command.params[1] = y.value;
    command.params[2] = z.value;
    command.params[3] = w.value;
    return command;
}

Command Command::polygon(int v0, int v1, int v2, int v3, uint32_t attr)
{
    Command command;
    command.type = CMD_POLYGON;
    command.params[0] = v0;
    command.params[1] = v1;
    command.params[2] = v2;
    command.params[3] = v3;
    command.attr = attr;
    return command;
}

Command Command::swapBuffers()
{
    Command command;
    command.type = CMD_SWAP_BUFFERS;
    return command;
}

Gpu3D::Gpu3D(): queue(Settings::commandQueueSize)
{
    // Mark the engine as healthy to start
    halted.store(false);
    error.store(ERROR_NONE);

    // Start consuming commands right away, like the hardware would
    start();
}

Gpu3D::~Gpu3D()
{
    // Clean up the thread
    stop();
}

void Gpu3D::saveState(FILE *file)
{
    // Make sure nothing is still in flight, then write state data to the file
    flush();
    std::lock_guard<std::mutex> guard(frameMutex);
    fwrite(&viewport, sizeof(viewport), 1, file);
    frames.saveState(file);
}

bool Gpu3D::loadState(FILE *file)
{
    // Make sure nothing is still in flight, then read state data from the file
    flush();
    std::lock_guard<std::mutex> guard(frameMutex);
    Viewport loaded;
    if (fread(&loaded, sizeof(loaded), 1, file) != 1 || !frames.loadState(file))
    {
        LOG_CRIT("Failed to load 3D engine state\n");
        frames.reset();
        return false;
    }

    viewport = loaded;
    return true;
}

void Gpu3D::start()
{
    // Process commands on the submitting thread unless threading is enabled
    if (thread || !Settings::threaded3D || halted.load())
        return;

    // Start the geometry thread
    queue.start();
    thread = new std::thread(&Gpu3D::runCommands, this);
}

void Gpu3D::stop()
{
    if (!thread)
        return;

    // Let the thread drain the queue and exit, then clean it up
    queue.stop();
    thread->join();
    delete thread;
    thread = nullptr;
}

bool Gpu3D::submit(const Command &command)
{
    // Refuse new commands once the engine has halted
    if (halted.load())
        return false;

    if (!thread)
    {
        // Apply the command immediately, halting before passing on any fatal error
        try
        {
            processCommand(command);
        }
        catch (GeometryError e)
        {
            halt(e);
            throw;
        }
        return true;
    }

    // Count the command before queueing it so a flush will wait for it
    {
        std::lock_guard<std::mutex> guard(flushMutex);
        submitted++;
    }

    // Queue the command, blocking while the queue is full
    if (!queue.push(command))
    {
        {
            std::lock_guard<std::mutex> guard(flushMutex);
            submitted--;
        }
        flushed.notify_all();
        return false;
    }

    return true;
}

void Gpu3D::flush()
{
    if (!thread)
        return;

    // Wait until the thread has applied everything submitted so far
    std::unique_lock<std::mutex> lock(flushMutex);
    flushed.wait(lock, [this] { return processed >= submitted || halted.load(); });
}

void Gpu3D::runCommands()
{
    LOG_INFO("Starting the geometry thread\n");

    // Apply commands in order until the queue is stopped and empty
    Command command;
    while (queue.pop(command))
    {
        try
        {
            processCommand(command);
        }
        catch (GeometryError e)
        {
            halt(e);
            return;
        }
        commandDone();
    }

    LOG_INFO("Stopping the geometry thread\n");
}

void Gpu3D::halt(GeometryError value)
{
    LOG_CRIT("Halting the 3D engine with error %d\n", value);

    // Record the error and wake anything waiting on the engine
    error.store(value);
    {
        std::lock_guard<std::mutex> guard(flushMutex);
        halted.store(true);
    }
    flushed.notify_all();

    // Release blocked producers; commands after the failure are never applied
    queue.stop();
    queue.clear();
}

void Gpu3D::commandDone()
{
    {
        std::lock_guard<std::mutex> guard(flushMutex);
        processed++;
    }
    flushed.notify_all();
}

void Gpu3D::processCommand(const Command &command)
{
    // Execute a command against the next frame
    switch (command.type)
    {
        case CMD_SET_VIEWPORT: viewportCmd(command); break;
        case CMD_VERTEX:       vertexCmd(command);   break;
        case CMD_POLYGON:      polygonCmd(command);  break;
        case CMD_SWAP_BUFFERS: swapBuffersCmd();     break;
    }
}

void Gpu3D::viewportCmd(const Command &command)
{
    // Set the viewport used for vertices transformed from now on
    viewport.x0 = command.params[0];
    viewport.y0 = command.params[1];
    viewport.x1 = command.params[2];
    viewport.y1 = command.params[3];
}

void Gpu3D::vertexCmd(const Command &command)
{
    std::vector<RenderVertex> &vertices = frames.getNextVertices();
    if (vertices.size() >= VERTEX_RAM_SIZE)
    {
        LOG_CRIT("Vertex RAM overflow: vertex %d submitted in frame %u\n",
            (int)vertices.size() + 1, frames.getFrameCount());
        throw ERROR_VERTEX_OVERFLOW;
    }

    RenderVertex vertex;
    vertex.cx = Fixed12::fromRaw(command.params[0]);
    vertex.cy = Fixed12::fromRaw(command.params[1]);
    vertex.cz = Fixed12::fromRaw(command.params[2]);
    vertex.cw = Fixed12::fromRaw(command.params[3]);

    // Compute the clipping flags once per vertex
    // Depth isn't tested, so the near and far planes are only flagged by a zero W
    if (vertex.cx < -vertex.cw) vertex.flags |= CLIP_LEFT;
    if (vertex.cx >  vertex.cw) vertex.flags |= CLIP_RIGHT;
    if (vertex.cy < -vertex.cw) vertex.flags |= CLIP_TOP;
    if (vertex.cy >  vertex.cw) vertex.flags |= CLIP_BOTTOM;

    // A vertex with zero W can't be divided, so treat it as fully off-screen
    if (vertex.cw.value == 0)
        vertex.flags |= CLIP_ANY;

    vertices.push_back(vertex);
}

void Gpu3D::polygonCmd(const Command &command)
{
    std::vector<RenderVertex> &vertices = frames.getNextVertices();
    std::vector<RenderPolygon> &polygons = frames.getNextPolygons();

    RenderPolygon polygon;
    for (int i = 0; i < 4; i++)
        polygon.vertices[i] = command.params[i];
    polygon.attr = command.attr;
    int count = (polygon.attr & POLYGON_QUAD) ? 4 : 3;

    // Resolve the vertex indices, and check if any vertex is outside the view volume
    bool clipped = false;
    for (int i = 0; i < count; i++)
    {
        int index = polygon.vertices[i];
        if (index < 0 || index >= (int)vertices.size())
        {
            LOG_CRIT("Polygon vertex %d has an invalid index: %d (vertex count: %d)\n",
                i, index, (int)vertices.size());
            throw ERROR_POLYGON_INDEX;
        }

        if (vertices[index].flags & CLIP_ANY)
            clipped = true;
    }

    // Drop polygons that touch a clip plane, since clipping isn't implemented
    if (clipped)
        return;

    if (polygons.size() + count - 2 > POLYGON_RAM_SIZE)
    {
        LOG_CRIT("Polygon RAM overflow: %d triangles submitted in frame %u\n",
            (int)polygons.size() + count - 2, frames.getFrameCount());
        throw ERROR_POLYGON_OVERFLOW;
    }

    // Transform the vertices to screen space, if another polygon hasn't already
    for (int i = 0; i < count; i++)
        transformVertex(&vertices[polygon.vertices[i]]);

    polygon.attr &= ~POLYGON_QUAD;
    polygons.push_back(polygon);

    if (count == 4)
    {
        // Split quads into two triangles so the renderer only has to handle triangles
        // The second triangle reuses the first's top and bottom vertices, replacing its middle one
        RenderPolygon second = polygon;
        second.vertices[1] = polygon.vertices[3];
        polygons.push_back(second);
    }
}

void Gpu3D::swapBuffersCmd()
{
    // Prepare the polygons for drawing before waiting on the display side
    setupPolygons();
    if (Settings::dumpScene)
        dumpScene();

    int vertexCount = frames.getNextVertices().size();
    int polygonCount = frames.getNextPolygons().size();

    // Promote the next frame once the current one is no longer being drawn
    {
        std::lock_guard<std::mutex> guard(frameMutex);
        frames.swap();
    }

    LOG_INFO("Swapped 3D buffers to frame %u with %d vertices and %d polygons\n",
        frames.getFrameCount(), vertexCount, polygonCount);
}

void Gpu3D::transformVertex(RenderVertex *vertex)
{
    // Vertices shared between polygons are only transformed once
    if (vertex->flags & TRANSFORMED)
        return;

    Fixed12 width(viewport.x1 - viewport.x0 + 1);
    Fixed12 height(viewport.y1 - viewport.y0 + 1);

    // Halve the viewport size before dividing by W, since a 256-pixel width can't be shifted for division
    Fixed12 dx = width.divInt(2) / vertex->cw;
    Fixed12 dy = height.divInt(2) / vertex->cw;

    // Scale the normalized coordinates to the viewport
    vertex->sx = ((vertex->cx + vertex->cw) * dx).addInt(viewport.x0).toInt();
    vertex->sy = ((vertex->cy + vertex->cw) * dy).addInt(viewport.y0).toInt();
    vertex->sz = ((vertex->cz + vertex->cw).divInt(2) / vertex->cw).toInt();

    vertex->flags |= TRANSFORMED;
}

void Gpu3D::setupPolygons()
{
    std::vector<RenderVertex> &vertices = frames.getNextVertices();
    std::vector<RenderPolygon> &polygons = frames.getNextPolygons();

    for (size_t i = 0; i < polygons.size(); i++)
    {
        RenderPolygon &polygon = polygons[i];
        RenderVertex *v0 = &vertices[polygon.vertices[0]];
        RenderVertex *v1 = &vertices[polygon.vertices[1]];
        RenderVertex *v2 = &vertices[polygon.vertices[2]];

        // Sort the vertices by Y coordinate (v0 = top, v1 = middle, v2 = bottom)
        if (v0->sy > v1->sy)
        {
            SWAP(v0, v1);
            SWAP(polygon.vertices[0], polygon.vertices[1]);
        }
        if (v0->sy > v2->sy)
        {
            SWAP(v0, v2);
            SWAP(polygon.vertices[0], polygon.vertices[2]);
        }
        if (v1->sy > v2->sy)
        {
            SWAP(v1, v2);
            SWAP(polygon.vertices[1], polygon.vertices[2]);
        }

        int32_t hy1 = v1->sy - v0->sy;
        int32_t hy2 = v2->sy - v1->sy;
        if (hy1 < 0 || hy2 < 0)
        {
            LOG_CRIT("Polygon %d has unsorted vertices: Y = %d, %d, %d\n", (int)i, v0->sy, v1->sy, v2->sy);
            throw ERROR_VERTEX_ORDER;
        }

        // Calculate the edge slopes, assuming the middle vertex is on the left
        // A zero-height segment uses its full X delta, to cover it in a single step
        polygon.dl0 = (hy1 > 0) ? Fixed12(v1->sx - v0->sx).divInt(hy1) : Fixed12(v1->sx - v0->sx);
        polygon.dl1 = (hy2 > 0) ? Fixed12(v2->sx - v1->sx).divInt(hy2) : Fixed12(v2->sx - v1->sx);
        polygon.dr0 = (hy1 + hy2 > 0) ? Fixed12(v2->sx - v0->sx).divInt(hy1 + hy2) : Fixed12();
        polygon.dr1 = polygon.dr0;

        // Swap the edges if the middle vertex is actually on the right
        if (polygon.dl0 > polygon.dr0)
        {
            SWAP(polygon.dl0, polygon.dr0);
            SWAP(polygon.dl1, polygon.dr1);
        }

        // Start both bounds at the top vertex, stepping past a zero-height top segment
        polygon.startX0 = polygon.startX1 = Fixed12(v0->sx);
        if (hy1 == 0)
        {
            polygon.startX0 += polygon.dl0;
            polygon.startX1 += polygon.dr0;
        }
        polygon.cx0 = polygon.startX0;
        polygon.cx1 = polygon.startX1;

        polygon.hy = v1->sy;
    }
}

void Gpu3D::dumpScene()
{
    // Start a new dump file on the first frame, and append to it afterwards
    std::string path = Settings::basePath + "/dump3d.txt";
    FILE *file = fopen(path.c_str(), (frames.getFrameCount() == 0) ? "w" : "a");
    if (!file)
    {
        LOG_WARN("Failed to open scene dump file: %s\n", path.c_str());
        return;
    }

    std::vector<RenderVertex> &vertices = frames.getNextVertices();
    std::vector<RenderPolygon> &polygons = frames.getNextPolygons();

    // Write the clip and screen coordinates of every triangle
    fprintf(file, "begin scene\n");
    for (size_t i = 0; i < polygons.size(); i++)
    {
        RenderVertex &v0 = vertices[polygons[i].vertices[0]];
        RenderVertex &v1 = vertices[polygons[i].vertices[1]];
        RenderVertex &v2 = vertices[polygons[i].vertices[2]];

        fprintf(file, "tri %d:\n", (int)i);
        fprintf(file, "    ccoord: (%.3f,%.3f,%.3f,%.3f)-(%.3f,%.3f,%.3f,%.3f)-(%.3f,%.3f,%.3f,%.3f)\n",
            v0.cx.toDouble(), v0.cy.toDouble(), v0.cz.toDouble(), v0.cw.toDouble(),
            v1.cx.toDouble(), v1.cy.toDouble(), v1.cz.toDouble(), v1.cw.toDouble(),
            v2.cx.toDouble(), v2.cy.toDouble(), v2.cz.toDouble(), v2.cw.toDouble());
        fprintf(file, "    scoord: (%d,%d)-(%d,%d)-(%d,%d)\n", v0.sx, v0.sy, v1.sx, v1.sy, v2.sx, v2.sy);
    }

    fclose(file);
    LOG_INFO("Dumped scene with %d polygons\n", (int)polygons.size());
}
