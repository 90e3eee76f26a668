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

#ifndef GPU_3D_H
#define GPU_3D_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <thread>
#include <vector>

#include "command_queue.h"
#include "defines.h"
#include "fixed.h"
#include "frame_store.h"

// Inconsistencies that can only come from a broken command source
// These are thrown, and halt the engine when raised on the geometry thread
enum GeometryError
{
    ERROR_NONE = 0,
    ERROR_VERTEX_OVERFLOW,
    ERROR_POLYGON_OVERFLOW,
    ERROR_POLYGON_INDEX,
    ERROR_VERTEX_ORDER
};

enum CommandType
{
    CMD_SET_VIEWPORT = 0,
    CMD_VERTEX,
    CMD_POLYGON,
    CMD_SWAP_BUFFERS
};

struct Command
{
    CommandType type = CMD_SWAP_BUFFERS;
    int32_t params[4] = {};
    uint32_t attr = 0;

    static Command setViewport(int x0, int y0, int x1, int y1);
    static Command vertex(Fixed12 x, Fixed12 y, Fixed12 z, Fixed12 w);
    static Command polygon(int v0, int v1, int v2, int v3, uint32_t attr);
    static Command swapBuffers();
};

// Viewport in pixel coordinates, with inclusive bounds
struct Viewport
{
    int x0 = 0, y0 = 0;
    int x1 = SCREEN_WIDTH - 1, y1 = SCREEN_HEIGHT - 1;
};

class Gpu3D
{
    public:
        Gpu3D();
        ~Gpu3D();

        void saveState(FILE *file);
        bool loadState(FILE *file);

        void start();
        void stop();

        bool submit(const Command &command);
        void flush();
        void processCommand(const Command &command);

        void beginFrame() { frameMutex.lock(); }
        void endFrame() { frameMutex.unlock(); }

        // The current frame; only access between beginFrame and endFrame
        std::vector<RenderVertex> &getVertices() { return frames.getCurVertices(); }
        std::vector<RenderPolygon> &getPolygons() { return frames.getCurPolygons(); }

        // The frame being built; only access from the geometry thread or after a flush
        const std::vector<RenderVertex> &getNextVertices() { return frames.getNextVertices(); }
        const std::vector<RenderPolygon> &getNextPolygons() { return frames.getNextPolygons(); }

        // Written by the geometry thread; only read from it or after a flush
        Viewport getViewport() { return viewport; }
        uint32_t getFrameCount() { return frames.getFrameCount(); }
        bool isThreaded() { return thread != nullptr; }
        bool isHalted() { return halted.load(); }
        GeometryError getError() { return (GeometryError)error.load(); }

    private:
        FrameStore frames;
        Viewport viewport;
        std::mutex frameMutex;

        CommandQueue<Command> queue;
        std::thread *thread = nullptr;
        std::atomic<bool> halted;
        std::atomic<int> error;

        std::mutex flushMutex;
        std::condition_variable flushed;
        uint64_t submitted = 0;
        uint64_t processed = 0;

        void runCommands();
        void halt(GeometryError value);
        void commandDone();

        void viewportCmd(const Command &command);
        void vertexCmd(const Command &command);
        void polygonCmd(const Command &command);
        void swapBuffersCmd();

        void transformVertex(RenderVertex *vertex);
        void setupPolygons();
        void dumpScene();
};

#endif // GPU_3D_H
