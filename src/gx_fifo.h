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

#ifndef GX_FIFO_H
#define GX_FIFO_H

#include <cstdint>
#include <deque>
#include <vector>

#include "defines.h"

class Gpu3D;

struct Entry
{
    uint8_t command;
    uint32_t param;

    Entry(uint8_t command, uint32_t param): command(command), param(param) {}
};

struct Matrix
{
    int32_t data[4 * 4] =
    {
        1 << 12, 0 << 12, 0 << 12, 0 << 12,
        0 << 12, 1 << 12, 0 << 12, 0 << 12,
        0 << 12, 0 << 12, 1 << 12, 0 << 12,
        0 << 12, 0 << 12, 0 << 12, 1 << 12
    };

    Matrix operator*(Matrix &mtx);
};

struct Vector4
{
    int32_t x = 0, y = 0, z = 0, w = 1 << 12;

    Vector4 operator*(Matrix &mtx);
};

enum PolygonType
{
    POLY_TRIANGLES = 0,
    POLY_QUADS,
    POLY_TRIANGLE_STRIPS,
    POLY_QUAD_STRIPS
};

// Decodes geometry coprocessor commands into engine commands
// Vertices are transformed to clip space here, and polygons refer to them by index
class GxFifo
{
    public:
        GxFifo(Gpu3D *gpu3D): gpu3D(gpu3D) {}

        void writeGxFifo(uint32_t value);
        void writeCommand(uint8_t command, uint32_t param);

        uint32_t readGxStat();
        void writeGxStat(uint32_t value);

        int getVertexCount() { return vertexCount; }
        int getTriangleCount() { return triangleCount; }
        Matrix &getClipMatrix();

    private:
        Gpu3D *gpu3D;

        std::deque<Entry> fifo;
        static const uint8_t paramCounts[0x100];

        uint32_t gxFifo = 0;
        uint8_t gxFifoCount = 0;
        bool stackError = false;

        uint8_t matrixMode = 0;
        bool clipDirty = false;

        Matrix projection, projectionStack;
        Matrix coordinate, coordinateStack[32];
        Matrix clip;
        int projectionPtr = 0;
        int coordinatePtr = 0;

        Vector4 savedVertex;
        uint32_t polygonAttr = 0;
        uint32_t listAttr = 0;
        PolygonType polygonType = POLY_TRIANGLES;

        // Indices of the most recent vertices in the current list, oldest first
        int recent[4] = {};
        int listCount = 0;

        // Vertices and triangles sent to the engine since the last swap
        int vertexCount = 0;
        int triangleCount = 0;

        void runCommand();

        void addVertex();
        void addPolygon(int v0, int v1, int v2, int v3, bool quad);

        void loadMatrix(Matrix &matrix);
        void multMatrix(Matrix &matrix);

        void mtxModeCmd(uint32_t param);
        void mtxPushCmd();
        void mtxPopCmd(uint32_t param);
        void mtxStoreCmd(uint32_t param);
        void mtxRestoreCmd(uint32_t param);
        void mtxIdentityCmd();
        void mtxLoad44Cmd(std::vector<uint32_t> &params);
        void mtxLoad43Cmd(std::vector<uint32_t> &params);
        void mtxMult44Cmd(std::vector<uint32_t> &params);
        void mtxMult43Cmd(std::vector<uint32_t> &params);
        void mtxMult33Cmd(std::vector<uint32_t> &params);
        void mtxScaleCmd(std::vector<uint32_t> &params);
        void mtxTransCmd(std::vector<uint32_t> &params);
        void vtx16Cmd(std::vector<uint32_t> &params);
        void vtx10Cmd(uint32_t param);
        void vtxXYCmd(uint32_t param);
        void vtxXZCmd(uint32_t param);
        void vtxYZCmd(uint32_t param);
        void vtxDiffCmd(uint32_t param);
        void polygonAttrCmd(uint32_t param);
        void beginVtxsCmd(uint32_t param);
        void swapBuffersCmd();
        void viewportCmd(uint32_t param);
};

#endif // GX_FIFO_H
