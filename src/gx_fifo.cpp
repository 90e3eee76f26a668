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

#include "gx_fifo.h"
#include "gpu_3d.h"

Matrix Matrix::operator*(Matrix &mtx)
{
    Matrix result;

    // Multiply 2 matrices
    for (int y = 0; y < 4; y++)
    {
        for (int x = 0; x < 4; x++)
        {
            int64_t sum = 0;
            for (int i = 0; i < 4; i++)
                sum += (int64_t)data[y * 4 + i] * mtx.data[i * 4 + x];
            result.data[y * 4 + x] = sum >> 12;
        }
    }

    return result;
}

Vector4 Vector4::operator*(Matrix &mtx)
{
    Vector4 result;

    // Multiply a row vector with a matrix
    result.x = ((int64_t)x * mtx.data[0] + (int64_t)y * mtx.data[4] + (int64_t)z * mtx.data[8]  + (int64_t)w * mtx.data[12]) >> 12;
    result.y = ((int64_t)x * mtx.data[1] + (int64_t)y * mtx.data[5] + (int64_t)z * mtx.data[9]  + (int64_t)w * mtx.data[13]) >> 12;
    result.z = ((int64_t)x * mtx.data[2] + (int64_t)y * mtx.data[6] + (int64_t)z * mtx.data[10] + (int64_t)w * mtx.data[14]) >> 12;
    result.w = ((int64_t)x * mtx.data[3] + (int64_t)y * mtx.data[7] + (int64_t)z * mtx.data[11] + (int64_t)w * mtx.data[15]) >> 12;

    return result;
}

const uint8_t GxFifo::paramCounts[] =
{
    0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0, // 0x00-0x0F
    1,  0,  1,  1,  1,  0, 16, 12, 16, 12,  9,  3,  3,  0,  0,  0, // 0x10-0x1F
    1,  1,  1,  2,  1,  1,  1,  1,  1,  1,  1,  1,  0,  0,  0,  0, // 0x20-0x2F
    1,  1,  1,  1, 32,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0, // 0x30-0x3F
    1,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0, // 0x40-0x4F
    1,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0, // 0x50-0x5F
    1,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0, // 0x60-0x6F
    3,  2,  1,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0, // 0x70-0x7F
};

void GxFifo::writeGxFifo(uint32_t value)
{
    // With no commands pending, the word holds up to 4 packed command IDs
    if (gxFifo == 0)
    {
        gxFifo = value;
    }
    else
    {
        // Otherwise it's a parameter for the lowest pending command
        writeCommand(gxFifo & 0xFF, value);
        if (++gxFifoCount == paramCounts[gxFifo & 0xFF])
        {
            gxFifo >>= 8;
            gxFifoCount = 0;
        }
    }

    // Commands without parameters don't wait for any words
    while (gxFifo != 0 && paramCounts[gxFifo & 0xFF] == 0)
    {
        writeCommand(gxFifo & 0xFF, 0);
        gxFifo >>= 8;
    }
}

void GxFifo::writeCommand(uint8_t command, uint32_t param)
{
    fifo.push_back(Entry(command, param));

    // Execute commands as soon as all of their parameters have arrived
    while (!fifo.empty() && fifo.size() >= paramCounts[fifo.front().command])
        runCommand();
}

uint32_t GxFifo::readGxStat()
{
    // Build the GXSTAT value from the stack and FIFO state
    uint32_t value = 0;
    value |= (coordinatePtr & 0x1F) << 8; // Coordinate stack pointer
    value |= (projectionPtr & 0x01) << 13; // Projection stack pointer
    if (stackError) value |= BIT(15); // Matrix stack error
    value |= (fifo.size() & 0x1FF) << 16; // FIFO entries
    if (fifo.empty()) value |= BIT(26); // FIFO empty
    else value |= BIT(27); // Commands waiting on parameters
    return value;
}

void GxFifo::writeGxStat(uint32_t value)
{
    // Clear the error bit and reset the projection stack pointer
    if (value & BIT(15))
    {
        stackError = false;
        projectionPtr = 0;
    }
}

Matrix &GxFifo::getClipMatrix()
{
    // Update the clip matrix if necessary
    if (clipDirty)
    {
        clip = coordinate * projection;
        clipDirty = false;
    }

    return clip;
}

void GxFifo::runCommand()
{
    // Take the next command off the FIFO along with its parameters
    // Commands with a single parameter or none are passed the entry's own parameter
    Entry entry = fifo.front();
    std::vector<uint32_t> params;
    int count = paramCounts[entry.command] > 1 ? paramCounts[entry.command] : 1;
    for (int i = 0; i < count; i++)
    {
        if (count > 1) params.push_back(fifo.front().param);
        fifo.pop_front();
    }

    // Execute the geometry command
    switch (entry.command)
    {
        case 0x00:                              break; // NOP
        case 0x10: mtxModeCmd(entry.param);     break; // MTX_MODE
        case 0x11: mtxPushCmd();                break; // MTX_PUSH
        case 0x12: mtxPopCmd(entry.param);      break; // MTX_POP
        case 0x13: mtxStoreCmd(entry.param);    break; // MTX_STORE
        case 0x14: mtxRestoreCmd(entry.param);  break; // MTX_RESTORE
        case 0x15: mtxIdentityCmd();            break; // MTX_IDENTITY
        case 0x16: mtxLoad44Cmd(params);        break; // MTX_LOAD_4x4
        case 0x17: mtxLoad43Cmd(params);        break; // MTX_LOAD_4x3
        case 0x18: mtxMult44Cmd(params);        break; // MTX_MULT_4x4
        case 0x19: mtxMult43Cmd(params);        break; // MTX_MULT_4x3
        case 0x1A: mtxMult33Cmd(params);        break; // MTX_MULT_3x3
        case 0x1B: mtxScaleCmd(params);         break; // MTX_SCALE
        case 0x1C: mtxTransCmd(params);         break; // MTX_TRANS
        case 0x23: vtx16Cmd(params);            break; // VTX_16
        case 0x24: vtx10Cmd(entry.param);       break; // VTX_10
        case 0x25: vtxXYCmd(entry.param);       break; // VTX_XY
        case 0x26: vtxXZCmd(entry.param);       break; // VTX_XZ
        case 0x27: vtxYZCmd(entry.param);       break; // VTX_YZ
        case 0x28: vtxDiffCmd(entry.param);     break; // VTX_DIFF
        case 0x29: polygonAttrCmd(entry.param); break; // POLYGON_ATTR
        case 0x40: beginVtxsCmd(entry.param);   break; // BEGIN_VTXS
        case 0x41:                              break; // END_VTXS
        case 0x50: swapBuffersCmd();            break; // SWAP_BUFFERS
        case 0x60: viewportCmd(entry.param);    break; // VIEWPORT

        default:
        {
            LOG_WARN("Unknown GXFIFO command: 0x%X\n", entry.command);
            break;
        }
    }
}

void GxFifo::addVertex()
{
    // Drop vertices past what a frame can hold
    if (vertexCount >= VERTEX_RAM_SIZE)
    {
        LOG_WARN("Dropping vertex past the limit of %d per frame\n", VERTEX_RAM_SIZE);
        return;
    }

    // Transform the vertex to clip space and send it
    Vector4 vertex = savedVertex * getClipMatrix();
    Command command = Command::vertex(Fixed12::fromRaw(vertex.x), Fixed12::fromRaw(vertex.y),
        Fixed12::fromRaw(vertex.z), Fixed12::fromRaw(vertex.w));
    if (!gpu3D->submit(command))
    {
        LOG_WARN("Dropping vertex sent to a stopped 3D engine\n");
        return;
    }

    // Track the index the engine will give the vertex
    for (int i = 0; i < 3; i++)
        recent[i] = recent[i + 1];
    recent[3] = vertexCount++;
    listCount++;

    // Send a polygon if one has been completed
    switch (polygonType)
    {
        case POLY_TRIANGLES:
            if (listCount % 3 == 0)
                addPolygon(recent[1], recent[2], recent[3], 0, false);
            break;

        case POLY_QUADS:
            if (listCount % 4 == 0)
                addPolygon(recent[0], recent[1], recent[2], recent[3], true);
            break;

        case POLY_TRIANGLE_STRIPS:
            if (listCount >= 3)
                addPolygon(recent[1], recent[2], recent[3], 0, false);
            break;

        case POLY_QUAD_STRIPS:
            // Quad strip vertices zigzag, so swap the last 2 to walk the quad's outline
            if (listCount >= 4 && listCount % 2 == 0)
                addPolygon(recent[0], recent[1], recent[3], recent[2], true);
            break;
    }
}

void GxFifo::addPolygon(int v0, int v1, int v2, int v3, bool quad)
{
    // Drop polygons past what a frame can hold, counting quads as 2 triangles
    int triangles = quad ? 2 : 1;
    if (triangleCount + triangles > POLYGON_RAM_SIZE)
    {
        LOG_WARN("Dropping polygon past the limit of %d triangles per frame\n", POLYGON_RAM_SIZE);
        return;
    }

    uint32_t attr = (listAttr & ~POLYGON_QUAD) | (quad ? POLYGON_QUAD : 0);
    if (!gpu3D->submit(Command::polygon(v0, v1, v2, v3, attr)))
    {
        LOG_WARN("Dropping polygon sent to a stopped 3D engine\n");
        return;
    }

    triangleCount += triangles;
}

void GxFifo::loadMatrix(Matrix &matrix)
{
    // Set the current matrix; the texture matrix isn't used
    switch (matrixMode)
    {
        case 0: projection = matrix; clipDirty = true; break; // Projection stack
        case 1: case 2: coordinate = matrix; clipDirty = true; break; // Coordinate stack
    }
}

void GxFifo::multMatrix(Matrix &matrix)
{
    // Multiply the current matrix; the texture matrix isn't used
    switch (matrixMode)
    {
        case 0: projection = matrix * projection; clipDirty = true; break; // Projection stack
        case 1: case 2: coordinate = matrix * coordinate; clipDirty = true; break; // Coordinate stack
    }
}

void GxFifo::mtxModeCmd(uint32_t param)
{
    // Set the matrix mode
    matrixMode = param & 0x00000003;
}

void GxFifo::mtxPushCmd()
{
    // Push the current matrix onto a stack
    switch (matrixMode)
    {
        case 0: // Projection stack
        {
            // There's only one slot
            if (projectionPtr == 0)
            {
                projectionStack = projection;
                projectionPtr = 1;
            }
            else
            {
                stackError = true;
            }
            break;
        }

        case 1: case 2: // Coordinate stack
        {
            // Slot 30 can still be pushed to, but is flagged as an overflow
            if (coordinatePtr >= 30) stackError = true;

            if (coordinatePtr < 31)
            {
                coordinateStack[coordinatePtr] = coordinate;
                coordinatePtr++;
            }
            break;
        }
    }
}

void GxFifo::mtxPopCmd(uint32_t param)
{
    // Pop a matrix from a stack
    switch (matrixMode)
    {
        case 0: // Projection stack
        {
            if (projectionPtr == 0)
            {
                stackError = true;
                break;
            }

            projectionPtr = 0;
            projection = projectionStack;
            clipDirty = true;
            break;
        }

        case 1: case 2: // Coordinate stack
        {
            // The parameter is a signed 6-bit offset from the current pointer
            int address = coordinatePtr - (((param & BIT(5)) ? 0xFFFFFFC0 : 0) | (param & 0x0000003F));
            if (address < 0 || address >= 30) stackError = true;

            if (address >= 0 && address < 31)
            {
                coordinate = coordinateStack[address];
                coordinatePtr = address;
                clipDirty = true;
            }
            break;
        }
    }
}

void GxFifo::mtxStoreCmd(uint32_t param)
{
    // Store a matrix to the stack
    switch (matrixMode)
    {
        case 0: projectionStack = projection; break; // Projection stack

        case 1: case 2: // Coordinate stack
        {
            int address = param & 0x0000001F;
            if (address == 31) stackError = true;
            coordinateStack[address] = coordinate;
            break;
        }
    }
}

void GxFifo::mtxRestoreCmd(uint32_t param)
{
    // Restore a matrix from the stack
    switch (matrixMode)
    {
        case 0: // Projection stack
        {
            projection = projectionStack;
            clipDirty = true;
            break;
        }

        case 1: case 2: // Coordinate stack
        {
            int address = param & 0x0000001F;
            if (address == 31) stackError = true;
            coordinate = coordinateStack[address];
            clipDirty = true;
            break;
        }
    }
}

void GxFifo::mtxIdentityCmd()
{
    Matrix matrix;
    loadMatrix(matrix);
}

void GxFifo::mtxLoad44Cmd(std::vector<uint32_t> &params)
{
    // Convert the parameters to a 4x4 matrix
    Matrix matrix;
    for (int i = 0; i < 16; i++)
        matrix.data[i] = params[i];

    loadMatrix(matrix);
}

void GxFifo::mtxLoad43Cmd(std::vector<uint32_t> &params)
{
    // Convert the parameters to a 4x3 matrix
    Matrix matrix;
    for (int i = 0; i < 4; i++)
        for (int j = 0; j < 3; j++)
            matrix.data[i * 4 + j] = params[i * 3 + j];

    loadMatrix(matrix);
}

void GxFifo::mtxMult44Cmd(std::vector<uint32_t> &params)
{
    Matrix matrix;
    for (int i = 0; i < 16; i++)
        matrix.data[i] = params[i];

    multMatrix(matrix);
}

void GxFifo::mtxMult43Cmd(std::vector<uint32_t> &params)
{
    Matrix matrix;
    for (int i = 0; i < 4; i++)
        for (int j = 0; j < 3; j++)
            matrix.data[i * 4 + j] = params[i * 3 + j];

    multMatrix(matrix);
}

void GxFifo::mtxMult33Cmd(std::vector<uint32_t> &params)
{
    // Convert the parameters to a 3x3 matrix, leaving the translation row as identity
    Matrix matrix;
    for (int i = 0; i < 3; i++)
        for (int j = 0; j < 3; j++)
            matrix.data[i * 4 + j] = params[i * 3 + j];

    multMatrix(matrix);
}

void GxFifo::mtxScaleCmd(std::vector<uint32_t> &params)
{
    // Convert the parameters to a scale matrix
    Matrix matrix;
    for (int i = 0; i < 3; i++)
        matrix.data[i * 5] = (int32_t)params[i];

    multMatrix(matrix);
}

void GxFifo::mtxTransCmd(std::vector<uint32_t> &params)
{
    // Convert the parameters to a translation matrix
    Matrix matrix;
    for (int i = 0; i < 3; i++)
        matrix.data[12 + i] = (int32_t)params[i];

    multMatrix(matrix);
}

void GxFifo::vtx16Cmd(std::vector<uint32_t> &params)
{
    // Two words of 4.12 coordinates: X and Y packed, then Z
    savedVertex.x = (int16_t)(params[0] >>  0);
    savedVertex.y = (int16_t)(params[0] >> 16);
    savedVertex.z = (int16_t)(params[1]);

    addVertex();
}

void GxFifo::vtx10Cmd(uint32_t param)
{
    // Three 4.6 coordinates in one word, widened to 4.12
    savedVertex.x = (int16_t)((param & 0x000003FF) << 6);
    savedVertex.y = (int16_t)((param & 0x000FFC00) >> 4);
    savedVertex.z = (int16_t)((param & 0x3FF00000) >> 14);

    addVertex();
}

void GxFifo::vtxXYCmd(uint32_t param)
{
    // Replace X and Y, keeping the last Z
    savedVertex.x = (int16_t)(param >>  0);
    savedVertex.y = (int16_t)(param >> 16);

    addVertex();
}

void GxFifo::vtxXZCmd(uint32_t param)
{
    // Replace X and Z, keeping the last Y
    savedVertex.x = (int16_t)(param >>  0);
    savedVertex.z = (int16_t)(param >> 16);

    addVertex();
}

void GxFifo::vtxYZCmd(uint32_t param)
{
    // Replace Y and Z, keeping the last X
    savedVertex.y = (int16_t)(param >>  0);
    savedVertex.z = (int16_t)(param >> 16);

    addVertex();
}

void GxFifo::vtxDiffCmd(uint32_t param)
{
    // Offset the last vertex by three signed 0.9 deltas
    savedVertex.x += ((int16_t)((param & 0x000003FF) <<  6) / 8) >> 3;
    savedVertex.y += ((int16_t)((param & 0x000FFC00) >>  4) / 8) >> 3;
    savedVertex.z += ((int16_t)((param & 0x3FF00000) >> 14) / 8) >> 3;

    addVertex();
}

void GxFifo::polygonAttrCmd(uint32_t param)
{
    // Values are not actually applied until the next vertex list
    polygonAttr = param;
}

void GxFifo::beginVtxsCmd(uint32_t param)
{
    // Begin a new vertex list with the latched attributes
    polygonType = (PolygonType)(param & 0x00000003);
    listAttr = polygonAttr;
    listCount = 0;
}

void GxFifo::swapBuffersCmd()
{
    if (!gpu3D->submit(Command::swapBuffers()))
        LOG_WARN("Dropping buffer swap sent to a stopped 3D engine\n");

    // Vertex indices start over with the next frame
    vertexCount = 0;
    triangleCount = 0;
    listCount = 0;
}

void GxFifo::viewportCmd(uint32_t param)
{
    // Set the viewport bounds, one byte each
    int x0 = (param & 0x000000FF) >>  0;
    int y0 = (param & 0x0000FF00) >>  8;
    int x1 = (param & 0x00FF0000) >> 16;
    int y1 = (param & 0xFF000000) >> 24;

    if (!gpu3D->submit(Command::setViewport(x0, y0, x1, y1)))
        LOG_WARN("Dropping viewport sent to a stopped 3D engine\n");
}
