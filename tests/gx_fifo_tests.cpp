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

#include <gtest/gtest.h>

#include "gpu_3d.h"
#include "gpu_3d_test_helpers.h"
#include "gx_fifo.h"

namespace {

void sendVertex(GxFifo *gx, int16_t x, int16_t y, int16_t z = 0)
{
    gx->writeCommand(0x23, ((uint32_t)(uint16_t)y << 16) | (uint16_t)x); // VTX_16
    gx->writeCommand(0x23, (uint16_t)z);
}

void sendScale(GxFifo *gx, int32_t x, int32_t y, int32_t z)
{
    gx->writeCommand(0x1B, x); // MTX_SCALE
    gx->writeCommand(0x1B, y);
    gx->writeCommand(0x1B, z);
}

class GxFifoTest : public ::testing::Test
{
    protected:
        void SetUp() override { resetSettings(false); }
};

TEST_F(GxFifoTest, SendsSeparateTriangles)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x40, POLY_TRIANGLES); // BEGIN_VTXS
    sendVertex(&gx, 0, 0);
    sendVertex(&gx, 2048, 0);
    sendVertex(&gx, 0, -2048);
    gx.writeCommand(0x41, 0); // END_VTXS

    const std::vector<RenderVertex> &vertices = gpu.getNextVertices();
    ASSERT_EQ(vertices.size(), 3u);
    EXPECT_EQ(vertices[1].cx.value, 2048);
    EXPECT_EQ(vertices[2].cy.value, -2048);
    EXPECT_EQ(vertices[2].cw.value, 4096);

    const std::vector<RenderPolygon> &polygons = gpu.getNextPolygons();
    ASSERT_EQ(polygons.size(), 1u);
    EXPECT_EQ(polygons[0].vertices[0], 0);
    EXPECT_EQ(polygons[0].vertices[2], 2);
    EXPECT_EQ(gx.getVertexCount(), 3);
    EXPECT_EQ(gx.getTriangleCount(), 1);
}

TEST_F(GxFifoTest, SendsQuadsAsPairs)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x40, POLY_QUADS);
    sendVertex(&gx, 0, 0);
    sendVertex(&gx, 2048, 0);
    sendVertex(&gx, 2048, 2048);
    sendVertex(&gx, 0, 2048);

    const std::vector<RenderPolygon> &polygons = gpu.getNextPolygons();
    ASSERT_EQ(polygons.size(), 2u);
    EXPECT_EQ(polygons[1].vertices[0], 0);
    EXPECT_EQ(polygons[1].vertices[1], 3);
    EXPECT_EQ(polygons[1].vertices[2], 2);
    EXPECT_EQ(gx.getTriangleCount(), 2);
}

TEST_F(GxFifoTest, TriangleStripsReuseVertices)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x40, POLY_TRIANGLE_STRIPS);
    for (int i = 0; i < 5; i++)
        sendVertex(&gx, i * 256, (i & 1) * 256);

    const std::vector<RenderPolygon> &polygons = gpu.getNextPolygons();
    ASSERT_EQ(polygons.size(), 3u);
    EXPECT_EQ(polygons[2].vertices[0], 2);
    EXPECT_EQ(polygons[2].vertices[1], 3);
    EXPECT_EQ(polygons[2].vertices[2], 4);
    EXPECT_EQ(gpu.getNextVertices().size(), 5u);
}

TEST_F(GxFifoTest, QuadStripsWalkOutline)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x40, POLY_QUAD_STRIPS);
    for (int i = 0; i < 6; i++)
        sendVertex(&gx, (i / 2) * 256, (i & 1) * 256);

    // Each quad (n-3, n-2, n, n-1) is split into two triangles
    const std::vector<RenderPolygon> &polygons = gpu.getNextPolygons();
    ASSERT_EQ(polygons.size(), 4u);
    EXPECT_EQ(polygons[0].vertices[1], 1);
    EXPECT_EQ(polygons[0].vertices[2], 3);
    EXPECT_EQ(polygons[1].vertices[1], 2);
    EXPECT_EQ(polygons[2].vertices[0], 2);
    EXPECT_EQ(polygons[2].vertices[1], 3);
    EXPECT_EQ(polygons[2].vertices[2], 5);
    EXPECT_EQ(polygons[3].vertices[1], 4);
}

TEST_F(GxFifoTest, NewListDropsIncompletePolygon)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x40, POLY_TRIANGLES);
    sendVertex(&gx, 0, 0);
    sendVertex(&gx, 256, 0);
    gx.writeCommand(0x40, POLY_TRIANGLES);
    sendVertex(&gx, 0, 256);
    EXPECT_TRUE(gpu.getNextPolygons().empty());

    sendVertex(&gx, 256, 256);
    sendVertex(&gx, 512, 256);
    ASSERT_EQ(gpu.getNextPolygons().size(), 1u);
    EXPECT_EQ(gpu.getNextPolygons()[0].vertices[0], 2);
}

TEST_F(GxFifoTest, ScalesCoordinateMatrix)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x10, 1); // MTX_MODE
    sendScale(&gx, 8192, 8192, 4096);
    gx.writeCommand(0x40, POLY_TRIANGLES);
    sendVertex(&gx, 1024, -512);

    EXPECT_EQ(gpu.getNextVertices()[0].cx.value, 2048);
    EXPECT_EQ(gpu.getNextVertices()[0].cy.value, -1024);
}

TEST_F(GxFifoTest, TranslatesProjectionMatrix)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x10, 0);
    gx.writeCommand(0x1C, 1024); // MTX_TRANS
    gx.writeCommand(0x1C, 0);
    gx.writeCommand(0x1C, 0);
    gx.writeCommand(0x40, POLY_TRIANGLES);
    sendVertex(&gx, 1024, 0);

    EXPECT_EQ(gpu.getNextVertices()[0].cx.value, 2048);
    EXPECT_EQ(gx.getClipMatrix().data[12], 1024);
}

TEST_F(GxFifoTest, LoadsFullMatrix)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    Matrix matrix;
    matrix.data[15] = 8192;
    gx.writeCommand(0x10, 0);
    for (int i = 0; i < 16; i++)
        gx.writeCommand(0x16, matrix.data[i]); // MTX_LOAD_4x4
    gx.writeCommand(0x40, POLY_TRIANGLES);
    sendVertex(&gx, 0, 0);

    EXPECT_EQ(gpu.getNextVertices()[0].cw.value, 8192);
}

TEST_F(GxFifoTest, PushAndPopCoordinateMatrix)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x10, 1);
    gx.writeCommand(0x11, 0); // MTX_PUSH
    EXPECT_EQ((gx.readGxStat() >> 8) & 0x1F, 1u);

    sendScale(&gx, 8192, 8192, 4096);
    gx.writeCommand(0x12, 1); // MTX_POP
    EXPECT_EQ((gx.readGxStat() >> 8) & 0x1F, 0u);

    gx.writeCommand(0x40, POLY_TRIANGLES);
    sendVertex(&gx, 1024, 0);
    EXPECT_EQ(gpu.getNextVertices()[0].cx.value, 1024);
    EXPECT_FALSE(gx.readGxStat() & BIT(15));
}

TEST_F(GxFifoTest, StoreAndRestoreCoordinateMatrix)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x10, 2);
    sendScale(&gx, 8192, 8192, 4096);
    gx.writeCommand(0x13, 5); // MTX_STORE
    gx.writeCommand(0x15, 0); // MTX_IDENTITY
    gx.writeCommand(0x14, 5); // MTX_RESTORE

    gx.writeCommand(0x40, POLY_TRIANGLES);
    sendVertex(&gx, 1024, 0);
    EXPECT_EQ(gpu.getNextVertices()[0].cx.value, 2048);
}

TEST_F(GxFifoTest, ProjectionStackOverflow)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x10, 0);
    gx.writeCommand(0x11, 0);
    EXPECT_TRUE(gx.readGxStat() & BIT(13));
    EXPECT_FALSE(gx.readGxStat() & BIT(15));

    gx.writeCommand(0x11, 0);
    EXPECT_TRUE(gx.readGxStat() & BIT(15));

    // Acknowledging the error also resets the projection stack
    gx.writeGxStat(BIT(15));
    EXPECT_FALSE(gx.readGxStat() & BIT(15));
    EXPECT_FALSE(gx.readGxStat() & BIT(13));
}

TEST_F(GxFifoTest, CoordinateStackUnderflow)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x10, 1);
    gx.writeCommand(0x12, 1);
    EXPECT_TRUE(gx.readGxStat() & BIT(15));
}

TEST_F(GxFifoTest, SetsViewport)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x60, (191u << 24) | (127 << 16) | (8 << 8) | 4); // VIEWPORT

    Viewport viewport = gpu.getViewport();
    EXPECT_EQ(viewport.x0, 4);
    EXPECT_EQ(viewport.y0, 8);
    EXPECT_EQ(viewport.x1, 127);
    EXPECT_EQ(viewport.y1, 191);
}

TEST_F(GxFifoTest, SwapRestartsVertexIndices)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x40, POLY_TRIANGLES);
    sendVertex(&gx, 0, 0);
    sendVertex(&gx, 256, 0);
    sendVertex(&gx, 0, 256);
    gx.writeCommand(0x50, 0); // SWAP_BUFFERS

    EXPECT_EQ(gpu.getFrameCount(), 1u);
    EXPECT_EQ(gx.getVertexCount(), 0);
    EXPECT_EQ(gx.getTriangleCount(), 0);

    gx.writeCommand(0x40, POLY_TRIANGLES);
    sendVertex(&gx, 0, 0);
    sendVertex(&gx, 256, 0);
    sendVertex(&gx, 0, 256);
    ASSERT_EQ(gpu.getNextPolygons().size(), 1u);
    EXPECT_EQ(gpu.getNextPolygons()[0].vertices[2], 2);
    EXPECT_FALSE(gpu.isHalted());
}

TEST_F(GxFifoTest, UnpacksCommands)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);

    // MTX_IDENTITY has no parameters, so it runs as soon as it's unpacked
    gx.writeGxFifo(0x00004015);
    gx.writeGxFifo(POLY_TRIANGLES);

    gx.writeGxFifo(0x00232323);
    for (int i = 0; i < 3; i++)
    {
        gx.writeGxFifo(i * 256);
        gx.writeGxFifo(0);
    }

    EXPECT_EQ(gpu.getNextVertices().size(), 3u);
    EXPECT_EQ(gpu.getNextVertices()[2].cx.value, 512);
    EXPECT_EQ(gpu.getNextPolygons().size(), 1u);
    EXPECT_TRUE(gx.readGxStat() & BIT(26));
}

TEST_F(GxFifoTest, SkipsPackedNops)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x10, 1);
    sendScale(&gx, 8192, 8192, 4096);

    // Packed NOP, BEGIN_VTXS and MTX_IDENTITY; the NOP takes no parameter word
    gx.writeGxFifo(0x00150000 | 0x4000);
    gx.writeGxFifo(POLY_TRIANGLES);
    EXPECT_TRUE(gx.readGxStat() & BIT(26));

    sendVertex(&gx, 1024, 0);
    ASSERT_EQ(gpu.getNextVertices().size(), 1u);
    EXPECT_EQ(gpu.getNextVertices()[0].cx.value, 1024);
}

TEST_F(GxFifoTest, LatchesPolygonAttributes)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x29, 0x8000001F); // POLYGON_ATTR
    gx.writeCommand(0x40, POLY_TRIANGLES);
    gx.writeCommand(0x29, 0x2F);
    sendVertex(&gx, 0, 0);
    sendVertex(&gx, 256, 0);
    sendVertex(&gx, 0, 256);

    ASSERT_EQ(gpu.getNextPolygons().size(), 1u);
    EXPECT_EQ(gpu.getNextPolygons()[0].attr, 0x1Fu);
}

TEST_F(GxFifoTest, DropsVerticesPastLimit)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x40, POLY_TRIANGLES);
    for (int i = 0; i <= VERTEX_RAM_SIZE; i++)
        gx.writeCommand(0x25, 0); // VTX_XY

    EXPECT_FALSE(gpu.isHalted());
    EXPECT_EQ(gx.getVertexCount(), VERTEX_RAM_SIZE);
    EXPECT_EQ(gpu.getNextVertices().size(), (size_t)VERTEX_RAM_SIZE);
    EXPECT_EQ(gpu.getNextPolygons().size(), (size_t)(VERTEX_RAM_SIZE / 3));
}

TEST_F(GxFifoTest, WaitsForAllParameters)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x1B, 4096);
    uint32_t stat = gx.readGxStat();
    EXPECT_EQ((stat >> 16) & 0x1FF, 1u);
    EXPECT_TRUE(stat & BIT(27));
    EXPECT_FALSE(stat & BIT(26));

    gx.writeCommand(0x1B, 4096);
    gx.writeCommand(0x1B, 4096);
    stat = gx.readGxStat();
    EXPECT_EQ((stat >> 16) & 0x1FF, 0u);
    EXPECT_TRUE(stat & BIT(26));
}

TEST_F(GxFifoTest, IgnoresUnsupportedCommands)
{
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x33, 0x7FFF); // LIGHT_COLOR
    gx.writeCommand(0x00, 0);
    EXPECT_TRUE(gx.readGxStat() & BIT(26));
    EXPECT_TRUE(gpu.getNextVertices().empty());
}

TEST(GxFifoThread, FeedsGeometryThread)
{
    resetSettings(true);
    Gpu3D gpu;
    GxFifo gx(&gpu);
    gx.writeCommand(0x40, POLY_QUADS);
    sendVertex(&gx, -2048, -2048);
    sendVertex(&gx, 2048, -2048);
    sendVertex(&gx, 2048, 2048);
    sendVertex(&gx, -2048, 2048);
    gx.writeCommand(0x50, 0);
    gpu.flush();

    EXPECT_EQ(gpu.getFrameCount(), 1u);
    gpu.beginFrame();
    EXPECT_EQ(gpu.getPolygons().size(), 2u);
    gpu.endFrame();
}

} // namespace
