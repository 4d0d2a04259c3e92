/*
 * Copyright (c) 2021, University of Washington
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the University of Washington nor the names of its
 *    contributors may be used to endorse or promote products derived from this
 *    software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE UNIVERSITY OF WASHINGTON AND CONTRIBUTORS
 * “AS IS” AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE UNIVERSITY OF WASHINGTON OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <cmath>
#include <set>
#include <vector>
#include <ogr_spatialref.h>

#include "UT_GeoLib.h"
#include "GeoLib.h"
#include "GdalRaster.h"
#include "UnitTest.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_GeoLib::LUA_META_NAME = "UT_GeoLib";
const struct luaL_Reg UT_GeoLib::LUA_META_TABLE[] = {
    {"pixelarea",   testPixelArea},
    {"rasterio",    testRasterIO},
    {"cutline",     testCutline},
    {NULL,          NULL}
};

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate -
 *----------------------------------------------------------------------------*/
int UT_GeoLib::luaCreate (lua_State* L)
{
    try
    {
        /* Create Unit Test */
        return createLuaObject(L, new UT_GeoLib(L));
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error creating %s: %s", LUA_META_NAME, e.what());
        return returnLuaStatus(L, false);
    }
}

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_GeoLib::UT_GeoLib (lua_State* L):
    UnitTest(L, LUA_META_NAME, LUA_META_TABLE)
{
}

/*--------------------------------------------------------------------------------------
 * testPixelArea
 *--------------------------------------------------------------------------------------*/
int UT_GeoLib::testPixelArea(lua_State* L)
{
    UT_GeoLib* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_GeoLib*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    // 1) One degree pixel centered on the equator
    const double equator_gt[6] = {0.0, 1.0, 0.0, 0.5, 0.0, -1.0};
    const GeoLib::PixelArea equator(equator_gt);
    const double km2 = equator.rowKm2(0);
    ut_assert(lua_obj, fabs(km2 - 12309.2) < 1.0, "Unexpected equatorial pixel area: %lf", km2);
    ut_assert(lua_obj, fabs(km2 - GeoLib::pixelKm2(0.0, 1.0, -1.0)) < 1e-9, "Row area does not match pixel area: %lf", km2);

    // 2) Rows mirrored about the equator have the same area
    const double mirror_gt[6] = {10.0, 0.5, 0.0, 2.0, 0.0, -1.0};
    const GeoLib::PixelArea mirror(mirror_gt);
    ut_assert(lua_obj, fabs(mirror.rowKm2(0) - mirror.rowKm2(3)) < 1e-6, "Rows 0 and 3 differ: %lf %lf", mirror.rowKm2(0), mirror.rowKm2(3));
    ut_assert(lua_obj, fabs(mirror.rowKm2(1) - mirror.rowKm2(2)) < 1e-6, "Rows 1 and 2 differ: %lf %lf", mirror.rowKm2(1), mirror.rowKm2(2));
    ut_assert(lua_obj, mirror.rowKm2(1) > mirror.rowKm2(0), "Area does not shrink away from the equator");

    // 3) Area shrinks toward the pole and vanishes at it
    const double polar_gt[6] = {0.0, 1.0, 0.0, 90.0, 0.0, -1.0};
    const GeoLib::PixelArea polar(polar_gt);
    for(int row = 0; row < 89; row++)
    {
        ut_assert(lua_obj, polar.rowKm2(row) < polar.rowKm2(row + 1), "Area not increasing at row %d", row);
    }
    ut_assert(lua_obj, polar.rowKm2(0) < 200.0, "Polar row too large: %lf", polar.rowKm2(0));

    // 4) Block grid matches row areas
    std::vector<double> grid;
    polar.blockKm2(10, 5, 3, grid);
    ut_assert(lua_obj, grid.size() == 15, "Unexpected grid size: %ld", (long)grid.size());
    for(int i = 0; i < 5 && grid.size() == 15; i++)
    {
        for(int j = 0; j < 3; j++)
        {
            const double expected = polar.rowKm2(10 + i);
            const double actual = grid[(i * 3) + j];
            ut_assert(lua_obj, fabs(expected - actual) < (expected * 1e-9), "Grid mismatch at %d,%d: %lf != %lf", i, j, actual, expected);
        }
    }

    // 5) Adjacent row ranges add up to the combined range
    double upper = 0.0, lower = 0.0, combined = 0.0;
    polar.blockKm2(20, 7, 1, grid);
    for(double v: grid) upper += v;
    polar.blockKm2(27, 13, 1, grid);
    for(double v: grid) lower += v;
    polar.blockKm2(20, 20, 1, grid);
    for(double v: grid) combined += v;
    ut_assert(lua_obj, fabs((upper + lower) - combined) < (combined * 1e-9), "Split ranges sum to %lf, combined is %lf", upper + lower, combined);

    // 6) Identifiers are unique
    std::set<std::string> ids;
    for(int i = 0; i < 100; i++) ids.insert(GeoLib::getUUID());
    ut_assert(lua_obj, ids.size() == 100, "Duplicate identifiers: %ld", (long)ids.size());
    ut_assert(lua_obj, ids.begin()->size() == 36, "Unexpected identifier: %s", ids.begin()->c_str());

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testRasterIO
 *--------------------------------------------------------------------------------------*/
int UT_GeoLib::testRasterIO(lua_State* L)
{
    UT_GeoLib* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_GeoLib*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    const std::string fileName = "/vsimem/ut_geolib_" + GeoLib::getUUID() + ".tif";

    try
    {
        const double gt[6] = {-10.0, 0.5, 0.0, 20.0, 0.0, -0.5};
        const int32_t data[12] = { 1,  2,  3,  4,
                                   5,  6,  7,  8,
                                   9, 10, 11, 12 };
        std::vector<GdalRaster::rgba_t> palette;
        const GdalRaster::rgba_t red = {255, 0, 0, 255};
        const GdalRaster::rgba_t blue = {0, 0, 255, 255};
        palette.push_back(red);
        palette.push_back(blue);

        GdalRaster::writeRaster(fileName, GeoLib::GEOTIFF_DRIVER, 4, 3, gt, data, GDT_Byte, NULL, &palette);
        ut_assert(lua_obj, GdalRaster::exists(fileName), "Raster not created: %s", fileName.c_str());

        GdalRaster raster(fileName);
        raster.open();
        ut_assert(lua_obj, raster.getCols() == 4, "Unexpected columns: %d", raster.getCols());
        ut_assert(lua_obj, raster.getRows() == 3, "Unexpected rows: %d", raster.getRows());

        const GdalRaster::bbox_t& bbox = raster.getBbox();
        ut_assert(lua_obj, bbox.lon_min == -10.0 && bbox.lon_max == -8.0, "Unexpected longitude extent: %lf %lf", bbox.lon_min, bbox.lon_max);
        ut_assert(lua_obj, bbox.lat_max == 20.0 && bbox.lat_min == 18.5, "Unexpected latitude extent: %lf %lf", bbox.lat_min, bbox.lat_max);

        int32_t rows[8];
        raster.readRows(1, 2, rows);
        for(int i = 0; i < 8; i++)
        {
            ut_assert(lua_obj, rows[i] == data[4 + i], "Row read mismatch at %d: %d", i, rows[i]);
        }

        int32_t block[4];
        raster.readBlock(2, 1, 2, 2, block);
        ut_assert(lua_obj, block[0] == 7 && block[1] == 8 && block[2] == 11 && block[3] == 12,
                  "Block read mismatch: %d %d %d %d", block[0], block[1], block[2], block[3]);

        std::vector<GdalRaster::rgba_t> colors;
        ut_assert(lua_obj, raster.getPalette(colors), "Palette not found");
        ut_assert(lua_obj, colors.size() >= 2, "Unexpected palette size: %ld", (long)colors.size());
        if(colors.size() >= 2)
        {
            ut_assert(lua_obj, colors[0].r == 255 && colors[0].g == 0 && colors[0].b == 0, "Unexpected first color");
            ut_assert(lua_obj, colors[1].r == 0 && colors[1].g == 0 && colors[1].b == 255, "Unexpected second color");
        }

        // reading outside the raster is an error
        bool caught = false;
        try
        {
            raster.readBlock(3, 0, 2, 1, block);
        }
        catch(const RunTimeException&)
        {
            caught = true;
        }
        ut_assert(lua_obj, caught, "Read outside of raster did not fail");

        raster.close();
        ut_assert(lua_obj, !raster.isOpen(), "Raster still open");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    GeoLib::deleteDataset(fileName, GeoLib::GEOTIFF_DRIVER);
    ut_assert(lua_obj, !GdalRaster::exists(fileName), "Raster not deleted: %s", fileName.c_str());

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testCutline
 *--------------------------------------------------------------------------------------*/
int UT_GeoLib::testCutline(lua_State* L)
{
    UT_GeoLib* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_GeoLib*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    const std::string prefix = "/vsimem/ut_geolib_" + GeoLib::getUUID();
    const std::string srcFile = prefix + "_src.tif";
    const std::string maskFile = prefix + "_mask.shp";
    const std::string triangleFile = prefix + "_triangle.shp";
    const std::string clipFile = prefix + "_clip.tif";

    try
    {
        const double gt[6] = {0.0, 1.0, 0.0, 4.0, 0.0, -1.0};
        int32_t data[16];
        for(int i = 0; i < 16; i++) data[i] = i + 1;
        GdalRaster::writeRaster(srcFile, GeoLib::GEOTIFF_DRIVER, 4, 4, gt, data, GDT_Int32);

        OGRSpatialReference srs;
        srs.SetWellKnownGeogCS("WGS84");
        srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

        // top left quarter of the raster
        OGRPolygon quarter = GeoLib::makeRectangle(0.0, 2.0, 2.0, 4.0);
        GeoLib::writeFeatureLayer(maskFile, &quarter, &srs);

        GdalRaster src(srcFile);
        src.open();

        const bool clipped = GeoLib::warpToCutline(src.getDataset(), clipFile, maskFile, false);
        ut_assert(lua_obj, clipped, "Cutline produced no output");
        if(clipped)
        {
            GdalRaster clip(clipFile);
            clip.open();
            ut_assert(lua_obj, clip.getCols() == 2 && clip.getRows() == 2, "Unexpected clip size: %d x %d", clip.getCols(), clip.getRows());
            if(clip.getCols() == 2 && clip.getRows() == 2)
            {
                int32_t values[4];
                clip.readRows(0, 2, values);
                ut_assert(lua_obj, values[0] == 1 && values[1] == 2 && values[2] == 5 && values[3] == 6,
                          "Unexpected clip values: %d %d %d %d", values[0], values[1], values[2], values[3]);
            }
            clip.close();
        }

        GeoLib::deleteDataset(clipFile, GeoLib::GEOTIFF_DRIVER);

        // triangle whose slanted sides miss every pixel center
        OGRLinearRing ring;
        ring.addPoint(0.0, 0.0);
        ring.addPoint(4.0, 0.0);
        ring.addPoint(1.0, 4.0);
        ring.addPoint(0.0, 0.0);
        OGRPolygon triangle;
        triangle.addRing(&ring);
        GeoLib::writeFeatureLayer(triangleFile, &triangle, &srs);

        int kept[2] = {0, 0};
        for(int touched = 0; touched < 2; touched++)
        {
            const bool warped = GeoLib::warpToCutline(src.getDataset(), clipFile, triangleFile, touched == 1);
            ut_assert(lua_obj, warped, "Triangle cutline produced no output (touched=%d)", touched);
            if(!warped) continue;

            GdalRaster clip(clipFile);
            clip.open();
            ut_assert(lua_obj, clip.getCols() == 4 && clip.getRows() == 4, "Unexpected triangle clip size: %d x %d", clip.getCols(), clip.getRows());
            if(clip.getCols() == 4 && clip.getRows() == 4)
            {
                int32_t values[16];
                clip.readRows(0, 4, values);
                for(int i = 0; i < 16; i++)
                {
                    if(values[i] != 0) kept[touched]++;
                }
            }
            clip.close();
            GeoLib::deleteDataset(clipFile, GeoLib::GEOTIFF_DRIVER);
        }
        ut_assert(lua_obj, kept[0] > 0, "Pixel centers kept nothing");
        ut_assert(lua_obj, kept[1] > kept[0], "Touched pixels kept %d, centers kept %d", kept[1], kept[0]);
        ut_assert(lua_obj, kept[1] < 16, "Touched pixels kept the whole raster");

        // cutline off the raster
        const OGRPolygon outside = GeoLib::makeRectangle(10.0, 10.0, 12.0, 12.0);
        ut_assert(lua_obj, GeoLib::cutlineOverlaps(src.getDataset(), &quarter, &srs), "Quarter does not overlap the raster");
        ut_assert(lua_obj, GeoLib::cutlineOverlaps(src.getDataset(), &triangle, &srs), "Triangle does not overlap the raster");
        ut_assert(lua_obj, !GeoLib::cutlineOverlaps(src.getDataset(), &outside, &srs), "Outside rectangle overlaps the raster");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    GeoLib::deleteDataset(maskFile, GeoLib::SHAPEFILE_DRIVER);
    GeoLib::deleteDataset(triangleFile, GeoLib::SHAPEFILE_DRIVER);
    GeoLib::deleteDataset(clipFile, GeoLib::GEOTIFF_DRIVER);
    GeoLib::deleteDataset(srcFile, GeoLib::GEOTIFF_DRIVER);

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}
