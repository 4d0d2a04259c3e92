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

#include "UT_Aggregators.h"
#include "AreaAggregator.h"
#include "AreaExtractor.h"
#include "AreaParms.h"
#include "VectorClipAggregator.h"
#include "MaskBlockAggregator.h"
#include "AreaMatrix.h"
#include "ClassLookup.h"
#include "RegionLayer.h"
#include "RegionNames.h"
#include "ScratchDir.h"
#include "GdalRaster.h"
#include "GeoLib.h"
#include "UnitTest.h"
#include "StringLib.h"
#include "OsApi.h"

#include <gdal_priv.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <math.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_Aggregators::LUA_META_NAME = "UT_Aggregators";
const struct luaL_Reg UT_Aggregators::LUA_META_TABLE[] = {
    {"equator",     testEquator},
    {"sparse",      testSparse},
    {"order",       testOrder},
    {"nodata",      testNoData},
    {"names",       testNames},
    {"failures",    testFailures},
    {"empty",       testEmptyClip},
    {"touched",     testTouched},
    {"extractor",   testExtractor},
    {"ranges",      testRanges},
    {NULL,          NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/* 8 x 8 one degree grid spanning 0..8E, 4S..4N */
static const double GRID_GT[6] = {0.0, 1.0, 0.0, 4.0, 0.0, -1.0};
static const int    GRID_SIZE = 8;

/*----------------------------------------------------------------------------
 * testLookup - codes 1 and 2 are classes A and B, everything else is no-data
 *----------------------------------------------------------------------------*/
static DirectLookup testLookup (bool touched=false)
{
    DirectLookup::code_list_t codes;
    codes.push_back(std::make_pair(1, class_key_t("A")));
    codes.push_back(std::make_pair(2, class_key_t("B")));
    return DirectLookup("test", codes, touched);
}

/*----------------------------------------------------------------------------
 * near
 *----------------------------------------------------------------------------*/
static bool near (double a, double b)
{
    return fabs(a - b) <= 1e-6 * MAX(1.0, fabs(b));
}

/*----------------------------------------------------------------------------
 * sameMatrix
 *----------------------------------------------------------------------------*/
static bool sameMatrix (const AreaMatrix& a, const AreaMatrix& b)
{
    if(a.numRegions() != b.numRegions()) return false;

    const std::vector<AreaMatrix::row_t> rows = a.serialize();
    for(const AreaMatrix::row_t& row: rows)
    {
        if(!b.hasRegion(row.region)) return false;
        for(const class_key_t& key: a.getColumns())
        {
            if(!near(a.get(row.region, key), b.get(row.region, key))) return false;
        }
    }

    return true;
}

/*----------------------------------------------------------------------------
 * wgs84
 *----------------------------------------------------------------------------*/
static void wgs84 (OGRSpatialReference& srs)
{
    srs.SetWellKnownGeogCS("WGS84");
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
}

/*----------------------------------------------------------------------------
 * writeGrid - 8 x 8 source where value = (row * 8 + col) % 3
 *----------------------------------------------------------------------------*/
static void writeGrid (const std::string& fileName, int32_t zeroValue)
{
    std::vector<int32_t> data(GRID_SIZE * GRID_SIZE);
    for(int r = 0; r < GRID_SIZE; r++)
    {
        for(int c = 0; c < GRID_SIZE; c++)
        {
            const int32_t v = (r * GRID_SIZE + c) % 3;
            data[r * GRID_SIZE + c] = (v == 0) ? zeroValue : v;
        }
    }
    GdalRaster::writeRaster(fileName, GeoLib::GEOTIFF_DRIVER, GRID_SIZE, GRID_SIZE, GRID_GT, &data[0], GDT_Int32);
}

/*----------------------------------------------------------------------------
 * addQuadrants - four 4 x 4 degree features tiling the grid
 *----------------------------------------------------------------------------*/
static void addQuadrants (RegionLayer& layer, bool reversed, const char* sameName)
{
    const char* names[4] = {"NW", "NE", "SW", "SE"};
    const double corners[4][2] = {{0.0, 0.0}, {4.0, 0.0}, {0.0, -4.0}, {4.0, -4.0}};

    for(int n = 0; n < 4; n++)
    {
        const int i = reversed ? (3 - n) : n;
        const OGRPolygon rect = GeoLib::makeRectangle(corners[i][0], corners[i][1], corners[i][0] + 4.0, corners[i][1] + 4.0);
        layer.add(sameName ? sameName : names[i], names[i], &rect);
    }
}

/*----------------------------------------------------------------------------
 * writeSparseMask - tiled mask where only block (0,0) holds data
 *----------------------------------------------------------------------------*/
static void writeSparseMask (const std::string& fileName, int cols, int rows, const double* gt, int blksiz)
{
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(GeoLib::GEOTIFF_DRIVER);
    if(driver == NULL) throw RunTimeException(CRITICAL, RTE_ERROR, "GTiff driver not available");

    const std::string blkstr = StringLib::strfmt("%d", blksiz);
    char** options = NULL;
    options = CSLSetNameValue(options, "TILED", "YES");
    options = CSLSetNameValue(options, "BLOCKXSIZE", blkstr.c_str());
    options = CSLSetNameValue(options, "BLOCKYSIZE", blkstr.c_str());
    options = CSLSetNameValue(options, "SPARSE_OK", "TRUE");

    GDALDataset* dset = driver->Create(fileName.c_str(), cols, rows, 1, GDT_Byte, options);
    CSLDestroy(options);
    if(dset == NULL) throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to create mask: %s", fileName.c_str());

    std::vector<uint8_t> ones(blksiz * blksiz, 1);
    dset->SetGeoTransform(const_cast<double*>(gt));
    const CPLErr err = dset->GetRasterBand(1)->RasterIO(GF_Write, 0, 0, blksiz, blksiz, &ones[0], blksiz, blksiz, GDT_Byte, 0, 0, NULL);
    GDALClose(dset);

    if(err != CE_None) throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to write mask: %s", fileName.c_str());
}

/*----------------------------------------------------------------------------
 * countFiles
 *----------------------------------------------------------------------------*/
static int countFiles (const std::string& path)
{
    char** entries = VSIReadDir(path.c_str());
    int count = 0;
    for(int i = 0; entries && entries[i]; i++)
    {
        if(!StringLib::match(entries[i], ".") && !StringLib::match(entries[i], "..")) count++;
    }
    CSLDestroy(entries);
    return count;
}

/*----------------------------------------------------------------------------
 * pushDataset - appends one dataset entry to the list on top of the stack
 *----------------------------------------------------------------------------*/
static void pushDataset (lua_State* L, int entry, const std::string& raster, const char* output, const char* lookup, bool optional=false)
{
    lua_newtable(L);
    lua_pushstring(L, raster.c_str());
    lua_setfield(L, -2, AreaParms::RASTER);
    lua_pushstring(L, output);
    lua_setfield(L, -2, AreaParms::OUTPUT);
    lua_pushstring(L, lookup);
    lua_setfield(L, -2, AreaParms::LOOKUP);
    lua_pushboolean(L, optional);
    lua_setfield(L, -2, AreaParms::OPTIONAL);
    lua_rawseti(L, -2, entry);
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate -
 *----------------------------------------------------------------------------*/
int UT_Aggregators::luaCreate (lua_State* L)
{
    try
    {
        /* Create Unit Test */
        return createLuaObject(L, new UT_Aggregators(L));
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
UT_Aggregators::UT_Aggregators (lua_State* L):
    UnitTest(L, LUA_META_NAME, LUA_META_TABLE)
{
}

/*--------------------------------------------------------------------------------------
 * testEquator
 *
 *  2 x 2 one degree raster straddling the equator, both aggregation paths
 *--------------------------------------------------------------------------------------*/
int UT_Aggregators::testEquator(lua_State* L)
{
    UT_Aggregators* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Aggregators*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        const ScratchDir scratch("ut-equator");
        const DirectLookup lookup = testLookup();

        const double gt[6] = {0.0, 1.0, 0.0, 1.0, 0.0, -1.0};
        const int32_t values[4] = {1, 1, 2, 2};
        const int32_t ones[4] = {1, 1, 1, 1};
        const std::string srcFile = scratch.file("equator.tif");
        GdalRaster::writeRaster(srcFile, GeoLib::GEOTIFF_DRIVER, 2, 2, gt, values, GDT_Int32);
        GdalRaster::writeRaster(scratch.file("EQU_0_1km_mask.tif"), GeoLib::GEOTIFF_DRIVER, 2, 2, gt, ones, GDT_Byte);

        OGRSpatialReference srs;
        wgs84(srs);
        const RegionNames names;
        RegionLayer layer(names);
        layer.setSpatialRef(&srs);
        const OGRPolygon rect = GeoLib::makeRectangle(0.0, -1.0, 2.0, 1.0);
        layer.add("Equatoria", "EQU", &rect);

        const double expected = 2.0 * GeoLib::pixelKm2(0.5 * M_PI / 180.0, 1.0, -1.0);

        // 1) Vector clip path
        AreaMatrix clipped(lookup.columns());
        VectorClipAggregator clipper(srcFile, &lookup, scratch);
        clipper.aggregate(layer, clipped);
        ut_assert(lua_obj, clipped.numRegions() == 1, "Unexpected number of regions: %d", clipped.numRegions());
        ut_assert(lua_obj, near(clipped.get("Equatoria", "A"), expected), "Clip A is %lf, expected %lf", clipped.get("Equatoria", "A"), expected);
        ut_assert(lua_obj, near(clipped.get("Equatoria", "B"), expected), "Clip B is %lf, expected %lf", clipped.get("Equatoria", "B"), expected);
        ut_assert(lua_obj, clipper.getStats().processed == 1, "Unexpected processed count: %ld", clipper.getStats().processed);

        // 2) Clip files are removed once the feature is done
        ut_assert(lua_obj, !GdalRaster::exists(scratch.file("EQU_0_feature.tif")), "Clip raster left behind");
        ut_assert(lua_obj, !GdalRaster::exists(scratch.file("EQU_0_feature_mask.shp")), "Cutline shapefile left behind");

        // 3) Mask block path
        AreaMatrix masked(lookup.columns());
        MaskBlockAggregator blocker(srcFile, &lookup, scratch.getPath());
        blocker.aggregate(layer, masked);
        ut_assert(lua_obj, near(masked.get("Equatoria", "A"), expected), "Mask A is %lf, expected %lf", masked.get("Equatoria", "A"), expected);
        ut_assert(lua_obj, near(masked.get("Equatoria", "B"), expected), "Mask B is %lf, expected %lf", masked.get("Equatoria", "B"), expected);

        // 4) Both paths agree
        ut_assert(lua_obj, sameMatrix(clipped, masked), "Clip and mask paths disagree");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testSparse
 *
 *  Skipping sparse mask blocks must not change the result
 *--------------------------------------------------------------------------------------*/
int UT_Aggregators::testSparse(lua_State* L)
{
    UT_Aggregators* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Aggregators*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        const ScratchDir scratch("ut-sparse");
        const DirectLookup lookup = testLookup();

        const int size = 32;
        const int blksiz = 16;
        const double gt[6] = {10.0, 0.25, 0.0, 40.0, 0.0, -0.25};

        /* Checkerboard of A and B, tiled like the mask */
        std::vector<int32_t> values(size * size);
        for(int r = 0; r < size; r++)
        {
            for(int c = 0; c < size; c++)
            {
                values[r * size + c] = ((r + c) % 2) + 1;
            }
        }

        char** options = NULL;
        options = CSLSetNameValue(options, "TILED", "YES");
        options = CSLSetNameValue(options, "BLOCKXSIZE", "16");
        options = CSLSetNameValue(options, "BLOCKYSIZE", "16");
        const std::string srcFile = scratch.file("checker.tif");
        try
        {
            GdalRaster::writeRaster(srcFile, GeoLib::GEOTIFF_DRIVER, size, size, gt, &values[0], GDT_Int32, options);
        }
        catch(const RunTimeException&)
        {
            CSLDestroy(options);
            throw;
        }
        CSLDestroy(options);

        writeSparseMask(scratch.file("SPR_0_1km_mask.tif"), size, size, gt, blksiz);

        OGRSpatialReference srs;
        wgs84(srs);
        const RegionNames names;
        RegionLayer layer(names);
        layer.setSpatialRef(&srs);
        const OGRPolygon rect = GeoLib::makeRectangle(10.0, 36.0, 14.0, 40.0);
        layer.add("Sparsia", "SPR", &rect);

        /* Half of each of the 16 rows of the top left block is A */
        const GeoLib::PixelArea area(gt);
        double expected = 0.0;
        for(int r = 0; r < blksiz; r++) expected += (blksiz / 2) * area.rowKm2(r);

        // 1) Skipping sparse blocks
        AreaMatrix skipped(lookup.columns());
        MaskBlockAggregator skipper(srcFile, &lookup, scratch.getPath(), true);
        skipper.aggregate(layer, skipped);
        ut_assert(lua_obj, skipper.getBlocksRead() == 1, "Unexpected blocks read: %ld", skipper.getBlocksRead());
        ut_assert(lua_obj, skipper.getBlocksSkipped() == 3, "Unexpected blocks skipped: %ld", skipper.getBlocksSkipped());
        ut_assert(lua_obj, near(skipped.get("Sparsia", "A"), expected), "A is %lf, expected %lf", skipped.get("Sparsia", "A"), expected);
        ut_assert(lua_obj, near(skipped.get("Sparsia", "B"), expected), "B is %lf, expected %lf", skipped.get("Sparsia", "B"), expected);

        // 2) Reading every block
        AreaMatrix full(lookup.columns());
        MaskBlockAggregator reader(srcFile, &lookup, scratch.getPath(), false);
        reader.aggregate(layer, full);
        ut_assert(lua_obj, reader.getBlocksRead() == 4, "Unexpected blocks read: %ld", reader.getBlocksRead());
        ut_assert(lua_obj, reader.getBlocksSkipped() == 0, "Unexpected blocks skipped: %ld", reader.getBlocksSkipped());
        ut_assert(lua_obj, sameMatrix(skipped, full), "Skipping sparse blocks changed the result");

        // 3) Edge block sizes
        ut_assert(lua_obj, MaskBlockAggregator::blklim(0, 16, 40) == 16, "Unexpected interior block size");
        ut_assert(lua_obj, MaskBlockAggregator::blklim(32, 16, 40) == 8, "Unexpected edge block size");
        ut_assert(lua_obj, MaskBlockAggregator::blklim(16, 16, 32) == 16, "Unexpected final block size");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testOrder
 *
 *  Feature order, thread count and splitting a region do not change the totals
 *--------------------------------------------------------------------------------------*/
int UT_Aggregators::testOrder(lua_State* L)
{
    UT_Aggregators* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Aggregators*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        const ScratchDir scratch("ut-order");
        const DirectLookup lookup = testLookup();
        const std::string srcFile = scratch.file("grid.tif");
        writeGrid(srcFile, 0);

        OGRSpatialReference srs;
        wgs84(srs);
        const RegionNames names;

        RegionLayer forward(names);
        forward.setSpatialRef(&srs);
        addQuadrants(forward, false, NULL);

        RegionLayer backward(names);
        backward.setSpatialRef(&srs);
        addQuadrants(backward, true, NULL);

        // 1) Forward and reversed feature order
        AreaMatrix m1(lookup.columns());
        VectorClipAggregator a1(srcFile, &lookup, scratch);
        a1.aggregate(forward, m1);

        AreaMatrix m2(lookup.columns());
        VectorClipAggregator a2(srcFile, &lookup, scratch);
        a2.aggregate(backward, m2);

        ut_assert(lua_obj, m1.numRegions() == 4, "Unexpected number of regions: %d", m1.numRegions());
        ut_assert(lua_obj, sameMatrix(m1, m2), "Feature order changed the result");

        // 2) One thread versus three
        AreaMatrix m3(lookup.columns());
        VectorClipAggregator a3(srcFile, &lookup, scratch, 3);
        a3.aggregate(forward, m3);
        ut_assert(lua_obj, a3.getNumThreads() == 3, "Unexpected number of threads: %d", a3.getNumThreads());
        ut_assert(lua_obj, a3.getStats().processed == 4, "Unexpected processed count: %ld", a3.getStats().processed);
        ut_assert(lua_obj, sameMatrix(m1, m3), "Thread count changed the result");

        // 3) Region split over four features equals the whole
        RegionLayer split(names);
        split.setSpatialRef(&srs);
        addQuadrants(split, false, "Whole");

        RegionLayer whole(names);
        whole.setSpatialRef(&srs);
        const OGRPolygon rect = GeoLib::makeRectangle(0.0, -4.0, 8.0, 4.0);
        whole.add("Whole", "WHL", &rect);

        AreaMatrix m4(lookup.columns());
        VectorClipAggregator a4(srcFile, &lookup, scratch, 2);
        a4.aggregate(split, m4);

        AreaMatrix m5(lookup.columns());
        VectorClipAggregator a5(srcFile, &lookup, scratch);
        a5.aggregate(whole, m5);

        ut_assert(lua_obj, m4.numRegions() == 1, "Split region produced %d rows", m4.numRegions());
        ut_assert(lua_obj, sameMatrix(m4, m5), "Split region does not add up to the whole");

        // 4) Quadrant totals add up to the whole
        const char* quadrants[4] = {"NW", "NE", "SW", "SE"};
        for(const class_key_t& key: lookup.columns())
        {
            double sum = 0.0;
            for(int i = 0; i < 4; i++) sum += m1.get(quadrants[i], key);
            ut_assert(lua_obj, near(sum, m5.get("Whole", key)), "Quadrants of %s sum to %lf, whole is %lf", key.c_str(), sum, m5.get("Whole", key));
        }
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testNoData
 *
 *  Zero and unmapped codes contribute nothing
 *--------------------------------------------------------------------------------------*/
int UT_Aggregators::testNoData(lua_State* L)
{
    UT_Aggregators* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Aggregators*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        const ScratchDir scratch("ut-nodata");
        const DirectLookup lookup = testLookup();

        const std::string zeroFile = scratch.file("zero.tif");
        const std::string unmappedFile = scratch.file("unmapped.tif");
        writeGrid(zeroFile, 0);
        writeGrid(unmappedFile, 99);

        OGRSpatialReference srs;
        wgs84(srs);
        const RegionNames names;
        RegionLayer layer(names);
        layer.setSpatialRef(&srs);
        addQuadrants(layer, false, NULL);

        // 1) No-data value and unmapped code give the same matrix
        AreaMatrix m1(lookup.columns());
        VectorClipAggregator a1(zeroFile, &lookup, scratch);
        a1.aggregate(layer, m1);

        AreaMatrix m2(lookup.columns());
        VectorClipAggregator a2(unmappedFile, &lookup, scratch);
        a2.aggregate(layer, m2);

        ut_assert(lua_obj, sameMatrix(m1, m2), "Unmapped code changed the result");

        // 2) An all no-data raster still produces zero rows for each region
        const int32_t empty[GRID_SIZE * GRID_SIZE] = {0};
        const std::string emptyFile = scratch.file("empty.tif");
        GdalRaster::writeRaster(emptyFile, GeoLib::GEOTIFF_DRIVER, GRID_SIZE, GRID_SIZE, GRID_GT, empty, GDT_Int32);

        AreaMatrix m3(lookup.columns());
        VectorClipAggregator a3(emptyFile, &lookup, scratch);
        a3.aggregate(layer, m3);
        ut_assert(lua_obj, m3.numRegions() == 4, "Unexpected number of regions: %d", m3.numRegions());
        ut_assert(lua_obj, m3.total("NW") == 0.0, "No-data raster accumulated %lf", m3.total("NW"));
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testNames
 *
 *  Unresolved and excluded features are skipped, aliases share one row
 *--------------------------------------------------------------------------------------*/
int UT_Aggregators::testNames(lua_State* L)
{
    UT_Aggregators* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Aggregators*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        const ScratchDir scratch("ut-names");
        const DirectLookup lookup = testLookup();
        const std::string srcFile = scratch.file("grid.tif");
        writeGrid(srcFile, 0);

        RegionNames names;
        names.addAlias("United States of America", "United States");
        names.addAlias("USA", "United States");
        names.addExclusion("Antarctica");

        OGRSpatialReference srs;
        wgs84(srs);
        RegionLayer layer(names);
        layer.setSpatialRef(&srs);

        const OGRPolygon rect = GeoLib::makeRectangle(0.0, 0.0, 4.0, 4.0);
        layer.add("France", "FRA", &rect);
        layer.add(NULL, "UNK", &rect);
        layer.add("Antarctica", "ATA", &rect);
        layer.add("United States of America", "USA", &rect);
        layer.add("USA", "USA", &rect);

        ut_assert(lua_obj, layer.numResolved() == 3, "Unexpected number of resolved features: %d", layer.numResolved());

        AreaMatrix matrix(lookup.columns());
        VectorClipAggregator aggregator(srcFile, &lookup, scratch, 2);
        aggregator.aggregate(layer, matrix);

        // 1) Only resolved regions have rows
        ut_assert(lua_obj, matrix.numRegions() == 2, "Unexpected number of regions: %d", matrix.numRegions());
        ut_assert(lua_obj, matrix.hasRegion("France"), "Missing France");
        ut_assert(lua_obj, matrix.hasRegion("United States"), "Missing United States");
        ut_assert(lua_obj, !matrix.hasRegion("Antarctica"), "Excluded region has a row");
        ut_assert(lua_obj, !matrix.hasRegion("USA"), "Alias has its own row");

        // 2) Two aliased features over the same area double the total
        const double france = matrix.total("France");
        ut_assert(lua_obj, france > 0.0, "France accumulated nothing");
        ut_assert(lua_obj, near(matrix.total("United States"), 2.0 * france), "United States is %lf, expected %lf", matrix.total("United States"), 2.0 * france);

        // 3) Stats
        const AreaAggregator::stats_t& stats = aggregator.getStats();
        ut_assert(lua_obj, stats.processed == 3, "Unexpected processed count: %ld", stats.processed);
        ut_assert(lua_obj, stats.unresolved == 2, "Unexpected unresolved count: %ld", stats.unresolved);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testFailures
 *--------------------------------------------------------------------------------------*/
int UT_Aggregators::testFailures(lua_State* L)
{
    UT_Aggregators* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Aggregators*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        const ScratchDir scratch("ut-failures");
        const DirectLookup lookup = testLookup();
        const std::string srcFile = scratch.file("grid.tif");
        writeGrid(srcFile, 0);

        OGRSpatialReference srs;
        wgs84(srs);
        const RegionNames names;
        RegionLayer layer(names);
        layer.setSpatialRef(&srs);
        addQuadrants(layer, false, NULL);

        // 1) Missing mask, single thread
        int code = RTE_INFO;
        try
        {
            AreaMatrix matrix(lookup.columns());
            MaskBlockAggregator aggregator(srcFile, &lookup, scratch.getPath());
            aggregator.aggregate(layer, matrix);
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(lua_obj, code == RTE_RESOURCE_DOES_NOT_EXIST, "Unexpected error code for missing mask: %d", code);

        // 2) Missing mask in a worker is rethrown after the join and nothing is merged
        code = RTE_INFO;
        AreaMatrix threaded(lookup.columns());
        try
        {
            MaskBlockAggregator aggregator(srcFile, &lookup, scratch.getPath(), true, 4);
            aggregator.aggregate(layer, threaded);
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(lua_obj, code == RTE_RESOURCE_DOES_NOT_EXIST, "Unexpected error code from workers: %d", code);
        ut_assert(lua_obj, threaded.numRegions() == 0, "Failed aggregation merged %d regions", threaded.numRegions());

        // 3) Mask with the wrong dimensions
        const int32_t ones[4] = {1, 1, 1, 1};
        GdalRaster::writeRaster(scratch.file("NW_0_1km_mask.tif"), GeoLib::GEOTIFF_DRIVER, 2, 2, GRID_GT, ones, GDT_Byte);
        code = RTE_INFO;
        try
        {
            AreaMatrix matrix(lookup.columns());
            MaskBlockAggregator aggregator(srcFile, &lookup, scratch.getPath());
            aggregator.aggregate(layer, matrix);
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(lua_obj, code == RTE_ERROR, "Unexpected error code for mismatched mask: %d", code);

        // 4) Mask of the right size on a shifted grid
        const std::vector<int32_t> full(GRID_SIZE * GRID_SIZE, 1);
        const double shifted[6] = {GRID_GT[0] + 0.5, GRID_GT[1], GRID_GT[2], GRID_GT[3], GRID_GT[4], GRID_GT[5]};
        GdalRaster::writeRaster(scratch.file("NW_0_1km_mask.tif"), GeoLib::GEOTIFF_DRIVER, GRID_SIZE, GRID_SIZE, shifted, &full[0], GDT_Byte);
        code = RTE_INFO;
        try
        {
            AreaMatrix matrix(lookup.columns());
            MaskBlockAggregator aggregator(srcFile, &lookup, scratch.getPath());
            aggregator.aggregate(layer, matrix);
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(lua_obj, code == RTE_ERROR, "Unexpected error code for shifted mask: %d", code);

        // 5) Same mask on the source grid is accepted, the next region's mask is missing
        GdalRaster::writeRaster(scratch.file("NW_0_1km_mask.tif"), GeoLib::GEOTIFF_DRIVER, GRID_SIZE, GRID_SIZE, GRID_GT, &full[0], GDT_Byte);
        code = RTE_INFO;
        try
        {
            AreaMatrix matrix(lookup.columns());
            MaskBlockAggregator aggregator(srcFile, &lookup, scratch.getPath());
            aggregator.aggregate(layer, matrix);
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(lua_obj, code == RTE_RESOURCE_DOES_NOT_EXIST, "Aligned mask was rejected: %d", code);

        // 6) Missing source raster
        code = RTE_INFO;
        try
        {
            AreaMatrix matrix(lookup.columns());
            VectorClipAggregator aggregator(scratch.file("missing.tif"), &lookup, scratch);
            aggregator.aggregate(layer, matrix);
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(lua_obj, code == RTE_RESOURCE_DOES_NOT_EXIST, "Unexpected error code for missing source raster: %d", code);

        // 7) Matrix columns must match the lookup
        bool failed = false;
        try
        {
            std::vector<class_key_t> other;
            other.push_back("X");
            AreaMatrix matrix(other);
            VectorClipAggregator aggregator(srcFile, &lookup, scratch);
            aggregator.aggregate(layer, matrix);
        }
        catch(const RunTimeException&)
        {
            failed = true;
        }
        ut_assert(lua_obj, failed, "Mismatched columns did not fail");

        // 8) Thread count limits
        code = RTE_INFO;
        try
        {
            VectorClipAggregator aggregator(srcFile, &lookup, scratch, AreaAggregator::MAX_THREADS + 1);
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(lua_obj, code == RTE_INVALID_CONFIG, "Unexpected error code for too many threads: %d", code);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testEmptyClip
 *
 *  A region off the raster keeps a zero row and leaves no clip files behind
 *--------------------------------------------------------------------------------------*/
int UT_Aggregators::testEmptyClip(lua_State* L)
{
    UT_Aggregators* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Aggregators*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        const ScratchDir scratch("ut-empty");
        const DirectLookup lookup = testLookup();
        const std::string srcFile = scratch.file("grid.tif");
        writeGrid(srcFile, 0);

        OGRSpatialReference srs;
        wgs84(srs);
        const RegionNames names;
        RegionLayer layer(names);
        layer.setSpatialRef(&srs);

        const OGRPolygon inland = GeoLib::makeRectangle(0.0, 0.0, 4.0, 4.0);
        const OGRPolygon offshore = GeoLib::makeRectangle(20.0, 20.0, 24.0, 24.0);
        layer.add("Inland", "INL", &inland);
        layer.add("Offshore", "OFF", &offshore);

        // 1) Envelope check
        GdalRaster src(srcFile);
        src.open();
        ut_assert(lua_obj, GeoLib::cutlineOverlaps(src.getDataset(), &inland, &srs), "Inland region does not overlap the raster");
        ut_assert(lua_obj, !GeoLib::cutlineOverlaps(src.getDataset(), &offshore, &srs), "Offshore region overlaps the raster");
        src.close();

        // 2) Both threading modes skip the empty region
        for(int threads = 1; threads <= 2; threads++)
        {
            AreaMatrix matrix(lookup.columns());
            VectorClipAggregator aggregator(srcFile, &lookup, scratch, threads);
            aggregator.aggregate(layer, matrix);

            ut_assert(lua_obj, matrix.numRegions() == 2, "Unexpected number of regions with %d thread(s): %d", threads, matrix.numRegions());
            ut_assert(lua_obj, matrix.hasRegion("Offshore"), "Empty region has no row with %d thread(s)", threads);
            ut_assert(lua_obj, matrix.total("Offshore") == 0.0, "Empty region accumulated %lf", matrix.total("Offshore"));
            ut_assert(lua_obj, matrix.total("Inland") > 0.0, "Inland region accumulated nothing");
            ut_assert(lua_obj, aggregator.getStats().processed == 1, "Unexpected processed count: %ld", aggregator.getStats().processed);
            ut_assert(lua_obj, aggregator.getStats().skipped == 1, "Unexpected skipped count: %ld", aggregator.getStats().skipped);
        }

        // 3) Only the source raster is left in scratch space
        ut_assert(lua_obj, !GdalRaster::exists(scratch.file("OFF_1_feature.tif")), "Clip raster left behind");
        ut_assert(lua_obj, !GdalRaster::exists(scratch.file("OFF_1_feature_mask.shp")), "Cutline shapefile left behind");
        ut_assert(lua_obj, countFiles(scratch.getPath()) == 1, "Unexpected files in scratch: %d", countFiles(scratch.getPath()));
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testTouched
 *
 *  Including every touched pixel credits more area to a slanted region
 *--------------------------------------------------------------------------------------*/
int UT_Aggregators::testTouched(lua_State* L)
{
    UT_Aggregators* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Aggregators*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    try
    {
        const ScratchDir scratch("ut-touched");
        const DirectLookup centers = testLookup(false);
        const DirectLookup touched = testLookup(true);

        const std::vector<int32_t> ones(GRID_SIZE * GRID_SIZE, 1);
        const std::string srcFile = scratch.file("flat.tif");
        GdalRaster::writeRaster(srcFile, GeoLib::GEOTIFF_DRIVER, GRID_SIZE, GRID_SIZE, GRID_GT, &ones[0], GDT_Int32);

        OGRSpatialReference srs;
        wgs84(srs);
        const RegionNames names;
        RegionLayer layer(names);
        layer.setSpatialRef(&srs);

        /* Slanted sides cross pixels without passing through any pixel center */
        OGRLinearRing ring;
        ring.addPoint(0.0, -4.0);
        ring.addPoint(8.0, -4.0);
        ring.addPoint(2.0, 4.0);
        ring.addPoint(0.0, -4.0);
        OGRPolygon triangle;
        triangle.addRing(&ring);
        layer.add("Wedge", "WDG", &triangle);

        AreaMatrix m1(centers.columns());
        VectorClipAggregator a1(srcFile, &centers, scratch);
        a1.aggregate(layer, m1);

        AreaMatrix m2(touched.columns());
        VectorClipAggregator a2(srcFile, &touched, scratch);
        a2.aggregate(layer, m2);

        const double inside = m1.get("Wedge", "A");
        const double all = m2.get("Wedge", "A");
        ut_assert(lua_obj, inside > 0.0, "Pixel centers accumulated nothing");
        ut_assert(lua_obj, all > inside, "Touched pixels gave %lf, centers gave %lf", all, inside);

        /* Whole raster is the upper bound */
        double raster = 0.0;
        const GeoLib::PixelArea area(GRID_GT);
        for(int r = 0; r < GRID_SIZE; r++) raster += GRID_SIZE * area.rowKm2(r);
        ut_assert(lua_obj, all < raster, "Touched pixels gave %lf, whole raster is %lf", all, raster);
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testExtractor
 *
 *  Failed datasets are counted and the run goes on, a missing input stops it
 *--------------------------------------------------------------------------------------*/
int UT_Aggregators::testExtractor(lua_State* L)
{
    UT_Aggregators* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Aggregators*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    const int top = lua_gettop(L);

    try
    {
        const ScratchDir scratch("ut-extractor");
        const std::string srcFile = scratch.file("grid.tif");
        const std::string missingFile = scratch.file("missing.tif");
        const std::string boundsFile = scratch.file("bounds.shp");
        const std::string results = scratch.file("results");
        writeGrid(srcFile, 0);

        OGRSpatialReference srs;
        wgs84(srs);
        const OGRPolygon rect = GeoLib::makeRectangle(0.0, 0.0, 4.0, 4.0);
        GeoLib::writeFeatureLayer(boundsFile, &rect, &srs);

        /* Configuration table */
        lua_newtable(L);
        lua_pushstring(L, boundsFile.c_str());
        lua_setfield(L, -2, AreaParms::BOUNDARIES);
        lua_pushstring(L, results.c_str());
        lua_setfield(L, -2, AreaParms::RESULTS);
        lua_newtable(L);
        {
            lua_newtable(L);
            pushDataset(L, 1, srcFile, "slope.csv", ClassLookup::SLOPE);
            lua_setfield(L, -2, AreaParms::SLOPE_FLAG);

            /* grid has no color table */
            lua_newtable(L);
            pushDataset(L, 1, srcFile, "nopalette.csv", ClassLookup::KG);
            pushDataset(L, 2, srcFile, "kept.csv", ClassLookup::SLOPE);
            lua_setfield(L, -2, AreaParms::KOPPEN_GEIGER_FLAG);

            lua_newtable(L);
            pushDataset(L, 1, missingFile, "optional.csv", ClassLookup::SLOPE, true);
            pushDataset(L, 2, srcFile, "after.csv", ClassLookup::SLOPE);
            lua_setfield(L, -2, AreaParms::WORKABILITY_FLAG);

            lua_newtable(L);
            pushDataset(L, 1, missingFile, "first.csv", ClassLookup::SLOPE);
            pushDataset(L, 2, srcFile, "second.csv", ClassLookup::SLOPE);
            lua_setfield(L, -2, AreaParms::LAND_COVER_FLAG);
        }
        lua_setfield(L, -2, AreaParms::DATASETS);

        const AreaParms parms(L, lua_gettop(L));
        lua_settop(L, top);

        AreaExtractor extractor(parms);
        const std::string csv = results + PATH_DELIMETER_STR;

        // 1) One good dataset
        int errors = extractor.run(AreaParms::SLOPE_FLAG);
        ut_assert(lua_obj, errors == 0, "Unexpected errors: %d", errors);
        ut_assert(lua_obj, GdalRaster::exists(csv + "slope.csv"), "Missing slope.csv");

        // 2) A dataset that fails to classify is counted and the next one runs
        errors = extractor.run(AreaParms::KOPPEN_GEIGER_FLAG);
        ut_assert(lua_obj, errors == 1, "Unexpected errors: %d", errors);
        ut_assert(lua_obj, !GdalRaster::exists(csv + "nopalette.csv"), "Failed dataset wrote a csv");
        ut_assert(lua_obj, GdalRaster::exists(csv + "kept.csv"), "Dataset after a failure did not run");

        // 3) Missing optional raster is skipped quietly
        errors = extractor.run(AreaParms::WORKABILITY_FLAG);
        ut_assert(lua_obj, errors == 0, "Unexpected errors: %d", errors);
        ut_assert(lua_obj, !GdalRaster::exists(csv + "optional.csv"), "Skipped dataset wrote a csv");
        ut_assert(lua_obj, GdalRaster::exists(csv + "after.csv"), "Dataset after a skipped one did not run");

        // 4) Every dataset shares the one scratch directory and leaves it empty
        const std::string scratchPath = extractor.getScratch().getPath();
        ut_assert(lua_obj, GdalRaster::exists(scratchPath), "Scratch directory removed between datasets");
        ut_assert(lua_obj, countFiles(scratchPath) == 0, "Clip files left in scratch: %d", countFiles(scratchPath));

        // 5) Missing required raster stops the run
        int code = RTE_INFO;
        try
        {
            extractor.run(AreaParms::LAND_COVER_FLAG);
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(lua_obj, code == RTE_RESOURCE_DOES_NOT_EXIST, "Unexpected error code for missing raster: %d", code);
        ut_assert(lua_obj, !GdalRaster::exists(csv + "first.csv"), "Missing raster wrote a csv");
        ut_assert(lua_obj, !GdalRaster::exists(csv + "second.csv"), "Dataset after a missing raster was attempted");

        // 6) Missing boundary file stops the run
        lua_newtable(L);
        lua_pushstring(L, scratch.file("missing.shp").c_str());
        lua_setfield(L, -2, AreaParms::BOUNDARIES);
        lua_pushstring(L, results.c_str());
        lua_setfield(L, -2, AreaParms::RESULTS);
        lua_newtable(L);
        lua_newtable(L);
        pushDataset(L, 1, srcFile, "noregions.csv", ClassLookup::SLOPE);
        lua_setfield(L, -2, AreaParms::SLOPE_FLAG);
        lua_setfield(L, -2, AreaParms::DATASETS);

        const AreaParms noBounds(L, lua_gettop(L));
        lua_settop(L, top);

        code = RTE_INFO;
        try
        {
            AreaExtractor other(noBounds);
            other.run(AreaParms::SLOPE_FLAG);
        }
        catch(const RunTimeException& e)
        {
            code = e.code();
        }
        ut_assert(lua_obj, code == RTE_RESOURCE_DOES_NOT_EXIST, "Unexpected error code for missing boundaries: %d", code);
        ut_assert(lua_obj, !GdalRaster::exists(csv + "noregions.csv"), "Missing boundaries wrote a csv");
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    lua_settop(L, top);

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testRanges
 *--------------------------------------------------------------------------------------*/
int UT_Aggregators::testRanges(lua_State* L)
{
    UT_Aggregators* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_Aggregators*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    std::vector<AreaAggregator::range_t> ranges;

    // 1) Remainder goes to the first ranges
    AreaAggregator::getThreadsRanges(ranges, 10, 1, 3);
    ut_assert(lua_obj, ranges.size() == 3, "Unexpected number of ranges: %ld", (long)ranges.size());
    if(ranges.size() == 3)
    {
        ut_assert(lua_obj, ranges[0].start == 0 && ranges[0].end == 4, "Unexpected range 0: %u-%u", ranges[0].start, ranges[0].end);
        ut_assert(lua_obj, ranges[1].start == 4 && ranges[1].end == 7, "Unexpected range 1: %u-%u", ranges[1].start, ranges[1].end);
        ut_assert(lua_obj, ranges[2].start == 7 && ranges[2].end == 10, "Unexpected range 2: %u-%u", ranges[2].start, ranges[2].end);
    }

    // 2) Never more ranges than features
    AreaAggregator::getThreadsRanges(ranges, 2, 1, 8);
    ut_assert(lua_obj, ranges.size() == 2, "Unexpected number of ranges: %ld", (long)ranges.size());

    // 3) Single thread covers everything
    AreaAggregator::getThreadsRanges(ranges, 5, 1, 1);
    ut_assert(lua_obj, ranges.size() == 1 && ranges[0].start == 0 && ranges[0].end == 5, "Unexpected single range");

    // 4) Empty layer
    AreaAggregator::getThreadsRanges(ranges, 0, 1, 4);
    ut_assert(lua_obj, ranges.size() == 1 && ranges[0].start == 0 && ranges[0].end == 0, "Unexpected empty range");

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}
