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

#include "UT_ClassLookup.h"
#include "ClassLookup.h"
#include "ClassTables.h"
#include "RegionNames.h"
#include "GeoLib.h"
#include "UnitTest.h"
#include "OsApi.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_ClassLookup::LUA_META_NAME = "UT_ClassLookup";
const struct luaL_Reg UT_ClassLookup::LUA_META_TABLE[] = {
    {"palette",     testPalette},
    {"tables",      testTables},
    {"factory",     testFactory},
    {"names",       testRegionNames},
    {NULL,          NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * testPaletteColors - black, Af, white, ET, unknown
 *----------------------------------------------------------------------------*/
static std::vector<GdalRaster::rgba_t> testPaletteColors (void)
{
    const GdalRaster::rgba_t colors[] = {
        {  0,   0,   0, 255},
        {  0,   0, 255, 255},
        {255, 255, 255, 255},
        {178, 178, 178, 255},
        {  1,   2,   3, 255}
    };
    return std::vector<GdalRaster::rgba_t>(colors, colors + 5);
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate -
 *----------------------------------------------------------------------------*/
int UT_ClassLookup::luaCreate (lua_State* L)
{
    try
    {
        /* Create Unit Test */
        return createLuaObject(L, new UT_ClassLookup(L));
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
UT_ClassLookup::UT_ClassLookup (lua_State* L):
    UnitTest(L, LUA_META_NAME, LUA_META_TABLE)
{
}

/*--------------------------------------------------------------------------------------
 * testPalette
 *--------------------------------------------------------------------------------------*/
int UT_ClassLookup::testPalette(lua_State* L)
{
    UT_ClassLookup* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_ClassLookup*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    const PaletteLookup lookup(ClassLookup::KG, testPaletteColors(), true);
    class_key_t key;

    // 1) Columns are the full legend, in legend order
    ut_assert(lua_obj, (int)lookup.columns().size() == ClassTables::NUM_KG_COLORS, "Unexpected number of columns: %ld", (long)lookup.columns().size());
    ut_assert(lua_obj, lookup.columns().front() == "Af", "Unexpected first column: %s", lookup.columns().front().c_str());
    ut_assert(lua_obj, lookup.columns().back() == "EF", "Unexpected last column: %s", lookup.columns().back().c_str());
    ut_assert(lua_obj, lookup.allTouched(), "Palette lookup should include touched pixels");

    // 2) Known colors resolve
    ut_assert(lua_obj, lookup.classify(1, key) && key == "Af", "Index 1 did not resolve to Af");
    ut_assert(lua_obj, lookup.classify(3, key) && key == "ET", "Index 3 did not resolve to ET");

    // 3) Masked, unknown and out of range entries are no-data
    ut_assert(lua_obj, !lookup.classify(0, key), "Black resolved to %s", key.c_str());
    ut_assert(lua_obj, !lookup.classify(2, key), "White resolved to %s", key.c_str());
    ut_assert(lua_obj, !lookup.classify(4, key), "Unknown color resolved to %s", key.c_str());
    ut_assert(lua_obj, !lookup.classify(5, key), "Index beyond palette resolved to %s", key.c_str());
    ut_assert(lua_obj, !lookup.classify(-1, key), "Negative index resolved to %s", key.c_str());
    ut_assert(lua_obj, !lookup.classify(100000, key), "Large index resolved to %s", key.c_str());

    // 4) Every legend color resolves to its own class
    std::vector<GdalRaster::rgba_t> legend;
    for(int i = 0; i < ClassTables::NUM_KG_COLORS; i++)
    {
        const GdalRaster::rgba_t c = {ClassTables::KG_COLORS[i].r, ClassTables::KG_COLORS[i].g, ClassTables::KG_COLORS[i].b, 255};
        legend.push_back(c);
    }
    const PaletteLookup full(ClassLookup::KG, legend, true);
    for(int i = 0; i < ClassTables::NUM_KG_COLORS; i++)
    {
        const bool found = full.classify(i, key);
        ut_assert(lua_obj, found && key == ClassTables::KG_COLORS[i].label, "Legend entry %d did not resolve to %s", i, ClassTables::KG_COLORS[i].label);
    }

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testTables
 *--------------------------------------------------------------------------------------*/
int UT_ClassLookup::testTables(lua_State* L)
{
    UT_ClassLookup* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_ClassLookup*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    class_key_t key;

    try
    {
        // 1) Direct codes with labels
        DirectLookup::code_list_t codes;
        codes.push_back(std::make_pair(1, class_key_t("A")));
        codes.push_back(std::make_pair(2, class_key_t("B")));
        const DirectLookup direct("test", codes, false);
        ut_assert(lua_obj, direct.columns().size() == 2, "Unexpected number of columns: %ld", (long)direct.columns().size());
        ut_assert(lua_obj, direct.classify(1, key) && key == "A", "Code 1 did not resolve to A");
        ut_assert(lua_obj, direct.classify(2, key) && key == "B", "Code 2 did not resolve to B");
        ut_assert(lua_obj, !direct.classify(0, key), "Zero resolved to %s", key.c_str());
        ut_assert(lua_obj, !direct.classify(3, key), "Unmapped code resolved to %s", key.c_str());
        ut_assert(lua_obj, !direct.classify(-1, key), "Masked sentinel resolved to %s", key.c_str());
        ut_assert(lua_obj, !direct.allTouched(), "Direct lookup should not include touched pixels");

        // 2) Duplicate codes are rejected
        bool caught = false;
        try
        {
            codes.push_back(std::make_pair(1, class_key_t("C")));
            const DirectLookup duplicate("test", codes, false);
        }
        catch(const RunTimeException& e)
        {
            caught = (e.code() == RTE_INVALID_CONFIG);
        }
        ut_assert(lua_obj, caught, "Duplicate code was accepted");

        // 3) Buckets
        std::vector<class_key_t> buckets;
        buckets.push_back("low");
        buckets.push_back("high");
        const BucketLookup bucket("test", buckets, true);
        ut_assert(lua_obj, bucket.classify(0, key) && key == "low", "Bucket 0 did not resolve to low");
        ut_assert(lua_obj, bucket.classify(1, key) && key == "high", "Bucket 1 did not resolve to high");
        ut_assert(lua_obj, !bucket.classify(2, key), "Bucket beyond list resolved to %s", key.c_str());
        ut_assert(lua_obj, !bucket.classify(BucketLookup::NO_DATA, key), "Bucket no-data resolved to %s", key.c_str());
        ut_assert(lua_obj, !bucket.classify(-1, key), "Negative bucket resolved to %s", key.c_str());

        // 4) Coded labels
        DirectLookup::code_list_t labels;
        labels.push_back(std::make_pair(7, class_key_t("Mangroves")));
        const CodedLookup coded("test", labels, true);
        ut_assert(lua_obj, coded.classify(7, key) && key == "Mangroves", "Code 7 did not resolve");
        ut_assert(lua_obj, !coded.classify(0, key), "Code 0 resolved to %s", key.c_str());
        ut_assert(lua_obj, !coded.classify(CodedLookup::NO_DATA, key), "Code 255 resolved to %s", key.c_str());
        ut_assert(lua_obj, !coded.classify(8, key), "Unmapped code resolved to %s", key.c_str());
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
 * testFactory
 *--------------------------------------------------------------------------------------*/
int UT_ClassLookup::testFactory(lua_State* L)
{
    UT_ClassLookup* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_ClassLookup*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    class_key_t key;
    const std::string kgFile = "/vsimem/ut_lookup_" + GeoLib::getUUID() + ".tif";

    try
    {
        // 1) ESA land cover
        ClassLookup* esa = ClassLookup::create(ClassLookup::ESA_LC, NULL);
        ut_assert(lua_obj, (int)esa->columns().size() == ClassTables::NUM_ESA_LCCS_CODES, "Unexpected ESA columns: %ld", (long)esa->columns().size());
        ut_assert(lua_obj, esa->columns().front() == "10", "Unexpected first ESA column: %s", esa->columns().front().c_str());
        ut_assert(lua_obj, esa->classify(10, key) && key == "10", "ESA 10 did not resolve");
        ut_assert(lua_obj, esa->classify(220, key) && key == "220", "ESA 220 did not resolve");
        ut_assert(lua_obj, !esa->classify(0, key), "ESA 0 resolved to %s", key.c_str());
        ut_assert(lua_obj, !esa->classify(15, key), "ESA 15 resolved to %s", key.c_str());
        ut_assert(lua_obj, esa->allTouched(), "ESA lookup should include touched pixels");
        delete esa;

        // 2) FAO land cover
        ClassLookup* fao = ClassLookup::create(ClassLookup::FAO_LC, NULL);
        ut_assert(lua_obj, (int)fao->columns().size() == ClassTables::NUM_FAO_LAND_COVERS, "Unexpected FAO columns: %ld", (long)fao->columns().size());
        ut_assert(lua_obj, fao->classify(2, key) && key == "Cropland", "FAO 2 did not resolve");
        ut_assert(lua_obj, fao->classify(6, key) && key == "Herbaceous vegetation, aquatic or regularly flooded", "FAO 6 did not resolve");
        ut_assert(lua_obj, !fao->classify(0, key), "FAO 0 resolved to %s", key.c_str());
        ut_assert(lua_obj, !fao->classify(255, key), "FAO 255 resolved to %s", key.c_str());
        ut_assert(lua_obj, !fao->classify(12, key), "FAO 12 resolved to %s", key.c_str());
        delete fao;

        // 3) Slope buckets
        ClassLookup* slope = ClassLookup::create(ClassLookup::SLOPE, NULL);
        ut_assert(lua_obj, (int)slope->columns().size() == ClassTables::NUM_GAEZ_SLOPES, "Unexpected slope columns: %ld", (long)slope->columns().size());
        ut_assert(lua_obj, slope->classify(0, key) && key == "0-0.5%", "Slope 0 did not resolve");
        ut_assert(lua_obj, slope->classify(7, key) && key == ">45%", "Slope 7 did not resolve");
        ut_assert(lua_obj, !slope->classify(8, key), "Slope 8 resolved to %s", key.c_str());
        ut_assert(lua_obj, !slope->classify(255, key), "Slope 255 resolved to %s", key.c_str());
        delete slope;

        // 4) Workability
        ClassLookup* wk = ClassLookup::create(ClassLookup::WORKABILITY, NULL);
        ut_assert(lua_obj, wk->columns().size() == 7, "Unexpected workability columns: %ld", (long)wk->columns().size());
        ut_assert(lua_obj, wk->classify(1, key) && key == "1", "Workability 1 did not resolve");
        ut_assert(lua_obj, wk->classify(7, key) && key == "7", "Workability 7 did not resolve");
        ut_assert(lua_obj, !wk->classify(0, key), "Workability 0 resolved to %s", key.c_str());
        ut_assert(lua_obj, !wk->classify(8, key), "Workability 8 resolved to %s", key.c_str());
        ut_assert(lua_obj, !wk->allTouched(), "Workability lookup should not include touched pixels");
        delete wk;

        // 5) Koppen-Geiger reads the color table of the raster
        const double gt[6] = {0.0, 1.0, 0.0, 1.0, 0.0, -1.0};
        const int32_t data[2] = {1, 3};
        const std::vector<GdalRaster::rgba_t> palette = testPaletteColors();
        GdalRaster::writeRaster(kgFile, GeoLib::GEOTIFF_DRIVER, 2, 1, gt, data, GDT_Byte, NULL, &palette);
        GdalRaster raster(kgFile);
        ClassLookup* kg = ClassLookup::create(ClassLookup::KG, &raster);
        ut_assert(lua_obj, kg->classify(1, key) && key == "Af", "KG 1 did not resolve to Af");
        ut_assert(lua_obj, kg->classify(3, key) && key == "ET", "KG 3 did not resolve to ET");
        ut_assert(lua_obj, !kg->classify(0, key), "KG 0 resolved to %s", key.c_str());
        delete kg;
        raster.close();
    }
    catch(const RunTimeException& e)
    {
        ut_assert(lua_obj, false, "Unexpected exception: %s", e.what());
    }

    // 6) Koppen-Geiger needs a raster and unknown types are rejected
    bool caught = false;
    try
    {
        ClassLookup* kg = ClassLookup::create(ClassLookup::KG, NULL);
        delete kg;
    }
    catch(const RunTimeException&)
    {
        caught = true;
    }
    ut_assert(lua_obj, caught, "KG lookup created without a raster");

    caught = false;
    try
    {
        ClassLookup* bogus = ClassLookup::create("bogus", NULL);
        delete bogus;
    }
    catch(const RunTimeException& e)
    {
        caught = (e.code() == RTE_INVALID_CONFIG);
    }
    ut_assert(lua_obj, caught, "Unknown lookup type was accepted");

    GeoLib::deleteDataset(kgFile, GeoLib::GEOTIFF_DRIVER);

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}

/*--------------------------------------------------------------------------------------
 * testRegionNames
 *--------------------------------------------------------------------------------------*/
int UT_ClassLookup::testRegionNames(lua_State* L)
{
    UT_ClassLookup* lua_obj = NULL;
    try
    {
        lua_obj = dynamic_cast<UT_ClassLookup*>(getLuaSelf(L, 1));
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to get lua parameters: %s", e.what());
        lua_pushboolean(L, false);
        return 1;
    }

    ut_initialize(lua_obj);

    RegionNames names;
    names.addAlias("United States of America", "United States");
    names.addAlias("Siachen Glacier", "");
    names.addExclusion("Antarctica");
    std::string canonical;

    // 1) Names without an entry are their own canonical name
    ut_assert(lua_obj, names.lookup("France", canonical) && canonical == "France", "Identity lookup failed: %s", canonical.c_str());

    // 2) Aliases
    ut_assert(lua_obj, names.lookup("United States of America", canonical) && canonical == "United States", "Alias lookup failed: %s", canonical.c_str());

    // 3) Exclusions, including aliases to nothing
    ut_assert(lua_obj, !names.lookup("Antarctica", canonical), "Excluded name resolved");
    ut_assert(lua_obj, !names.lookup("Siachen Glacier", canonical), "Empty alias resolved");
    ut_assert(lua_obj, names.numExclusions() == 2, "Unexpected number of exclusions: %d", names.numExclusions());

    // 4) Missing names
    ut_assert(lua_obj, !names.lookup(NULL, canonical), "Null name resolved");
    ut_assert(lua_obj, !names.lookup("", canonical), "Empty name resolved");

    // return success or failure
    lua_pushboolean(L, ut_status(lua_obj));
    return 1;
}
