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
 *INCLUDES
 ******************************************************************************/

#include "core.h"
#include "geo.h"
#include <gdal.h>
#include <cpl_conv.h>

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#define LUA_GEO_LIBNAME  "geo"

/******************************************************************************
 * GEO FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Local file configuration; all inputs are read from disk
 *----------------------------------------------------------------------------*/
static void configGDAL(void)
{
    /*
     * Prevents GDAL from listing the directory of every raster it opens.
     * Rasters read by this package carry no external sidecar files.
     */
    CPLSetConfigOption("GDAL_DISABLE_READDIR_ON_OPEN", "EMPTY_DIR");

    /*
     * Default GDAL block cache in Mb, overridden by the run configuration
     */
    CPLSetConfigOption("GDAL_CACHEMAX", "128");

    /*
     * GDAL Block Cache type: ARRAY or HASHSET. See:
     * https://gdal.org/development/rfc/rfc26_blockcache.html
     */
    CPLSetConfigOption("GDAL_BAND_BLOCK_CACHE", "HASHSET");
}

/*----------------------------------------------------------------------------
 * geo_gdalcache - geo.gdalcache(<megabytes>)
 *----------------------------------------------------------------------------*/
static int geo_gdalcache (lua_State* L)
{
    bool status = false;
    try
    {
        const long mb = LuaObject::getLuaInteger(L, 1);
        if(mb <= 0) throw RunTimeException(CRITICAL, RTE_ERROR, "invalid cache size: %ld", mb);
        const std::string value = StringLib::strfmt("%ld", mb);
        CPLSetConfigOption("GDAL_CACHEMAX", value.c_str());
        status = true;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error setting GDAL cache: %s", e.what());
    }

    lua_pushboolean(L, status);
    return 1;
}

/*----------------------------------------------------------------------------
 * geo_open
 *----------------------------------------------------------------------------*/
int geo_open (lua_State* L)
{
    static const struct luaL_Reg geo_functions[] = {
        {"gdalcache",   geo_gdalcache},
#ifdef __unittesting__
        {"ut_geolib",   UT_GeoLib::luaCreate},
#endif
        {NULL,          NULL}
    };

    /* Set Package Library */
    luaL_newlib(L, geo_functions);

    /* Set Globals */
    LuaEngine::setAttrStr   (L, "GTIFF",        GeoLib::GEOTIFF_DRIVER);
    LuaEngine::setAttrStr   (L, "SHAPEFILE",    GeoLib::SHAPEFILE_DRIVER);

    return 1;
}


/*----------------------------------------------------------------------------
 * Error handler called by GDAL lib on errors
 *
 *  Warps of regions that miss a raster report errors that are expected,
 *  callers decide what is fatal so GDAL messages only go to debug output
 *----------------------------------------------------------------------------*/
void GdalErrHandler(CPLErr eErrClass, int err_no, const char *msg)
{
    mlog(DEBUG, "GDAL %s %d: %s", eErrClass == CE_Warning ? "WARNING" : "ERROR", err_no, msg);
}

/******************************************************************************
 * EXPORTED FUNCTIONS
 ******************************************************************************/
extern "C" {
void initgeo (void)
{
    /* Register all gdal drivers */
    GDALAllRegister();

    /* Custom GDAL configuration for local rasters */
    configGDAL();

    /* Register GDAL custom error handler */
    void (*fptrGdalErrorHandler)(CPLErr, int, const char *) = GdalErrHandler;
    CPLSetErrorHandler(fptrGdalErrorHandler);

    /* Extend Lua */
    LuaEngine::extend(LUA_GEO_LIBNAME, geo_open);

    /* Indicate Presence of Package */
    LuaEngine::indicate(LUA_GEO_LIBNAME, LIBID);

    /* Display Status */
    mlog(INFO, "%s package initialized (%s)", LUA_GEO_LIBNAME, LIBID);
}

void deinitgeo (void)
{
    GDALDestroy();
}
}
