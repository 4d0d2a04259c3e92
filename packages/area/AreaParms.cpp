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

#include "AreaParms.h"
#include "ClassLookup.h"
#include "EventLib.h"
#include "StringLib.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* AreaParms::SELF                 = "parms";
const char* AreaParms::BOUNDARIES           = "boundaries";
const char* AreaParms::RESULTS              = "results";
const char* AreaParms::MASKS                = "masks";
const char* AreaParms::THREADS              = "threads";
const char* AreaParms::GDAL_CACHEMAX        = "gdal_cachemax";
const char* AreaParms::LOG_LEVEL            = "log_level";
const char* AreaParms::SKIP_SPARSE          = "skip_sparse";
const char* AreaParms::PRECISION            = "precision";
const char* AreaParms::INDEX_NAME           = "index_name";
const char* AreaParms::DATASETS             = "datasets";
const char* AreaParms::REGIONS              = "regions";
const char* AreaParms::ALIASES              = "aliases";
const char* AreaParms::EXCLUDE              = "exclude";
const char* AreaParms::RASTER               = "raster";
const char* AreaParms::OUTPUT               = "output";
const char* AreaParms::LOOKUP               = "lookup";
const char* AreaParms::METHOD               = "method";
const char* AreaParms::OPTIONAL             = "optional";
const char* AreaParms::CLIP_METHOD          = "clip";
const char* AreaParms::MASK_METHOD          = "mask";

const char* AreaParms::LAND_COVER_FLAG      = "lc";
const char* AreaParms::KOPPEN_GEIGER_FLAG   = "kg";
const char* AreaParms::SLOPE_FLAG           = "sl";
const char* AreaParms::WORKABILITY_FLAG     = "wk";
const char* AreaParms::DATASET_FLAGS[]      = {LAND_COVER_FLAG, KOPPEN_GEIGER_FLAG, SLOPE_FLAG, WORKABILITY_FLAG};

const char* AreaParms::OBJECT_TYPE          = "AreaParms";
const char* AreaParms::LUA_META_NAME        = "AreaParms";
const struct luaL_Reg AreaParms::LUA_META_TABLE[] = {
    {"numdatasets", luaNumDatasets},
    {NULL,          NULL}
};

const AreaParms::dataset_list_t AreaParms::emptyList;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * luaCreate - area.parms(<parameter table>)
 *----------------------------------------------------------------------------*/
int AreaParms::luaCreate (lua_State* L)
{
    try
    {
        /* Check if Lua Table */
        if(lua_type(L, 1) != LUA_TTABLE)
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "Area parameters must be supplied as a lua table");
        }

        /* Return Area Parameter Object */
        return createLuaObject(L, new AreaParms(L, 1));
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
AreaParms::AreaParms (lua_State* L, int index):
    LuaObject       (L, OBJECT_TYPE, LUA_META_NAME, LUA_META_TABLE),
    threads         (DEFAULT_THREADS),
    gdal_cachemax   (DEFAULT_GDAL_CACHEMAX),
    log_level       (INFO),
    skip_sparse     (true)
{
    /* Must be a Table */
    if(L == NULL || !lua_istable(L, index))
    {
        throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "configuration must be a table");
    }

    index = lua_absindex(L, index);
    bool field_provided = false;

    /* Boundaries */
    lua_getfield(L, index, BOUNDARIES);
    boundaries = LuaObject::getLuaString(L, -1, true, "data/ne_10m_admin_0_countries/ne_10m_admin_0_countries.shp", &field_provided);
    if(field_provided) mlog(DEBUG, "Setting %s to %s", BOUNDARIES, boundaries.c_str());
    lua_pop(L, 1);

    /* Results Directory */
    lua_getfield(L, index, RESULTS);
    results = LuaObject::getLuaString(L, -1, true, "results", &field_provided);
    if(field_provided) mlog(DEBUG, "Setting %s to %s", RESULTS, results.c_str());
    lua_pop(L, 1);

    /* Masks Directory */
    lua_getfield(L, index, MASKS);
    masks = LuaObject::getLuaString(L, -1, true, "masks", &field_provided);
    if(field_provided) mlog(DEBUG, "Setting %s to %s", MASKS, masks.c_str());
    lua_pop(L, 1);

    /* Threads */
    lua_getfield(L, index, THREADS);
    threads = (int)LuaObject::getLuaInteger(L, -1, true, threads, &field_provided);
    if(threads < 1) throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "invalid number of threads: %d", threads);
    if(field_provided) mlog(DEBUG, "Setting %s to %d", THREADS, threads);
    lua_pop(L, 1);

    /* GDAL Block Cache */
    lua_getfield(L, index, GDAL_CACHEMAX);
    gdal_cachemax = (int)LuaObject::getLuaInteger(L, -1, true, gdal_cachemax, &field_provided);
    if(gdal_cachemax <= 0) throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "invalid GDAL cache size: %d", gdal_cachemax);
    if(field_provided) mlog(DEBUG, "Setting %s to %d", GDAL_CACHEMAX, gdal_cachemax);
    lua_pop(L, 1);

    /* Log Level */
    lua_getfield(L, index, LOG_LEVEL);
    const char* lvl_str = LuaObject::getLuaString(L, -1, true, NULL);
    if(lvl_str)
    {
        log_level = EventLib::str2lvl(lvl_str);
        if(log_level == INVALID_EVENT_LEVEL) throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "invalid log level: %s", lvl_str);
        mlog(DEBUG, "Setting %s to %s", LOG_LEVEL, lvl_str);
    }
    lua_pop(L, 1);

    /* Skip Sparse Blocks */
    lua_getfield(L, index, SKIP_SPARSE);
    skip_sparse = LuaObject::getLuaBoolean(L, -1, true, skip_sparse, &field_provided);
    if(field_provided) mlog(DEBUG, "Setting %s to %d", SKIP_SPARSE, (int)skip_sparse);
    lua_pop(L, 1);

    /* Output Precision */
    lua_getfield(L, index, PRECISION);
    format.precision = (int)LuaObject::getLuaInteger(L, -1, true, format.precision, &field_provided);
    if(format.precision < 0 || format.precision > AreaWriter::MAX_PRECISION)
        throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "invalid precision: %d", format.precision);
    if(field_provided) mlog(DEBUG, "Setting %s to %d", PRECISION, format.precision);
    lua_pop(L, 1);

    /* Index Column Name */
    lua_getfield(L, index, INDEX_NAME);
    format.indexName = LuaObject::getLuaString(L, -1, true, format.indexName.c_str(), &field_provided);
    if(field_provided) mlog(DEBUG, "Setting %s to %s", INDEX_NAME, format.indexName.c_str());
    lua_pop(L, 1);

    /* Datasets */
    lua_getfield(L, index, DATASETS);
    getLuaDatasets(L, -1);
    lua_pop(L, 1);

    /* Region Names */
    lua_getfield(L, index, REGIONS);
    getLuaRegions(L, -1);
    lua_pop(L, 1);
}

/*----------------------------------------------------------------------------
 * getDatasets
 *----------------------------------------------------------------------------*/
const AreaParms::dataset_list_t& AreaParms::getDatasets(const char* flag) const
{
    const auto iter = datasets.find(flag);
    if(iter == datasets.end()) return emptyList;
    return iter->second;
}

/*----------------------------------------------------------------------------
 * isFlag
 *----------------------------------------------------------------------------*/
bool AreaParms::isFlag(const char* flag)
{
    for(int i = 0; i < NUM_DATASET_FLAGS; i++)
    {
        if(StringLib::match(flag, DATASET_FLAGS[i])) return true;
    }
    return false;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * getLuaDatasets
 *
 *  datasets = { <flag> = { {raster=, output=, lookup=, method=, optional=}, ... }, ... }
 *----------------------------------------------------------------------------*/
void AreaParms::getLuaDatasets(lua_State* L, int index)
{
    if(lua_isnil(L, index)) return;
    if(!lua_istable(L, index)) throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "%s must be a table", DATASETS);

    index = lua_absindex(L, index);

    lua_pushnil(L);
    while(lua_next(L, index) != 0)
    {
        /* key at -2, list at -1 */
        if(lua_type(L, -2) != LUA_TSTRING)
            throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "%s must be keyed by dataset flag", DATASETS);

        const std::string flag = lua_tostring(L, -2);
        if(!isFlag(flag.c_str()))
            throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "unknown dataset flag: %s", flag.c_str());

        if(!lua_istable(L, -1))
            throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "%s.%s must be a list", DATASETS, flag.c_str());

        dataset_list_t& list = datasets[flag];
        const int num_entries = lua_rawlen(L, -1);
        for(int i = 0; i < num_entries; i++)
        {
            lua_rawgeti(L, -1, i + 1);
            list.push_back(getLuaDataset(L, -1, flag.c_str(), i + 1));
            lua_pop(L, 1);
        }

        mlog(DEBUG, "Setting %s.%s to %d runs", DATASETS, flag.c_str(), num_entries);
        lua_pop(L, 1);
    }
}

/*----------------------------------------------------------------------------
 * getLuaRegions
 *
 *  regions = { aliases = { [<raw>] = <canonical>, ... }, exclude = { <raw>, ... } }
 *----------------------------------------------------------------------------*/
void AreaParms::getLuaRegions(lua_State* L, int index)
{
    if(lua_isnil(L, index)) return;
    if(!lua_istable(L, index)) throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "%s must be a table", REGIONS);

    index = lua_absindex(L, index);

    /* Aliases */
    lua_getfield(L, index, ALIASES);
    if(lua_istable(L, -1))
    {
        const int aliases_index = lua_gettop(L);
        lua_pushnil(L);
        while(lua_next(L, aliases_index) != 0)
        {
            if(lua_type(L, -2) != LUA_TSTRING || lua_type(L, -1) != LUA_TSTRING)
                throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "%s.%s must map names to names", REGIONS, ALIASES);

            names.addAlias(lua_tostring(L, -2), lua_tostring(L, -1));
            lua_pop(L, 1);
        }
    }
    else if(!lua_isnil(L, -1))
    {
        throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "%s.%s must be a table", REGIONS, ALIASES);
    }
    lua_pop(L, 1);

    /* Exclusions */
    lua_getfield(L, index, EXCLUDE);
    if(lua_istable(L, -1))
    {
        const int num_excluded = lua_rawlen(L, -1);
        for(int i = 0; i < num_excluded; i++)
        {
            lua_rawgeti(L, -1, i + 1);
            names.addExclusion(LuaObject::getLuaString(L, -1));
            lua_pop(L, 1);
        }
    }
    else if(!lua_isnil(L, -1))
    {
        throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "%s.%s must be a list", REGIONS, EXCLUDE);
    }
    lua_pop(L, 1);

    mlog(DEBUG, "Loaded %d region aliases and %d exclusions", names.numAliases(), names.numExclusions());
}

/*----------------------------------------------------------------------------
 * getLuaDataset
 *----------------------------------------------------------------------------*/
AreaParms::dataset_t AreaParms::getLuaDataset(lua_State* L, int index, const char* flag, int entry)
{
    if(!lua_istable(L, index))
        throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "%s.%s[%d] must be a table", DATASETS, flag, entry);

    dataset_t dataset;

    lua_getfield(L, index, RASTER);
    dataset.raster = LuaObject::getLuaString(L, -1);
    lua_pop(L, 1);

    lua_getfield(L, index, OUTPUT);
    dataset.output = LuaObject::getLuaString(L, -1);
    lua_pop(L, 1);

    lua_getfield(L, index, LOOKUP);
    dataset.lookup = LuaObject::getLuaString(L, -1);
    lua_pop(L, 1);

    const char* lookups[] = {ClassLookup::KG, ClassLookup::ESA_LC, ClassLookup::FAO_LC, ClassLookup::SLOPE, ClassLookup::WORKABILITY};
    bool known = false;
    for(const char* name: lookups)
    {
        if(dataset.lookup == name) known = true;
    }
    if(!known) throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "%s.%s[%d] has unknown lookup: %s", DATASETS, flag, entry, dataset.lookup.c_str());

    lua_getfield(L, index, METHOD);
    const char* method_str = LuaObject::getLuaString(L, -1, true, CLIP_METHOD);
    if(StringLib::match(method_str, CLIP_METHOD))       dataset.method = VECTOR_CLIP;
    else if(StringLib::match(method_str, MASK_METHOD))  dataset.method = MASK_BLOCK;
    else throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "%s.%s[%d] has unknown method: %s", DATASETS, flag, entry, method_str);
    lua_pop(L, 1);

    lua_getfield(L, index, OPTIONAL);
    dataset.optional = LuaObject::getLuaBoolean(L, -1, true, false);
    lua_pop(L, 1);

    return dataset;
}

/*----------------------------------------------------------------------------
 * luaNumDatasets - :numdatasets(<flag>)
 *----------------------------------------------------------------------------*/
int AreaParms::luaNumDatasets (lua_State* L)
{
    try
    {
        const AreaParms* lua_obj = dynamic_cast<AreaParms*>(getLuaSelf(L, 1));
        const char* flag = getLuaString(L, 2);
        if(!isFlag(flag)) throw RunTimeException(CRITICAL, RTE_ERROR, "unknown dataset flag: %s", flag);
        lua_pushinteger(L, lua_obj->getDatasets(flag).size());
        return 1;
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Error getting number of datasets: %s", e.what());
        return returnLuaStatus(L, false);
    }
}
